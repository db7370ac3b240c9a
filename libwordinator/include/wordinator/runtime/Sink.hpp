// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_SINK_HPP
#define WORDINATOR_RUNTIME_SINK_HPP

#include <ios>
#include <ostream>
#include <string_view>

namespace wordinator {
namespace runtime {

// Line-oriented output. A failing write must throw; the generator does not
// retry or skip.
class Sink {
public:
  Sink() = default;
  Sink(const Sink& other) = delete;
  Sink& operator=(const Sink& other) = delete;
  Sink(Sink&& other) = delete;
  Sink& operator=(Sink&& other) = delete;
  virtual ~Sink() = default;

  virtual void write(std::string_view line) = 0;
  virtual void flush() {}
};

// Writes to a borrowed stream with exceptions enabled, so a full device or
// a closed pipe surfaces as std::ios_base::failure.
class StreamSink : public Sink {
private:
  std::ostream& out_;

public:
  explicit StreamSink(std::ostream& out) : out_(out) {
    out_.exceptions(std::ios::badbit | std::ios::failbit);
  }

  ~StreamSink() override = default;

  void write(std::string_view line) override {
    out_.write(line.data(), line.size());
    out_.put('\n');
  }

  void flush() override {
    out_.flush();
  }
};

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_SINK_HPP
