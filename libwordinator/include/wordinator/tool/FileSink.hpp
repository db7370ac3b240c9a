// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_TOOL_FILESINK_HPP
#define WORDINATOR_TOOL_FILESINK_HPP

#include "../runtime/Sink.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace wordinator {
namespace tool {

class SinkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Buffered wordlist file. The file is truncated on open; missing parent
// directories are created.
class FileSink : public runtime::Sink {
private:
  std::ofstream file_;
  runtime::StreamSink stream_;

  static std::ofstream open(const std::string& path) {
    std::filesystem::path parent = std::filesystem::absolute(std::filesystem::path(path)).parent_path();
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw SinkError(std::format("Failed to create output directory '{}': {}", parent.string(), ec.message()));
    }

    std::ofstream file(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file) {
      throw SinkError(std::format("Failed to open output file '{}': {}", path, std::strerror(errno)));
    }
    return file;
  }

public:
  explicit FileSink(const std::string& path)
      : file_(open(path)), stream_(file_) { }

  FileSink(const FileSink& other) = delete;
  FileSink& operator=(const FileSink& other) = delete;
  FileSink(FileSink&& other) = delete;
  FileSink& operator=(FileSink&& other) = delete;
  ~FileSink() override = default;

  void write(std::string_view line) override {
    stream_.write(line);
  }

  void flush() override {
    stream_.flush();
  }
};

} // namespace tool
} // namespace wordinator

#endif // WORDINATOR_TOOL_FILESINK_HPP
