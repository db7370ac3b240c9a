// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_TOOL_GENERATECOMMAND_HPP
#define WORDINATOR_TOOL_GENERATECOMMAND_HPP

#include "../runtime/Config.hpp"
#include "../runtime/Sink.hpp"
#include "../util/print.hpp"
#include "FileSink.hpp"
#include "GeneratorTool.hpp"
#include "JsonConfigLoader.hpp"

#include <cxxopts.hpp>

#include <cstddef>
#include <ios>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace wordinator {
namespace tool {

// Settings of one wordinator-generate invocation, with the command line
// layered over the optional JSON config file.
struct GenerateSettings {
  runtime::Config config;
  std::string output;
  bool count{false};
  bool quiet{false};
};

inline cxxopts::Options generate_options(const std::string& program) {
  cxxopts::Options options(program, "Wordinator: Generate wordlists");
  options.positional_help("MIN MAX CHARSET");
  options.add_options()
    ("min",
     "minimum length of generated words",
     cxxopts::value<std::size_t>(),
     "MIN")
    ("max",
     "maximum length of generated words",
     cxxopts::value<std::size_t>(),
     "MAX")
    ("charset",
     "characters to use in generation (each at most once)",
     cxxopts::value<std::string>(),
     "CHARSET")
    ("t,template",
     "template for generation ('@' for a charset character, '%' for a digit, anything else is literal); overrides MIN and MAX",
     cxxopts::value<std::string>(),
     "PATTERN")
    ("o,output",
     "output file name (default: stdout)",
     cxxopts::value<std::string>(),
     "FILE")
    ("no-duplicates",
     "avoid consecutive duplicate characters (except digits)",
     cxxopts::value<bool>()->default_value("false"))
    ("c,config",
     "JSON file with min_len, max_len, charset, template, output and no_duplicates; command-line values take precedence",
     cxxopts::value<std::string>(),
     "FILE")
    ("count",
     "print the number of words and the size estimate, then exit without generating",
     cxxopts::value<bool>()->default_value("false"))
    ("q,quiet",
     "do not print the size estimate and progress",
     cxxopts::value<bool>()->default_value("false"))
    ("version", "print version and exit")
    ("help", "print help and exit")
    ;
  options.parse_positional({"min", "max", "charset"});
  return options;
}

inline GenerateSettings resolve_settings(const cxxopts::ParseResult& args) {
  GenerateSettings settings;
  runtime::Config& config = settings.config;

  if (args.count("config")) {
    JsonConfigLoader().load(args["config"].as<std::string>(), config, settings.output);
  }

  if (args.count("min")) {
    config.min_len = args["min"].as<std::size_t>();
  }
  if (args.count("max")) {
    config.max_len = args["max"].as<std::size_t>();
  }
  if (args.count("charset")) {
    config.charset = args["charset"].as<std::string>();
  }
  if (args.count("template")) {
    config.tmpl = args["template"].as<std::string>();
  }
  if (args.count("output")) {
    settings.output = args["output"].as<std::string>();
  }
  // The flag can only switch suppression on; the config file may have done so already.
  if (args["no-duplicates"].as<bool>()) {
    config.no_duplicates = true;
  }
  settings.count = args["count"].as<bool>();
  settings.quiet = args["quiet"].as<bool>();

  if (config.charset.empty()) {
    throw cxxopts::exceptions::parsing("Missing CHARSET argument");
  }
  if (!config.tmpl && (config.min_len == 0 || config.max_len == 0)) {
    throw cxxopts::exceptions::parsing("Missing MIN or MAX argument (or a template)");
  }
  return settings;
}

/*
 * Entry point of wordinator-generate. Words go to the output file or to
 * `out`; the estimate, progress and error messages go to `err`. Returns the
 * process exit code: 0 on success, 1 for option and configuration errors,
 * 2 when the output cannot be written.
 */
inline int generate_main(int argc, const char* const* argv, std::string_view version,
                         std::ostream& out = std::cout, std::ostream& err = std::cerr) {
  try {
    cxxopts::Options options = generate_options(argv[0]);
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      util::printf_to(out, "{}", options.help());
      return 0;
    }
    if (args.count("version")) {
      util::printf_to(out, "{} {}", argv[0], version);
      return 0;
    }

    GenerateSettings settings = resolve_settings(args);
    GeneratorTool generator(settings.config, settings.quiet, err);

    if (settings.count) {
      generator.print_estimate();
      util::printf_to(out, "{}", generator.total());
      return 0;
    }

    std::unique_ptr<runtime::Sink> sink;
    if (!settings.output.empty()) {
      sink = std::make_unique<FileSink>(settings.output);
    } else {
      sink = std::make_unique<runtime::StreamSink>(out);
    }
    generator.run(*sink);
  } catch (const cxxopts::exceptions::exception &e) {
    util::printf_to(err, "error parsing options: {}", e.what());
    return 1;
  } catch (const runtime::ConfigError &e) {
    util::printf_to(err, "error: {}", e.what());
    return 1;
  } catch (const SinkError &e) {
    util::printf_to(err, "error: {}", e.what());
    return 2;
  } catch (const std::ios_base::failure &e) {
    util::printf_to(err, "error writing output: {}", e.what());
    return 2;
  }
  return 0;
}

} // namespace tool
} // namespace wordinator

#endif // WORDINATOR_TOOL_GENERATECOMMAND_HPP
