// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_TOOL_JSONCONFIGLOADER_HPP
#define WORDINATOR_TOOL_JSONCONFIGLOADER_HPP

#include "../runtime/Config.hpp"
#include "../util/log.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <fstream>
#include <string>

namespace wordinator {
namespace tool {

/*
 * Reads generation settings from a JSON object such as
 *
 *   {"min_len": 4, "max_len": 6, "charset": "abc123",
 *    "template": null, "output": "words.txt", "no_duplicates": true}
 *
 * Only the keys present are applied, so command-line values can be layered
 * on top afterwards. Unknown keys are ignored with a warning.
 */
class JsonConfigLoader {
public:
  JsonConfigLoader() = default;
  JsonConfigLoader(const JsonConfigLoader& other) = delete;
  JsonConfigLoader& operator=(const JsonConfigLoader& other) = delete;
  JsonConfigLoader(JsonConfigLoader&& other) = delete;
  JsonConfigLoader& operator=(JsonConfigLoader&& other) = delete;

  void load(const std::string& fn, runtime::Config& config, std::string& output) const {
    std::ifstream cf(fn);
    if (!cf) {
      throw runtime::ConfigError(std::format("Failed to open the config JSON file for reading: {}", fn));
    }

    nlohmann::json data = nlohmann::json::parse(cf, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
      throw runtime::ConfigError(std::format("Invalid JSON in config file: {}", fn));
    }

    apply(data, config, output);
  }

  void apply(const nlohmann::json& data, runtime::Config& config, std::string& output) const {
    for (auto& [key, value] : data.items()) {
      if (key == "min_len") {
        config.min_len = length(key, value);
      } else if (key == "max_len") {
        config.max_len = length(key, value);
      } else if (key == "charset") {
        config.charset = text(key, value);
      } else if (key == "template") {
        if (value.is_null()) {
          config.tmpl.reset();
        } else {
          config.tmpl = text(key, value);
        }
      } else if (key == "output") {
        output = text(key, value);
      } else if (key == "no_duplicates") {
        if (!value.is_boolean()) {
          throw runtime::ConfigError(std::format("Config key '{}' must be a boolean", key));
        }
        config.no_duplicates = value.get<bool>();
      } else {
        WORDINATOR_LOG_WARN("Ignoring unknown config key '{}'.", key);
      }
    }
  }

private:
  static std::size_t length(const std::string& key, const nlohmann::json& value) {
    bool non_negative = value.is_number_unsigned() || (value.is_number_integer() && value.get<std::int64_t>() >= 0);
    if (!non_negative) {
      throw runtime::ConfigError(std::format("Config key '{}' must be a non-negative integer", key));
    }
    return value.get<std::size_t>();
  }

  static std::string text(const std::string& key, const nlohmann::json& value) {
    if (!value.is_string()) {
      throw runtime::ConfigError(std::format("Config key '{}' must be a string", key));
    }
    return value.get<std::string>();
  }
};

} // namespace tool
} // namespace wordinator

#endif // WORDINATOR_TOOL_JSONCONFIGLOADER_HPP
