#include "chatbench/config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace chatbench {
namespace {

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

bool parse_bool(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

long parse_long(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const long parsed = std::stol(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error("invalid numeric value for " + key + ": '" + value + "'");
  }
}

long parse_positive(const std::string& key, const std::string& value) {
  const long parsed = parse_long(key, value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be positive, got " + value);
  }
  return parsed;
}

}  // namespace

AppConfig AppConfig::load_from_file(const std::string& path) {
  AppConfig config;

  std::ifstream in(path);
  if (!in.is_open()) {
    return config;
  }

  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));

    if (key == "base_url") {
      config.client.base_url = value;
    } else if (key == "model") {
      config.client.model = value;
    } else if (key == "num_predict") {
      config.client.num_predict = static_cast<int>(parse_positive(key, value));
    } else if (key == "connect_timeout_ms") {
      config.client.connect_timeout_ms = parse_positive(key, value);
    } else if (key == "read_timeout_ms") {
      config.client.read_timeout_ms = parse_positive(key, value);
    } else if (key == "verbose") {
      config.client.verbose = parse_bool(value);
    } else if (key == "max_history_turns") {
      config.max_history_turns = static_cast<std::size_t>(parse_positive(key, value));
    } else if (key == "history_trim") {
      config.history_trim = trim_policy_from_string(value);
    } else if (key == "system_prompt") {
      config.system_prompt = value;
    } else if (key == "system_prompt_file") {
      config.system_prompt_file = value;
    } else if (key == "assistant_name") {
      config.assistant_name = value;
    } else if (key == "warmup_prompt") {
      config.warmup_prompt = value;
    } else if (key == "prompts_file") {
      config.prompts_file = value;
    } else if (key == "log_file") {
      config.log_file = value;
    }
  }

  return config;
}

std::string AppConfig::resolve_system_prompt() const {
  if (system_prompt_file.empty()) {
    return system_prompt;
  }

  std::ifstream in(system_prompt_file);
  if (!in.is_open()) {
    std::cerr << "warning: system prompt file not found: " << system_prompt_file
              << " (using built-in prompt)\n";
    return system_prompt;
  }
  std::ostringstream collected;
  collected << in.rdbuf();
  const std::string prompt = trim(collected.str());
  return prompt.empty() ? system_prompt : prompt;
}

}  // namespace chatbench
