#pragma once

#include <cstddef>
#include <string>

#include "chatbench/conversation.hpp"

namespace chatbench {

struct ClientConfig {
  std::string base_url{"http://localhost:11434"};
  std::string model{"llama3.2:3b"};
  int num_predict{60};
  long connect_timeout_ms{120000};
  long read_timeout_ms{120000};
  bool verbose{false};
};

struct AppConfig {
  ClientConfig client;
  std::size_t max_history_turns{10};
  TrimPolicy history_trim{TrimPolicy::OldestMessage};
  std::string system_prompt{
      "You are Sota, a small humanoid robot in an HRI compliance study. "
      "Keep all responses under 2 sentences. Be natural and concise."};
  std::string system_prompt_file{""};
  std::string assistant_name{"Sota"};
  std::string warmup_prompt{"Hello."};
  std::string prompts_file{""};
  std::string log_file{"results/latency_log.txt"};

  static AppConfig load_from_file(const std::string& path);

  // system_prompt_file contents when set, otherwise system_prompt.
  std::string resolve_system_prompt() const;
};

}  // namespace chatbench
