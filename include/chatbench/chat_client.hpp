#pragma once

#include <memory>
#include <string>
#include <vector>

#include "chatbench/config.hpp"
#include "chatbench/types.hpp"

namespace chatbench {

class IChatClient {
 public:
  virtual ~IChatClient() = default;
  // Blocks until the terminal chunk, stream end, or failure. Failures are
  // returned, never thrown.
  virtual InferenceOutcome send(const std::vector<Message>& messages, StreamCallback on_token) = 0;
};

// Streaming client for Ollama's POST <base_url>/api/chat.
std::unique_ptr<IChatClient> make_ollama_client(const ClientConfig& config);

std::string build_chat_request_body(const ClientConfig& config, const std::vector<Message>& messages);

struct HealthReport {
  bool m_reachable{false};
  bool m_modelAvailable{false};
  std::string m_matchedModel;
  std::vector<std::string> m_models;
  std::string m_detail;
};

// Queries GET <base_url>/api/tags and looks for the configured model, by
// exact name or by name without its ":tag" suffix.
HealthReport check_server_health(const ClientConfig& config);

}  // namespace chatbench
