#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "chatbench/chat_client.hpp"
#include "chatbench/conversation.hpp"

namespace chatbench {

struct ReplOptions {
  std::string m_systemPrompt;
  std::string m_assistantName{"Sota"};
  std::string m_model;
  std::string m_target;
};

class Repl {
 public:
  Repl(IChatClient& client, Conversation& conversation, ReplOptions options, std::istream& in, std::ostream& out);

  // Returns when the operator types quit or input ends.
  int run();

 private:
  void exchange(const std::string& input);

  IChatClient& m_client;
  Conversation& m_conversation;
  ReplOptions m_options;
  std::istream& m_in;
  std::ostream& m_out;
};

}  // namespace chatbench
