#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chatbench/types.hpp"

namespace chatbench {

enum class TrimPolicy {
  // Drop single messages from the front; a user/assistant pair may be split.
  OldestMessage,
  // Drop messages two at a time so retained turns stay paired.
  OldestPair,
};

std::string trim_policy_to_string(TrimPolicy policy);
TrimPolicy trim_policy_from_string(const std::string& value);

// Bounded multi-turn history. Holds at most 2 * max_turns messages; the
// system prompt is never stored and is only added by build_request_payload.
class Conversation {
 public:
  explicit Conversation(std::size_t max_turns, TrimPolicy policy = TrimPolicy::OldestMessage);

  void append_user(std::string text);
  void append_assistant(std::string text);
  std::vector<Message> build_request_payload(const std::string& system_prompt) const;
  void reset();
  // Removes the most recently appended message (the user turn whose request
  // failed) and restores anything its append evicted. Returns false when empty.
  bool rollback_last_user_turn();

  const std::vector<Message>& messages() const { return messages_; }
  std::size_t size() const { return messages_.size(); }
  std::size_t turn_count() const { return messages_.size() / 2; }
  std::size_t max_messages() const { return max_turns_ * 2; }

 private:
  void append(Role role, std::string text);
  void trim();

  std::size_t max_turns_;
  TrimPolicy policy_;
  std::vector<Message> messages_;
  // Messages the most recent append pushed out, oldest first; a rollback
  // puts them back so the history returns to its exact prior state.
  std::vector<Message> evicted_by_last_append_;
};

}  // namespace chatbench
