#include "chatbench/conversation.hpp"

#include <cstddef>
#include <stdexcept>

namespace chatbench {

std::string trim_policy_to_string(TrimPolicy policy) {
  switch (policy) {
    case TrimPolicy::OldestMessage:
      return "messages";
    case TrimPolicy::OldestPair:
      return "pairs";
  }
  return "messages";
}

TrimPolicy trim_policy_from_string(const std::string& value) {
  if (value == "messages") {
    return TrimPolicy::OldestMessage;
  }
  if (value == "pairs") {
    return TrimPolicy::OldestPair;
  }
  throw std::runtime_error("unknown history_trim policy: " + value + " (use messages|pairs)");
}

Conversation::Conversation(std::size_t max_turns, TrimPolicy policy) : max_turns_(max_turns), policy_(policy) {}

void Conversation::append_user(std::string text) { append(Role::User, std::move(text)); }

void Conversation::append_assistant(std::string text) { append(Role::Assistant, std::move(text)); }

std::vector<Message> Conversation::build_request_payload(const std::string& system_prompt) const {
  std::vector<Message> payload;
  payload.reserve(messages_.size() + 1);
  payload.push_back({Role::System, system_prompt});
  payload.insert(payload.end(), messages_.begin(), messages_.end());
  return payload;
}

void Conversation::reset() {
  messages_.clear();
  evicted_by_last_append_.clear();
}

bool Conversation::rollback_last_user_turn() {
  if (messages_.empty()) {
    return false;
  }
  messages_.pop_back();
  messages_.insert(messages_.begin(), evicted_by_last_append_.begin(), evicted_by_last_append_.end());
  evicted_by_last_append_.clear();
  return true;
}

void Conversation::append(Role role, std::string text) {
  evicted_by_last_append_.clear();
  messages_.push_back({role, std::move(text)});
  trim();
}

void Conversation::trim() {
  const std::size_t bound = max_messages();
  while (messages_.size() > bound) {
    const std::size_t drop = (policy_ == TrimPolicy::OldestPair && messages_.size() >= 2) ? 2 : 1;
    evicted_by_last_append_.insert(evicted_by_last_append_.end(), messages_.begin(),
                                   messages_.begin() + static_cast<std::ptrdiff_t>(drop));
    messages_.erase(messages_.begin(), messages_.begin() + static_cast<std::ptrdiff_t>(drop));
  }
}

}  // namespace chatbench
