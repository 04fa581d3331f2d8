#include "chatbench/types.hpp"

namespace chatbench {

std::string role_to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string& value) {
  if (value == "system") {
    return Role::System;
  }
  if (value == "assistant") {
    return Role::Assistant;
  }
  return Role::User;
}

std::string failure_kind_to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::Transport:
      return "transport";
    case FailureKind::Protocol:
      return "protocol";
    case FailureKind::StreamRead:
      return "stream-read";
  }
  return "transport";
}

std::string failure_marker(const InferenceFailure& failure) {
  if (failure.m_kind == FailureKind::Protocol) {
    std::string marker = "[HTTP " + std::to_string(failure.m_httpStatus) + "]";
    if (!failure.m_detail.empty()) {
      marker += " " + failure.m_detail;
    }
    return marker;
  }
  return "[ERROR] " + failure_kind_to_string(failure.m_kind) + ": " + failure.m_detail;
}

}  // namespace chatbench
