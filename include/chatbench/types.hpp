#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace chatbench {

using StreamCallback = std::function<void(const std::string&)>;

enum class Role {
  System,
  User,
  Assistant,
};

std::string role_to_string(Role role);
Role role_from_string(const std::string& value);

struct Message {
  Role m_role;
  std::string m_content;
};

struct InferenceResult {
  std::string m_text;
  double m_firstTokenMs{0.0};
  double m_totalMs{0.0};
  int m_evalTokenCount{0};
  double m_tokensPerSecond{0.0};
};

enum class FailureKind {
  Transport,
  Protocol,
  StreamRead,
};

std::string failure_kind_to_string(FailureKind kind);

struct InferenceFailure {
  FailureKind m_kind{FailureKind::Transport};
  std::string m_detail;
  double m_elapsedMs{0.0};
  long m_httpStatus{0};
};

// Display form of a failure: "[HTTP 500] ..." for protocol errors,
// "[ERROR] ..." otherwise.
std::string failure_marker(const InferenceFailure& failure);

using InferenceOutcome = std::variant<InferenceResult, InferenceFailure>;

inline bool is_failure(const InferenceOutcome& outcome) {
  return std::holds_alternative<InferenceFailure>(outcome);
}

}  // namespace chatbench
