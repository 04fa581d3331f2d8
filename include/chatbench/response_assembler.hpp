#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "chatbench/types.hpp"

namespace chatbench {

// Incremental reader for a newline-delimited /api/chat response body.
// Bytes arrive in arbitrary pieces; complete lines are decoded as they
// appear, and reading ends at the first terminal chunk.
class ResponseAssembler {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ResponseAssembler(Clock::time_point start, StreamCallback on_token = {});

  // Returns false once the terminal chunk has been consumed; bytes fed after
  // that point are ignored.
  bool feed(const char* data, std::size_t size, Clock::time_point now);
  // Decodes a trailing line left without a newline and stamps the end time
  // if no terminal chunk was seen.
  void finish(Clock::time_point now);

  bool done() const { return m_done; }
  std::size_t bytes_received() const { return m_bytesReceived; }
  InferenceResult result() const;

 private:
  void handle_line(const std::string& line, Clock::time_point now);
  void append_content(const std::string& text, Clock::time_point now);

  Clock::time_point m_start;
  StreamCallback m_onToken;
  std::string m_pending;
  std::string m_text;
  std::optional<Clock::time_point> m_firstToken;
  std::optional<Clock::time_point> m_end;
  std::size_t m_bytesReceived{0};
  long long m_evalCount{0};
  long long m_evalDurationNs{0};
  bool m_done{false};
};

// eval_count / (eval_duration_ns / 1e9) when both are positive, else 0.
double tokens_per_second(long long eval_count, long long eval_duration_ns);

}  // namespace chatbench
