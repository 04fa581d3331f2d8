#include "chatbench/response_assembler.hpp"

#include <algorithm>
#include <climits>
#include <type_traits>
#include <variant>

#include "chatbench/chunk_decoder.hpp"

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

double elapsed_ms(ResponseAssembler::Clock::time_point from, ResponseAssembler::Clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(to - from).count();
}

}  // namespace

double tokens_per_second(long long eval_count, long long eval_duration_ns) {
  if (eval_count <= 0 || eval_duration_ns <= 0) {
    return 0.0;
  }
  return static_cast<double>(eval_count) / (static_cast<double>(eval_duration_ns) / 1.0e9);
}

ResponseAssembler::ResponseAssembler(Clock::time_point start, StreamCallback on_token)
    : m_start(start), m_onToken(std::move(on_token)) {}

bool ResponseAssembler::feed(const char* data, std::size_t size, Clock::time_point now) {
  if (m_done) {
    return false;
  }
  m_bytesReceived += size;
  m_pending.append(data, size);

  std::size_t newline = 0;
  while (!m_done && (newline = m_pending.find('\n')) != std::string::npos) {
    std::string line = m_pending.substr(0, newline);
    m_pending.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    handle_line(line, now);
  }
  return !m_done;
}

void ResponseAssembler::finish(Clock::time_point now) {
  if (!m_done && !m_pending.empty()) {
    const std::string tail = m_pending;
    m_pending.clear();
    handle_line(tail, now);
  }
  if (!m_end.has_value()) {
    m_end = now;
  }
}

void ResponseAssembler::handle_line(const std::string& line, Clock::time_point now) {
  const Chunk chunk = decode_chunk(line);
  std::visit(
      [&](const auto& decoded) {
        using T = std::decay_t<decltype(decoded)>;
        if constexpr (std::is_same_v<T, ContentDelta>) {
          append_content(decoded.m_text, now);
        } else if constexpr (std::is_same_v<T, DoneChunk>) {
          append_content(decoded.m_text, now);
          m_evalCount = decoded.m_evalCount;
          m_evalDurationNs = decoded.m_evalDurationNs;
          m_done = true;
          m_end = now;
        }
      },
      chunk);
}

void ResponseAssembler::append_content(const std::string& text, Clock::time_point now) {
  if (text.empty()) {
    return;
  }
  if (!m_firstToken.has_value()) {
    m_firstToken = now;
  }
  m_text += text;
  if (m_onToken) {
    m_onToken(text);
  }
}

InferenceResult ResponseAssembler::result() const {
  const double totalMs = elapsed_ms(m_start, m_end.value_or(m_start));
  const double firstTokenMs =
      m_firstToken.has_value() ? std::min(elapsed_ms(m_start, *m_firstToken), totalMs) : totalMs;
  const int evalTokens = m_evalCount > INT_MAX ? INT_MAX : static_cast<int>(m_evalCount);
  return {.m_text = trim(m_text),
          .m_firstTokenMs = firstTokenMs,
          .m_totalMs = totalMs,
          .m_evalTokenCount = evalTokens,
          .m_tokensPerSecond = tokens_per_second(m_evalCount, m_evalDurationNs)};
}

}  // namespace chatbench
