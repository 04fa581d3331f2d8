#pragma once

#include <string>
#include <variant>

namespace chatbench {

struct ContentDelta {
  std::string m_text;
};

// Terminal chunk. It may still carry a final content fragment.
struct DoneChunk {
  std::string m_text;
  long long m_evalCount{0};
  long long m_evalDurationNs{0};
};

struct UnknownChunk {};

using Chunk = std::variant<ContentDelta, DoneChunk, UnknownChunk>;

// Decodes one NDJSON line of an /api/chat stream. Never throws: lines that
// are not valid JSON go through the literal field scanners instead.
Chunk decode_chunk(const std::string& line);

}  // namespace chatbench
