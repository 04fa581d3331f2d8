#include "chatbench/chunk_decoder.hpp"

#include <nlohmann/json.hpp>

#include "chatbench/json_fields.hpp"

namespace chatbench {
namespace {

using json = nlohmann::json;

std::string content_of(const json& chunk) {
  const auto message = chunk.find("message");
  if (message != chunk.end() && message->is_object()) {
    const auto content = message->find("content");
    if (content != message->end() && content->is_string()) {
      return content->get<std::string>();
    }
  }
  const auto content = chunk.find("content");
  if (content != chunk.end() && content->is_string()) {
    return content->get<std::string>();
  }
  return "";
}

long long count_of(const json& chunk, const char* key) {
  const auto it = chunk.find(key);
  if (it == chunk.end()) {
    return 0;
  }
  if (it->is_number_unsigned() || it->is_number_integer()) {
    return it->get<long long>();
  }
  if (it->is_number_float()) {
    return static_cast<long long>(it->get<double>());
  }
  return 0;
}

Chunk decode_structured(const json& chunk) {
  const auto done = chunk.find("done");
  const bool terminal = done != chunk.end() && done->is_boolean() && done->get<bool>();
  if (terminal) {
    return DoneChunk{content_of(chunk), count_of(chunk, "eval_count"), count_of(chunk, "eval_duration")};
  }
  std::string text = content_of(chunk);
  if (text.empty()) {
    return UnknownChunk{};
  }
  return ContentDelta{std::move(text)};
}

Chunk decode_lenient(const std::string& line) {
  std::string text = extract_json_string(line, "content").value_or("");
  if (has_done_marker(line)) {
    return DoneChunk{std::move(text), extract_json_long(line, "eval_count"),
                     extract_json_long(line, "eval_duration")};
  }
  if (text.empty()) {
    return UnknownChunk{};
  }
  return ContentDelta{std::move(text)};
}

}  // namespace

Chunk decode_chunk(const std::string& line) {
  if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
    return UnknownChunk{};
  }

  const json chunk = json::parse(line, nullptr, false);
  if (chunk.is_discarded()) {
    return decode_lenient(line);
  }
  if (!chunk.is_object()) {
    return UnknownChunk{};
  }
  return decode_structured(chunk);
}

}  // namespace chatbench
