#pragma once

#include <optional>
#include <string>

namespace chatbench {

// Literal-search field scanners for single-line JSON objects. There is no
// notion of nesting depth: the first occurrence of "key": wins, wherever it
// sits in the line.

std::optional<std::string> extract_json_string(const std::string& line, const std::string& key);
long long extract_json_long(const std::string& line, const std::string& key);
int extract_json_int(const std::string& line, const std::string& key);

// True when the line carries "done":true, with or without a space after the colon.
bool has_done_marker(const std::string& line);

// Inverse of extract_json_string for the escapes it understands.
std::string escape_json_string(const std::string& value);

}  // namespace chatbench
