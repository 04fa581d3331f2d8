#include "chatbench/json_fields.hpp"

#include <climits>
#include <cstdint>

namespace chatbench {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::optional<std::uint32_t> parse_hex4(const std::string& text, std::size_t pos) {
  if (pos + 4 > text.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(text[i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<std::uint32_t>(digit);
  }
  return value;
}

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Decodes the \uXXXX escape whose 'u' sits at line[pos]. Returns the index of
// the last consumed character, or npos when the escape is malformed.
std::size_t decode_unicode_escape(const std::string& line, std::size_t pos, std::string& out) {
  const auto high = parse_hex4(line, pos + 1);
  if (!high.has_value()) {
    return std::string::npos;
  }
  std::size_t last = pos + 4;
  std::uint32_t cp = *high;
  if (cp >= 0xD800 && cp <= 0xDBFF && last + 2 < line.size() && line[last + 1] == '\\' &&
      line[last + 2] == 'u') {
    const auto low = parse_hex4(line, last + 3);
    if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
      cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
      last += 6;
    }
  }
  // A surrogate left unpaired has no UTF-8 encoding.
  if (cp >= 0xD800 && cp <= 0xDFFF) {
    cp = 0xFFFD;
  }
  append_utf8(out, cp);
  return last;
}

std::size_t find_value_start(const std::string& line, const std::string& key, bool quoted) {
  const std::string compact = "\"" + key + "\":" + (quoted ? "\"" : "");
  std::size_t pos = line.find(compact);
  if (pos != std::string::npos) {
    return pos + compact.size();
  }
  if (!quoted) {
    return std::string::npos;
  }
  const std::string spaced = "\"" + key + "\": \"";
  pos = line.find(spaced);
  if (pos != std::string::npos) {
    return pos + spaced.size();
  }
  return std::string::npos;
}

}  // namespace

std::optional<std::string> extract_json_string(const std::string& line, const std::string& key) {
  const std::size_t start = find_value_start(line, key, true);
  if (start == std::string::npos) {
    return std::nullopt;
  }

  std::string out;
  for (std::size_t i = start; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '"') {
      break;
    }
    if (c != '\\' || i + 1 >= line.size()) {
      out.push_back(c);
      continue;
    }

    const char next = line[i + 1];
    switch (next) {
      case '"':
        out.push_back('"');
        ++i;
        break;
      case '\\':
        out.push_back('\\');
        ++i;
        break;
      case '/':
        out.push_back('/');
        ++i;
        break;
      case 'n':
        out.push_back('\n');
        ++i;
        break;
      case 't':
        out.push_back('\t');
        ++i;
        break;
      case 'r':
        out.push_back('\r');
        ++i;
        break;
      case 'u': {
        const std::size_t last = decode_unicode_escape(line, i + 1, out);
        if (last == std::string::npos) {
          out.push_back(c);
        } else {
          i = last;
        }
        break;
      }
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

long long extract_json_long(const std::string& line, const std::string& key) {
  std::size_t pos = find_value_start(line, key, false);
  if (pos == std::string::npos) {
    return 0;
  }
  while (pos < line.size() && line[pos] == ' ') {
    ++pos;
  }

  long long value = 0;
  for (; pos < line.size(); ++pos) {
    const char c = line[pos];
    if (c < '0' || c > '9') {
      break;
    }
    const int digit = c - '0';
    if (value > (LLONG_MAX - digit) / 10) {
      return LLONG_MAX;
    }
    value = value * 10 + digit;
  }
  return value;
}

int extract_json_int(const std::string& line, const std::string& key) {
  const long long value = extract_json_long(line, key);
  return value > INT_MAX ? INT_MAX : static_cast<int>(value);
}

bool has_done_marker(const std::string& line) {
  return line.find("\"done\":true") != std::string::npos || line.find("\"done\": true") != std::string::npos;
}

std::string escape_json_string(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

}  // namespace chatbench
