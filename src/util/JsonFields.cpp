// Repository: Clipper
// Component: JSON Field Extraction Implementation
// Copyright (c) 2026 Clipper

#include "clipper/util/JsonFields.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <regex>

namespace clipper::util::json {

namespace {

// Position just past `"field"\s*:\s*`, or npos.
size_t FindValue(const std::string& json, const std::string& field) {
  // Field names are plain identifiers; no regex escaping needed.
  std::regex pattern("\"" + field + "\"\\s*:\\s*");
  std::smatch match;
  if (!std::regex_search(json, match, pattern)) return std::string::npos;
  return static_cast<size_t>(match.position() + match.length());
}

// Four hex digits at json[pos..pos+3].
bool ReadHex4(const std::string& json, size_t pos, uint32_t& out) {
  if (pos + 4 > json.size()) return false;
  out = 0;
  for (size_t i = pos; i < pos + 4; ++i) {
    const char c = json[i];
    out <<= 4;
    if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
    else return false;
  }
  return true;
}

void AppendUtf8(uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Decodes the \uXXXX escape whose 'u' is at json[i], joining a following
// low surrogate. Unpaired surrogates become U+FFFD. Leaves i on the last
// consumed character.
bool DecodeUnicodeEscape(const std::string& json, size_t& i, std::string& out) {
  uint32_t cp = 0;
  if (!ReadHex4(json, i + 1, cp)) return false;
  i += 4;
  if (cp >= 0xD800 && cp <= 0xDBFF) {
    uint32_t low = 0;
    if (i + 2 < json.size() && json[i + 1] == '\\' && json[i + 2] == 'u' &&
        ReadHex4(json, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      i += 6;
    } else {
      cp = 0xFFFD;
    }
  } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
    cp = 0xFFFD;
  }
  AppendUtf8(cp, out);
  return true;
}

// Parses a string literal starting at json[pos] == '"'. Advances pos past it.
bool ParseStringAt(const std::string& json, size_t& pos, std::string& out) {
  if (pos >= json.size() || json[pos] != '"') return false;
  std::string value;
  for (size_t i = pos + 1; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      out = std::move(value);
      pos = i + 1;
      return true;
    }
    if (c == '\\' && i + 1 < json.size()) {
      char e = json[++i];
      switch (e) {
        case 'n': value += '\n'; break;
        case 'r': value += '\r'; break;
        case 't': value += '\t'; break;
        case 'b': value += '\b'; break;
        case 'f': value += '\f'; break;
        case 'u':
          if (!DecodeUnicodeEscape(json, i, value)) return false;
          break;
        default: value += e; break;
      }
      continue;
    }
    value += c;
  }
  return false;
}

// Span of a balanced {...} or [...] starting at json[pos]; string-aware.
bool MatchBalanced(const std::string& json, size_t pos, size_t& end) {
  if (pos >= json.size()) return false;
  const char open = json[pos];
  const char close = open == '{' ? '}' : open == '[' ? ']' : '\0';
  if (close == '\0') return false;
  int depth = 0;
  for (size_t i = pos; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      size_t p = i;
      std::string ignored;
      if (!ParseStringAt(json, p, ignored)) return false;
      i = p - 1;
      continue;
    }
    if (c == open) ++depth;
    else if (c == close && --depth == 0) {
      end = i + 1;
      return true;
    }
  }
  return false;
}

void SkipSpace(const std::string& json, size_t& pos) {
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
}

}  // namespace

std::string Escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

bool HasField(const std::string& json, const std::string& field) {
  return FindValue(json, field) != std::string::npos;
}

bool ExtractString(const std::string& json, const std::string& field, std::string& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos) return false;
  return ParseStringAt(json, pos, out);
}

bool ExtractNumber(const std::string& json, const std::string& field, double& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos) return false;
  const char* begin = json.c_str() + pos;
  char* end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin) return false;
  out = value;
  return true;
}

bool ExtractInt(const std::string& json, const std::string& field, int64_t& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos) return false;
  const char* begin = json.c_str() + pos;
  char* end = nullptr;
  long long value = std::strtoll(begin, &end, 10);
  if (end == begin) return false;
  // Reject fractional values for integer fields.
  if (*end == '.' || *end == 'e' || *end == 'E') return false;
  out = static_cast<int64_t>(value);
  return true;
}

bool ExtractBool(const std::string& json, const std::string& field, bool& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos) return false;
  if (json.compare(pos, 4, "true") == 0) {
    out = true;
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    out = false;
    return true;
  }
  return false;
}

bool ExtractObject(const std::string& json, const std::string& field, std::string& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos || json[pos] != '{') return false;
  size_t end = 0;
  if (!MatchBalanced(json, pos, end)) return false;
  out = json.substr(pos, end - pos);
  return true;
}

bool ExtractStringArray(const std::string& json, const std::string& field,
                        std::vector<std::string>& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos || json[pos] != '[') return false;
  size_t end = 0;
  if (!MatchBalanced(json, pos, end)) return false;

  std::vector<std::string> values;
  size_t i = pos + 1;
  while (true) {
    SkipSpace(json, i);
    if (i >= end - 1) break;
    std::string value;
    if (!ParseStringAt(json, i, value)) return false;
    values.push_back(std::move(value));
    SkipSpace(json, i);
    if (json[i] == ',') ++i;
    else if (json[i] != ']') return false;
  }
  out = std::move(values);
  return true;
}

bool ExtractObjectArray(const std::string& json, const std::string& field,
                        std::vector<std::string>& out) {
  size_t pos = FindValue(json, field);
  if (pos == std::string::npos || json[pos] != '[') return false;
  size_t end = 0;
  if (!MatchBalanced(json, pos, end)) return false;

  std::vector<std::string> objects;
  size_t i = pos + 1;
  while (true) {
    SkipSpace(json, i);
    if (i >= end - 1) break;
    size_t obj_end = 0;
    if (json[i] != '{' || !MatchBalanced(json, i, obj_end)) return false;
    objects.push_back(json.substr(i, obj_end - i));
    i = obj_end;
    SkipSpace(json, i);
    if (json[i] == ',') ++i;
    else if (json[i] != ']') return false;
  }
  out = std::move(objects);
  return true;
}

}  // namespace clipper::util::json
