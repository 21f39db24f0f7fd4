// File: src/core/protocol/service_message.cpp
#include "tcr/core/protocol/service_message.hpp"

namespace tcr {

std::string escape_value(std::string_view raw) {
  std::string out;
  out.reserve(raw.size() + raw.size() / 8);
  // Single pass: each input character maps to exactly one output token, which
  // is equivalent to applying the six replacements in order.
  for (const char c : raw) {
    switch (c) {
      case '|': out += "||"; break;
      case '\'': out += "|'"; break;
      case '\n': out += "|n"; break;
      case '\r': out += "|r"; break;
      case '[': out += "|["; break;
      case ']': out += "|]"; break;
      default: out += c; break;
    }
  }
  return out;
}

std::string escape_value(const std::optional<std::string>& raw) {
  if (!raw) return std::string();
  return escape_value(std::string_view(*raw));
}

ServiceMessage& ServiceMessage::attr(std::string key, std::string value) {
  attrs_.emplace_back(std::move(key), escape_value(std::string_view(value)));
  return *this;
}

ServiceMessage& ServiceMessage::attr(std::string key, const char* value) {
  attrs_.emplace_back(std::move(key), escape_value(std::string_view(value)));
  return *this;
}

ServiceMessage& ServiceMessage::attr(std::string key, const std::optional<std::string>& value) {
  attrs_.emplace_back(std::move(key), escape_value(value));
  return *this;
}

ServiceMessage& ServiceMessage::attr(std::string key, long long value) {
  attrs_.emplace_back(std::move(key), std::to_string(value));
  return *this;
}

std::string ServiceMessage::render(std::string_view prefix) const {
  std::string line = "##";
  line += prefix;
  line += '[';
  line += name_;
  for (const auto& [key, value] : attrs_) {
    line += ' ';
    line += key;
    line += "='";
    line += value;
    line += '\'';
  }
  line += ']';
  return line;
}

}  // namespace tcr
