// File: src/core/protocol/code_location.cpp
#include "tcr/core/protocol/code_location.hpp"

#include <algorithm>
#include <utility>

namespace tcr {
namespace {

bool is_line_break(char c) { return c == '\n' || c == '\r'; }

struct CallSplit {
  std::size_t dot;
  std::size_t open;
};

// Last '(' in [lo, hi) and the last '.' before it. Both must exist.
std::optional<CallSplit> split_call(const std::string& s, std::size_t lo, std::size_t hi) {
  if (hi <= lo) return std::nullopt;
  const std::size_t open = s.rfind('(', hi - 1);
  if (open == std::string::npos || open < lo || open == 0) return std::nullopt;
  const std::size_t dot = s.rfind('.', open - 1);
  if (dot == std::string::npos) return std::nullopt;
  return CallSplit{dot, open};
}

}  // namespace

CodeLocationResolver::CodeLocationResolver(std::string scheme) : scheme_(std::move(scheme)) {}

// Linear scan equivalent to full-matching, in order,
//   1. (.*)\.(.*)\([^:]*\)
//   2. (.*)\.(.*)\(.*:.*\)
// with greedy groups and '.' not matching line breaks.
std::string CodeLocationResolver::resolve(const std::string& code_location) const {
  const std::string& s = code_location;
  if (s.size() < 3 || s.back() != ')') return s;

  const std::size_t close = s.size() - 1;
  const auto break_it = std::find_if(s.begin(), s.end(), is_line_break);
  const std::size_t first_break = break_it == s.end() ? std::string::npos : static_cast<std::size_t>(break_it - s.begin());
  const std::size_t last_colon = s.rfind(':', close);

  // Rule 1: the argument list holds no ':'; type and member hold no line break.
  const std::size_t args_lo = last_colon == std::string::npos ? 0 : last_colon + 1;
  if (auto call = split_call(s, args_lo, std::min(first_break, close))) {
    return scheme_ + s.substr(0, call->dot) + "/" + s.substr(call->dot + 1, call->open - call->dot - 1);
  }

  // Rule 2: the argument list holds a ':'; nothing holds a line break.
  if (first_break == std::string::npos && last_colon != std::string::npos) {
    if (auto call = split_call(s, 0, last_colon)) {
      const std::string declaring_type = s.substr(0, call->dot);
      return scheme_ + declaring_type + "/" + simple_type_name(declaring_type);
    }
  }
  return s;
}

std::string simple_type_name(const std::string& qualified) {
  const auto dot = qualified.rfind('.');
  if (dot == std::string::npos) return qualified;
  return qualified.substr(dot + 1);
}

}  // namespace tcr
