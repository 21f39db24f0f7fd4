// src/core/types.cpp
#include "tcr/core/types.hpp"

#include <sstream>

namespace tcr {

const char* hook_type_name(HookType type) {
  switch (type) {
    case HookType::kBefore: return "BEFORE";
    case HookType::kAfter: return "AFTER";
    case HookType::kBeforeStep: return "BEFORE_STEP";
    case HookType::kAfterStep: return "AFTER_STEP";
    case HookType::kBeforeAll: return "BEFORE_ALL";
    case HookType::kAfterAll: return "AFTER_ALL";
  }
  return "UNKNOWN";
}

const std::string& code_location_of(const TestStep& step) {
  return std::visit([](const auto& s) -> const std::string& { return s.code_location; }, step);
}

std::string ErrorInfo::full_description() const {
  std::ostringstream ss;
  ss << type;
  if (message) {
    if (!type.empty()) ss << ": ";
    ss << *message;
  }
  for (const auto& frame : stack_trace) {
    ss << "\n\tat " << frame;
  }
  return ss.str();
}

}  // namespace tcr
