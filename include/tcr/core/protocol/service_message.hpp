// File: include/tcr/core/protocol/service_message.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tcr {

// Escapes one attribute value. Order matters: '|' first so later
// substitutions are not escaped twice.
//   |  -> ||
//   '  -> |'
//   \n -> |n
//   \r -> |r
//   [  -> |[
//   ]  -> |]
std::string escape_value(std::string_view raw);

// Absent values render as the empty string.
std::string escape_value(const std::optional<std::string>& raw);

// One "##<prefix>[<name> key='value' ...]" line. Attributes keep insertion order.
class ServiceMessage {
 public:
  explicit ServiceMessage(std::string name) : name_(std::move(name)) {}

  ServiceMessage& attr(std::string key, std::string value);
  ServiceMessage& attr(std::string key, const char* value);
  ServiceMessage& attr(std::string key, const std::optional<std::string>& value);
  ServiceMessage& attr(std::string key, long long value);

  [[nodiscard]] std::string render(std::string_view prefix) const;

 private:
  std::string name_;
  std::vector<std::pair<std::string, std::string>> attrs_;
};

}  // namespace tcr
