// File: include/tcr/core/protocol/code_location.hpp
#pragma once

#include <optional>
#include <string>

namespace tcr {

// Maps a glue code location to an IDE navigation hint.
//
// Rules are tried in order, each must match the whole string:
//   1. "<type>.<member>(<args without ':'>)"  -> <scheme><type>/<member>
//   2. "<type>.<member>(<args with ':'>)"     -> <scheme><type>/<simple type>
//      (lambda-style references carry "File.ext:line" inside the parens)
//   3. anything else is returned unchanged.
// Matching is a single linear scan, so input length is unbounded.
class CodeLocationResolver {
 public:
  explicit CodeLocationResolver(std::string scheme = "test://");

  [[nodiscard]] std::string resolve(const std::string& code_location) const;

  const std::string& scheme() const { return scheme_; }

 private:
  std::string scheme_;
};

// Last dot-separated component ("com.example.Steps" -> "Steps").
std::string simple_type_name(const std::string& qualified);

}  // namespace tcr
