// tests/unit/test_support.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tcr/core/events/line_sink.hpp"
#include "tcr/core/types.hpp"

namespace tcr::test_support {

// 2023-11-14T22:13:20.000Z, renders as "2023-11-14T10:13:20.000+0000".
constexpr TimestampNs kT0 = from_epoch_ms(1700000000000);
inline constexpr const char* kT0Text = "2023-11-14T10:13:20.000+0000";

inline StructuralNode node(std::string uri, std::int64_t line, std::optional<std::string> keyword,
                           std::optional<std::string> name) {
  return StructuralNode{std::move(uri), Location{line, 1}, std::move(keyword), std::move(name)};
}

inline SourceNode tree(StructuralNode n, std::vector<SourceNode> children = {}) {
  return SourceNode{std::move(n), std::move(children)};
}

// Keeps every written line in memory.
class MemoryLineSink final : public LineSink {
 public:
  Status open() override {
    open_ = true;
    return Status::ok_status();
  }
  Status write_line(const std::string& line) override {
    if (fail_writes) return Status::io_error("sink full");
    lines.push_back(line);
    return Status::ok_status();
  }
  Status flush() override { return Status::ok_status(); }
  void close() override { open_ = false; }

  bool is_open() const { return open_; }

  std::vector<std::string> lines;
  bool fail_writes{false};

 private:
  bool open_{false};
};

// Service message name of a line: "##teamcity[testStarted ...]" -> "testStarted".
inline std::string message_name(const std::string& line) {
  const auto open = line.find('[');
  const auto end = line.find_first_of(" ]", open);
  return line.substr(open + 1, end - open - 1);
}

// Unescaped value of `key` in a line, or nullopt.
inline std::optional<std::string> attr_value(const std::string& line, const std::string& key) {
  const std::string needle = " " + key + "='";
  const auto at = line.find(needle);
  if (at == std::string::npos) return std::nullopt;

  std::string out;
  for (std::size_t i = at + needle.size(); i < line.size(); ++i) {
    const char c = line[i];
    if (c == '|' && i + 1 < line.size()) {
      const char n = line[++i];
      switch (n) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: out += n; break;
      }
      continue;
    }
    if (c == '\'') return out;
    out += c;
  }
  return std::nullopt;
}

inline std::vector<std::string> message_names(const std::vector<std::string>& lines) {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& l : lines) out.push_back(message_name(l));
  return out;
}

}  // namespace tcr::test_support
