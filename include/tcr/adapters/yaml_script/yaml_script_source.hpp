// File: include/tcr/adapters/yaml_script/yaml_script_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tcr/core/io/event_source.hpp"

namespace tcr {

struct YamlScriptSourceConfig {
  // Script file. Ignored when `inline_yaml` is set.
  std::string path;

  // In-memory script (tests, stdin piping).
  std::string inline_yaml;
};

// Replays an event stream written as YAML:
//
//   events:
//     - type: test_run_started
//       t_ms: 1700000000000
//     - type: test_case_started
//       uri: file:features/belly.feature
//       line: 3
//       name: a few cukes
//     ...
//
// The whole script is parsed on open() so malformed input fails before any
// event is delivered. A missing t_ms repeats the previous event's timestamp.
class YamlScriptSource final : public EventSource {
 public:
  explicit YamlScriptSource(YamlScriptSourceConfig cfg);

  Status open() override;
  Result<Event> next() override;
  void close() override;

  std::string name() const override { return "yaml_script"; }

  std::size_t size() const { return events_.size(); }

 private:
  YamlScriptSourceConfig cfg_;
  bool opened_{false};

  std::vector<Event> events_;
  std::size_t idx_{0};
};

}  // namespace tcr
