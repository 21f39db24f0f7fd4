// File: src/adapters/yaml_script/yaml_script_source.cpp
#include "tcr/adapters/yaml_script/yaml_script_source.hpp"

#include <filesystem>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace tcr {
namespace {

std::optional<std::string> optional_string(const YAML::Node& n, const char* key) {
  if (!n[key] || n[key].IsNull()) return std::nullopt;
  return n[key].as<std::string>();
}

std::string string_or(const YAML::Node& n, const char* key, const std::string& fallback) {
  if (!n[key] || n[key].IsNull()) return fallback;
  return n[key].as<std::string>();
}

Result<std::int64_t> parse_millis(const YAML::Node& n, const char* key) {
  const auto ms = n[key].as<std::int64_t>();
  if (ms > kMaxMillis || ms < -kMaxMillis) {
    return Result<std::int64_t>::err(Status::parse_error(std::string(key) + " out of range: " + std::to_string(ms)));
  }
  return Result<std::int64_t>::ok(ms);
}

Result<StepStatus> parse_status(const std::string& s) {
  if (s == "passed") return Result<StepStatus>::ok(StepStatus::kPassed);
  if (s == "skipped") return Result<StepStatus>::ok(StepStatus::kSkipped);
  if (s == "pending") return Result<StepStatus>::ok(StepStatus::kPending);
  if (s == "undefined") return Result<StepStatus>::ok(StepStatus::kUndefined);
  if (s == "ambiguous") return Result<StepStatus>::ok(StepStatus::kAmbiguous);
  if (s == "failed") return Result<StepStatus>::ok(StepStatus::kFailed);
  return Result<StepStatus>::err(Status::parse_error("unknown status: " + s));
}

Result<HookType> parse_hook_type(const std::string& s) {
  if (s == "before") return Result<HookType>::ok(HookType::kBefore);
  if (s == "after") return Result<HookType>::ok(HookType::kAfter);
  if (s == "before_step") return Result<HookType>::ok(HookType::kBeforeStep);
  if (s == "after_step") return Result<HookType>::ok(HookType::kAfterStep);
  if (s == "before_all") return Result<HookType>::ok(HookType::kBeforeAll);
  if (s == "after_all") return Result<HookType>::ok(HookType::kAfterAll);
  return Result<HookType>::err(Status::parse_error("unknown hook: " + s));
}

Location parse_location(const YAML::Node& n) {
  Location loc;
  loc.line = n["line"].as<std::int64_t>();
  if (n["column"]) loc.column = n["column"].as<std::int64_t>();
  return loc;
}

TestCase parse_test_case(const YAML::Node& n) {
  TestCase tc;
  tc.uri = n["uri"].as<std::string>();
  tc.location = parse_location(n);
  tc.name = string_or(n, "name", "");
  return tc;
}

Result<SourceNode> parse_source_node(const YAML::Node& n, const std::string& uri) {
  if (!n.IsMap()) return Result<SourceNode>::err(Status::parse_error("source node must be a map"));

  SourceNode out;
  out.node.uri = uri;
  out.node.location = parse_location(n);
  out.node.keyword = optional_string(n, "keyword");
  out.node.name = optional_string(n, "name");

  if (n["children"]) {
    const auto children = n["children"];
    if (!children.IsSequence()) return Result<SourceNode>::err(Status::parse_error("children must be a sequence"));
    for (std::size_t i = 0; i < children.size(); ++i) {
      auto child_r = parse_source_node(children[i], uri);
      if (!child_r.ok()) return child_r;
      out.children.push_back(child_r.take_value());
    }
  }
  return Result<SourceNode>::ok(std::move(out));
}

Result<TestStep> parse_step(const YAML::Node& n, const std::string& default_uri) {
  if (!n || !n.IsMap()) return Result<TestStep>::err(Status::parse_error("step must be a map"));

  const std::string kind = string_or(n, "kind", "pickle");
  const std::string code_location = string_or(n, "code_location", "");

  if (kind == "pickle") {
    PickleStep s;
    s.uri = string_or(n, "uri", default_uri);
    s.line = n["line"].as<std::int64_t>();
    s.text = n["text"].as<std::string>();
    s.code_location = code_location;
    return Result<TestStep>::ok(TestStep{std::move(s)});
  }
  if (kind == "hook") {
    auto hook_r = parse_hook_type(n["hook"].as<std::string>());
    if (!hook_r.ok()) return Result<TestStep>::err(hook_r.status());
    return Result<TestStep>::ok(TestStep{HookStep{hook_r.take_value(), code_location}});
  }
  if (kind == "generic") {
    return Result<TestStep>::ok(TestStep{GenericStep{code_location}});
  }
  return Result<TestStep>::err(Status::parse_error("unknown step kind: " + kind));
}

std::optional<ErrorInfo> parse_error_info(const YAML::Node& n) {
  if (!n || n.IsNull()) return std::nullopt;

  ErrorInfo err;
  err.type = string_or(n, "type", "");
  err.message = optional_string(n, "message");
  if (n["stack"]) {
    for (const auto& frame : n["stack"]) err.stack_trace.push_back(frame.as<std::string>());
  }
  return err;
}

Result<Event> parse_event(const YAML::Node& n, TimestampNs t, TestCase& running) {
  if (!n.IsMap()) return Result<Event>::err(Status::parse_error("event must be a map"));
  if (!n["type"]) return Result<Event>::err(Status::parse_error("event has no type"));

  const std::string type = n["type"].as<std::string>();

  if (type == "test_run_started") {
    return Result<Event>::ok(TestRunStarted{t});
  }
  if (type == "test_source_parsed") {
    TestSourceParsed e{t, n["uri"].as<std::string>(), {}};
    if (n["nodes"]) {
      for (const auto& node : n["nodes"]) {
        auto node_r = parse_source_node(node, e.uri);
        if (!node_r.ok()) return Result<Event>::err(node_r.status());
        e.nodes.push_back(node_r.take_value());
      }
    }
    return Result<Event>::ok(std::move(e));
  }
  if (type == "test_case_started") {
    running = parse_test_case(n);
    return Result<Event>::ok(TestCaseStarted{t, running});
  }
  if (type == "test_step_started") {
    auto step_r = parse_step(n["step"], running.uri);
    if (!step_r.ok()) return Result<Event>::err(step_r.status());
    return Result<Event>::ok(TestStepStarted{t, step_r.take_value()});
  }
  if (type == "test_step_finished") {
    auto step_r = parse_step(n["step"], running.uri);
    if (!step_r.ok()) return Result<Event>::err(step_r.status());
    auto status_r = parse_status(string_or(n, "status", "passed"));
    if (!status_r.ok()) return Result<Event>::err(status_r.status());

    StepResult result;
    result.status = status_r.take_value();
    if (n["duration_ms"]) {
      auto ms_r = parse_millis(n, "duration_ms");
      if (!ms_r.ok()) return Result<Event>::err(ms_r.status());
      result.duration = ms_to_ns(ms_r.value());
    }
    result.error = parse_error_info(n["error"]);
    return Result<Event>::ok(TestStepFinished{t, step_r.take_value(), std::move(result)});
  }
  if (type == "test_case_finished") {
    return Result<Event>::ok(TestCaseFinished{t});
  }
  if (type == "test_run_finished") {
    return Result<Event>::ok(TestRunFinished{t, parse_error_info(n["error"])});
  }
  if (type == "snippets_suggested") {
    SnippetsSuggested e;
    e.timestamp = t;
    e.uri = n["uri"].as<std::string>();
    e.test_case_location = parse_location(n);
    e.suggestion.step_text = string_or(n, "step_text", "");
    if (n["snippets"]) {
      for (const auto& s : n["snippets"]) e.suggestion.snippets.push_back(s.as<std::string>());
    }
    return Result<Event>::ok(std::move(e));
  }
  if (type == "embed") {
    EmbedEvent e;
    e.timestamp = t;
    e.name = optional_string(n, "name");
    e.media_type = string_or(n, "media_type", "application/octet-stream");
    if (n["data"]) e.size_bytes = n["data"].as<std::string>().size();
    if (n["size"]) e.size_bytes = n["size"].as<std::size_t>();
    return Result<Event>::ok(std::move(e));
  }
  if (type == "write") {
    return Result<Event>::ok(WriteEvent{t, string_or(n, "text", "")});
  }

  return Result<Event>::err(Status::parse_error("unknown event type: " + type));
}

Result<std::vector<Event>> parse_script(const YAML::Node& root) {
  if (!root || !root.IsMap() || !root["events"] || !root["events"].IsSequence()) {
    return Result<std::vector<Event>>::err(Status::parse_error("event script needs an 'events' sequence"));
  }

  const YAML::Node events = root["events"];
  std::vector<Event> out;
  out.reserve(events.size());

  TimestampNs t{0};
  TestCase running;
  for (std::size_t i = 0; i < events.size(); ++i) {
    const YAML::Node n = events[i];
    const std::string where = "event #" + std::to_string(i) + ": ";
    try {
      if (n.IsMap() && n["t_ms"]) {
        auto ms_r = parse_millis(n, "t_ms");
        if (!ms_r.ok()) return Result<std::vector<Event>>::err(Status::parse_error(where + ms_r.status().message()));
        t = from_epoch_ms(ms_r.value());
      }
      auto ev_r = parse_event(n, t, running);
      if (!ev_r.ok()) {
        return Result<std::vector<Event>>::err(Status::parse_error(where + ev_r.status().message()));
      }
      out.push_back(ev_r.take_value());
    } catch (const YAML::Exception& e) {
      return Result<std::vector<Event>>::err(Status::parse_error(where + e.what()));
    }
  }
  return Result<std::vector<Event>>::ok(std::move(out));
}

}  // namespace

YamlScriptSource::YamlScriptSource(YamlScriptSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status YamlScriptSource::open() {
  close();

  YAML::Node root;
  try {
    if (!cfg_.inline_yaml.empty()) {
      root = YAML::Load(cfg_.inline_yaml);
    } else {
      if (cfg_.path.empty()) return Status::invalid_argument("YamlScriptSource: path is empty");
      std::error_code ec;
      if (!std::filesystem::exists(cfg_.path, ec)) {
        return Status::not_found("YamlScriptSource: script not found: " + cfg_.path);
      }
      root = YAML::LoadFile(cfg_.path);
    }
  } catch (const YAML::Exception& e) {
    return Status::parse_error(std::string("YamlScriptSource: YAML parse error: ") + e.what());
  }

  auto events_r = parse_script(root);
  if (!events_r.ok()) return events_r.status();

  events_ = events_r.take_value();
  idx_ = 0;
  opened_ = true;
  return Status::ok_status();
}

Result<Event> YamlScriptSource::next() {
  if (!opened_) {
    return Result<Event>::err(Status::failed_precondition("YamlScriptSource::next: not opened"));
  }
  if (idx_ >= events_.size()) {
    return Result<Event>::err(Status::out_of_range("eof"));
  }
  return Result<Event>::ok(events_[idx_++]);
}

void YamlScriptSource::close() {
  opened_ = false;
  events_.clear();
  idx_ = 0;
}

}  // namespace tcr
