// src/core/util/config_loader.cpp
#include "tcr/core/util/config_loader.hpp"

#include <filesystem>
#include <set>

#include <yaml-cpp/yaml.h>

namespace tcr {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static Status maybe_set(const YAML::Node& n, const char* key, T& out, const char* section) {
  if (!n || !n[key]) return Status::ok_status();
  try {
    out = n[key].as<T>();
  } catch (const YAML::Exception& e) {
    return Status::invalid_argument(std::string(section) + "." + key + ": " + e.what());
  }
  return Status::ok_status();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> resolve_includes(YAML::Node root, const fs::path& dir, std::set<fs::path>& visiting);

static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<fs::path>& visiting) {
  std::error_code ec;
  const fs::path key = fs::weakly_canonical(path, ec);
  const fs::path id = ec ? path : key;
  if (visiting.count(id) != 0) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());

  visiting.insert(id);
  auto merged_r = resolve_includes(root_r.take_value(), path.parent_path(), visiting);
  visiting.erase(id);
  return merged_r;
}

static Result<YAML::Node> resolve_includes(YAML::Node root, const fs::path& dir, std::set<fs::path>& visiting) {
  YAML::Node merged;  // empty

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (is_map(root) && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      if (!inc[i].IsScalar()) {
        return Result<YAML::Node>::err(Status::invalid_argument("includes entries must be strings"));
      }
      const auto rel = inc[i].Scalar();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, visiting);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    // Finally override with this file's contents (excluding includes itself).
    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Result<Config> config_from_yaml(const YAML::Node& y) {
  Config cfg;  // defaults
  if (y && !y.IsNull() && !y.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a YAML map"));
  }

  auto fail = [](const Status& s) { return Result<Config>::err(s); };

  // --- input
  if (is_map(y["input"])) {
    const auto in = y["input"];
    if (auto s = maybe_set(in, "events_path", cfg.input.events_path, "input"); !s.ok()) return fail(s);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    if (auto s = maybe_set(o, "path", cfg.output.path, "output"); !s.ok()) return fail(s);
    if (auto s = maybe_set(o, "flush_each_line", cfg.output.flush_each_line, "output"); !s.ok()) return fail(s);
  }

  // --- protocol
  if (is_map(y["protocol"])) {
    const auto p = y["protocol"];
    if (auto s = maybe_set(p, "prefix", cfg.protocol.prefix, "protocol"); !s.ok()) return fail(s);
    if (auto s = maybe_set(p, "run_name", cfg.protocol.run_name, "protocol"); !s.ok()) return fail(s);
    if (auto s = maybe_set(p, "progress_category", cfg.protocol.progress_category, "protocol"); !s.ok()) return fail(s);
    if (auto s = maybe_set(p, "fixture_failure_name", cfg.protocol.fixture_failure_name, "protocol"); !s.ok()) return fail(s);
    if (auto s = maybe_set(p, "location_scheme", cfg.protocol.location_scheme, "protocol"); !s.ok()) return fail(s);
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return fail(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  std::set<fs::path> visiting;
  auto yaml_r = load_with_includes(fs::path(path_str), visiting);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return config_from_yaml(yaml_r.take_value());
}

Result<Config> load_config_from_string(const std::string& yaml, const std::string& base_dir) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }

  std::set<fs::path> visiting;
  auto yaml_r = resolve_includes(root, fs::path(base_dir), visiting);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return config_from_yaml(yaml_r.take_value());
}

}  // namespace tcr
