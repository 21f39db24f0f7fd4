// include/tcr/core/config.hpp
#pragma once

#include <string>

#include "tcr/core/status.hpp"

namespace tcr {

// -----------------------------
// Protocol rendering
// -----------------------------
struct ProtocolConfig {
  // Lines look like "##<prefix>[...]".
  std::string prefix = "teamcity";

  // Name of the outermost suite wrapping the whole run.
  std::string run_name = "Cucumber";

  // testsCategory sent with the counting-started progress marker.
  std::string progress_category = "Scenarios";

  // Placeholder test used to report before-all/after-all failures.
  std::string fixture_failure_name = "Before All/After All";

  // Prepended to resolved glue code locations.
  std::string location_scheme = "test://";
};

// -----------------------------
// Input (event script replay)
// -----------------------------
struct InputConfig {
  std::string events_path;
};

// -----------------------------
// Output (service message lines)
// -----------------------------
struct OutputConfig {
  // "-" writes to stdout, anything else is a file path.
  std::string path = "-";
  bool flush_each_line = true;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  InputConfig input;
  OutputConfig output;
  ProtocolConfig protocol;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.output.path.empty()) {
    return Status::invalid_argument("output.path must not be empty");
  }
  if (cfg.protocol.prefix.empty()) {
    return Status::invalid_argument("protocol.prefix must not be empty");
  }
  if (cfg.protocol.prefix.find_first_of(" \t\r\n[]") != std::string::npos) {
    return Status::invalid_argument("protocol.prefix must not contain whitespace or brackets");
  }
  if (cfg.protocol.run_name.empty()) {
    return Status::invalid_argument("protocol.run_name must not be empty");
  }
  if (cfg.protocol.fixture_failure_name.empty()) {
    return Status::invalid_argument("protocol.fixture_failure_name must not be empty");
  }
  return Status::ok_status();
}

}  // namespace tcr
