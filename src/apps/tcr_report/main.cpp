// File: src/apps/tcr_report/main.cpp
#include <iostream>
#include <memory>
#include <string>

#include "tcr/adapters/yaml_script/yaml_script_source.hpp"
#include "tcr/core/events/stream_line_sink.hpp"
#include "tcr/core/io/event_source.hpp"
#include "tcr/core/model/reporter.hpp"
#include "tcr/core/util/config_loader.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string events_path;
  std::string out_path;
  bool help{false};
  bool bad{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--events" && i + 1 < argc) {
      a.events_path = argv[++i];
      continue;
    }
    if (s == "--out" && i + 1 < argc) {
      a.out_path = argv[++i];
      continue;
    }
    a.bad = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "tcr_report\n"
            << "  --config <path>   YAML config\n"
            << "  --events <path>   event script (overrides input.events_path)\n"
            << "  --out <path>      '-' for stdout (overrides output.path)\n";
}

std::unique_ptr<tcr::LineSink> make_sink(const tcr::OutputConfig& out) {
  if (out.path == "-") return std::make_unique<tcr::StreamLineSink>(std::cout, out.flush_each_line);
  return std::make_unique<tcr::FileLineSink>(out.path, out.flush_each_line);
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.bad || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 1;
  }

  auto cfg_r = tcr::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  tcr::Config cfg = cfg_r.take_value();
  if (!args.events_path.empty()) cfg.input.events_path = args.events_path;
  if (!args.out_path.empty()) cfg.output.path = args.out_path;

  if (cfg.input.events_path.empty()) {
    std::cerr << "input.events_path must be set (config or --events)\n";
    return 1;
  }

  tcr::YamlScriptSource source(tcr::YamlScriptSourceConfig{cfg.input.events_path, ""});
  const tcr::Status st_open = source.open();
  if (!st_open.ok()) {
    std::cerr << st_open.message() << "\n";
    return 2;
  }

  std::unique_ptr<tcr::LineSink> sink = make_sink(cfg.output);
  tcr::Reporter reporter(cfg.protocol);

  const tcr::Status st_start = reporter.start(*sink);
  if (!st_start.ok()) {
    std::cerr << st_start.message() << "\n";
    return 2;
  }

  bool had_error = false;
  while (true) {
    auto ev_r = source.next();
    if (!ev_r.ok()) {
      if (ev_r.status().code() != tcr::Status::Code::kOutOfRange) {
        std::cerr << ev_r.status().message() << "\n";
        had_error = true;
      }
      break;
    }

    const tcr::Status st = reporter.handle(*ev_r);
    if (!st.ok()) {
      std::cerr << tcr::event_type_name(*ev_r) << ": " << st.message() << "\n";
      had_error = true;
      break;
    }
  }

  source.close();
  const tcr::Status st_stop = reporter.stop();
  if (!st_stop.ok()) {
    std::cerr << st_stop.message() << "\n";
    had_error = true;
  }

  const tcr::ReportStats& stats = reporter.stats();
  std::cerr << "events=" << stats.events << " lines=" << stats.lines << " cases=" << stats.cases
            << " failed_steps=" << stats.failed_steps << " undefined_steps=" << stats.undefined_steps << "\n";

  return had_error ? 2 : 0;
}
