// File: include/tcr/core/events/stream_line_sink.hpp
#pragma once

#include <fstream>
#include <ostream>
#include <string>
#include <utility>

#include "tcr/core/events/line_sink.hpp"
#include "tcr/core/status.hpp"

namespace tcr {

// Writes lines to a caller-owned stream (stdout in the app, a stringstream in tests).
class StreamLineSink final : public LineSink {
 public:
  explicit StreamLineSink(std::ostream& out, bool flush_each_line = false)
      : out_(out), flush_each_line_(flush_each_line) {}

  Status open() override;
  Status write_line(const std::string& line) override;
  Status flush() override;
  void close() override;

 private:
  std::ostream& out_;
  bool flush_each_line_{false};
  bool open_{false};
};

// Writes lines to a file, truncated on open.
class FileLineSink final : public LineSink {
 public:
  explicit FileLineSink(std::string path, bool flush_each_line = false)
      : path_(std::move(path)), flush_each_line_(flush_each_line) {}
  ~FileLineSink() override;

  const std::string& path() const { return path_; }

  Status open() override;
  Status write_line(const std::string& line) override;
  Status flush() override;
  void close() override;

 private:
  std::string path_;
  bool flush_each_line_{false};
  std::ofstream f_;
};

}  // namespace tcr
