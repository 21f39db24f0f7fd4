// File: src/core/events/stream_line_sink.cpp
#include "tcr/core/events/stream_line_sink.hpp"

#include <filesystem>
#include <system_error>

namespace tcr {

Status StreamLineSink::open() {
  if (!out_.good()) return Status::io_error("output stream is not writable");
  open_ = true;
  return Status{};
}

Status StreamLineSink::write_line(const std::string& line) {
  if (!open_) return Status::failed_precondition("StreamLineSink::write_line called while not open");

  out_ << line << '\n';
  if (flush_each_line_) out_.flush();

  if (!out_.good()) return Status::io_error("failed writing to output stream");
  return Status{};
}

Status StreamLineSink::flush() {
  if (!open_) return Status{};
  out_.flush();
  if (!out_.good()) return Status::io_error("failed flushing output stream");
  return Status{};
}

void StreamLineSink::close() {
  if (open_) out_.flush();
  open_ = false;
}

FileLineSink::~FileLineSink() { close(); }

Status FileLineSink::open() {
  close();

  namespace fs = std::filesystem;
  const fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      return Status::io_error("failed creating directory '" + parent.string() + "': " + ec.message());
    }
  }

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");
  return Status{};
}

Status FileLineSink::write_line(const std::string& line) {
  if (!f_.is_open()) return Status::failed_precondition("FileLineSink::write_line called while not open");

  f_ << line << '\n';
  if (flush_each_line_) f_.flush();

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  return Status{};
}

Status FileLineSink::flush() {
  if (!f_.is_open()) return Status{};

  f_.flush();
  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  return Status{};
}

void FileLineSink::close() {
  if (f_.is_open()) f_.close();
}

}  // namespace tcr
