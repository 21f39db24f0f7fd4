// File: include/tcr/core/events/line_sink.hpp
#pragma once

#include <string>

#include "tcr/core/status.hpp"

namespace tcr {

// Ordered, append-only text sink. One call per service message line.
// No buffering contract beyond "write then continue".
class LineSink {
 public:
  virtual ~LineSink() = default;

  virtual Status open() = 0;
  virtual Status write_line(const std::string& line) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace tcr
