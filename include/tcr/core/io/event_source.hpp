// File: include/tcr/core/io/event_source.hpp
#pragma once

#include <string>

#include "tcr/core/events/event.hpp"
#include "tcr/core/status.hpp"

namespace tcr {

// Ordered producer of events.
class EventSource {
 public:
  virtual ~EventSource() = default;

  virtual Status open() = 0;

  // Returns:
  //  - the next event, in delivery order
  //  - out_of_range("eof") when the stream is exhausted
  //  - other error codes on failure
  virtual Result<Event> next() = 0;

  virtual void close() = 0;

  virtual std::string name() const = 0;
};

}  // namespace tcr
