// File: src/core/protocol/timestamp.cpp
#include "tcr/core/protocol/timestamp.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace tcr {

std::string format_timestamp(TimestampNs t) {
  using namespace std::chrono;

  const sys_time<milliseconds> tp = floor<milliseconds>(sys_time<nanoseconds>(nanoseconds(t.ns)));
  const sys_days day = floor<days>(tp);
  const year_month_day ymd{day};
  const hh_mm_ss<milliseconds> hms{tp - day};

  long long hour12 = hms.hours().count() % 12;
  if (hour12 == 0) hour12 = 12;

  std::ostringstream ss;
  ss << std::setfill('0')
     << std::setw(4) << static_cast<int>(ymd.year()) << '-'
     << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
     << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
     << std::setw(2) << hour12 << ':'
     << std::setw(2) << hms.minutes().count() << ':'
     << std::setw(2) << hms.seconds().count() << '.'
     << std::setw(3) << hms.subseconds().count()
     << "+0000";
  return ss.str();
}

long long duration_millis(DurationNs d) { return static_cast<long long>(d / 1'000'000); }

}  // namespace tcr
