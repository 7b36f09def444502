// Copyright 2017, Beeri 15.  All rights reserved.
//
#pragma once

#include <sys/time.h>
#include <time.h>

#include <string>

#include "base/integral_types.h"

typedef int64 MicrosecondsInt64;

namespace base {

// Time conversion utilities.
static constexpr int64 kNumMillisPerSecond = 1000LL;

static constexpr int64 kNumMicrosPerMilli = 1000LL;
static constexpr int64 kNumMicrosPerSecond = kNumMicrosPerMilli * 1000LL;

inline MicrosecondsInt64 ToMicros(const timespec& ts) {
  return ts.tv_sec * kNumMicrosPerSecond + ts.tv_nsec / 1000;
}

template<clockid_t cid> inline MicrosecondsInt64 GetClockMicros() {
  timespec ts;
  clock_gettime(cid, &ts);
  return ToMicros(ts);
}

// Append result to a supplied string.
// If an error occurs during conversion 'dst' is not modified.
void StringAppendStrftime(std::string* dst,
                          const char* format,
                          time_t when,
                          bool local);

inline std::string LocalTimeNow(const char* format) {
  std::string result;
  StringAppendStrftime(&result, format, time(NULL), true);
  return result;
}

// A timer and clock interface using posix CLOCK_MONOTONIC clock.
class Timer {
  uint64 start_usec_;

 public:
  static MicrosecondsInt64 Usec() {
    return GetClockMicros<CLOCK_MONOTONIC>();
  }

  Timer() {
    start_usec_ = Usec();
  }

  uint64 EvalUsec() const { return Usec() - start_usec_; }
  uint64 EvalMsec() const { return EvalUsec() / kNumMicrosPerMilli; }
};

}  // namespace base
