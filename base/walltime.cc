// Copyright 2017, Beeri 15.  All rights reserved.
//
#include "base/walltime.h"

namespace base {

void StringAppendStrftime(std::string* dst, const char* format, time_t when, bool local) {
  struct tm tm;
  bool conversion_error;
  if (local) {
    conversion_error = (localtime_r(&when, &tm) == nullptr);
  } else {
    conversion_error = (gmtime_r(&when, &tm) == nullptr);
  }
  if (conversion_error) {
    // If we couldn't convert the time, don't append anything.
    return;
  }

  char space[1024];

  size_t result = strftime(space, sizeof(space), format, &tm);

  if (result < sizeof(space)) {
    // It fit
    dst->append(space, result);
  }
}

}  // namespace base
