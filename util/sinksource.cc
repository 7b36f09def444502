// Copyright 2013, Beeri 15.  All rights reserved.
//
#include "util/sinksource.h"

#include <algorithm>
#include <cstring>

#include "base/logging.h"

namespace util {

Status Sink::Flush() { return Status::OK; }

StatusObject<size_t> Source::Read(const strings::MutableByteRange& range) {
  CHECK(!range.empty());

  if (prepend_buf_.size() >= range.size()) {
    memcpy(range.data(), prepend_buf_.data(), range.size());
    prepend_buf_.erase(prepend_buf_.begin(), prepend_buf_.begin() + range.size());

    return range.size();
  }

  size_t read = 0;
  if (!prepend_buf_.empty()) {
    memcpy(range.data(), prepend_buf_.data(), prepend_buf_.size());

    read = prepend_buf_.size();
    prepend_buf_.clear();

    DCHECK_LT(read, range.size());
  }
  auto res = ReadInternal(range.subspan(read));
  if (!res.ok())
    return res;
  return res.obj + read;
}

StatusObject<size_t> StringSource::ReadInternal(const strings::MutableByteRange& range) {
  size_t to_fill = std::min<size_t>({range.size(), block_size_, input_.size()});
  memcpy(range.data(), input_.data(), to_fill);

  input_.remove_prefix(to_fill);
  return to_fill;
}

}  // namespace util
