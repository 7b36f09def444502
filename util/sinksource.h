// Copyright 2013, Beeri 15.  All rights reserved.
//
#ifndef UTIL_SINKSOURCE_H
#define UTIL_SINKSOURCE_H

#include <memory>
#include <string>
#include <vector>

#include "base/integral_types.h"
#include "base/macros.h"
#include "strings/stringpiece.h"
#include "util/status.h"

// We prefer Sink and Source (like in snappy and icu) over ZeroCopy streams like in protobuf.

namespace util {

class Sink {
 public:
  Sink() {}
  virtual ~Sink() {}

  // Appends slice to sink.
  virtual Status Append(const strings::ByteRange& slice) = 0;

  // Flushes internal buffers. The default implemenation does nothing. Sink
  // subclasses may use internal buffers that require calling Flush() at the end
  // of writing to the stream.
  virtual Status Flush();

 private:
  DISALLOW_COPY_AND_ASSIGN(Sink);
};

class StringSink : public Sink {
  std::string contents_;

 public:
  Status Append(const strings::ByteRange& slice) override {
    contents_.append(strings::charptr(slice.data()), slice.size());
    return Status::OK;
  }

  std::string& contents() { return contents_; }
  const std::string& contents() const { return contents_; }
};

// Source classes. Allow synchronous reads from an abstract source.
class Source {
 public:
  Source() {}
  virtual ~Source() {}

  // Returns number of bytes read. 0 means the end of the stream.
  StatusObject<size_t> Read(const strings::MutableByteRange& range);

  void Prepend(const strings::ByteRange& range) {
    prepend_buf_.insert(prepend_buf_.begin(), range.begin(), range.end());
  }

 protected:
  virtual StatusObject<size_t> ReadInternal(const strings::MutableByteRange& range) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Source);

  std::vector<uint8> prepend_buf_;
};

class StringSource : public Source {
 public:
  // block_size is used to simulate paging reads, usually in tests.
  // input must exists all the time StringSource is used. It should not be
  // changed either since StringSource wraps its internal buffer during the construction.
  explicit StringSource(const std::string& input, uint32 block_size = kuint32max)
      : input_(input), block_size_(block_size) {}

  size_t Available() const { return input_.size(); }

 private:
  StatusObject<size_t> ReadInternal(const strings::MutableByteRange& range) override;

  StringPiece input_;
  uint32 block_size_;
};

}  // namespace util

#endif  // UTIL_SINKSOURCE_H
