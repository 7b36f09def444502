// Copyright 2013, Beeri 15.  All rights reserved.
//
#include "file/filesource.h"

#include "absl/strings/ascii.h"
#include "base/logging.h"
#include "file/file.h"
#include "strings/split.h"
#include "util/zlib_source.h"

namespace file {

using util::Status;
using util::StatusObject;
using namespace std;

Source::Source(ReadonlyFile* file) : file_(file) {}

Source::~Source() {
  auto st = file_->Close();
  LOG_IF(WARNING, !st.ok()) << st;
  delete file_;
}

util::StatusObject<size_t> Source::ReadInternal(const strings::MutableByteRange& range) {
  auto res = file_->Read(offset_, range);
  if (!res.ok())
    return res.status;
  offset_ += res.obj;

  return res.obj;
}

util::Source* Source::Uncompressed(ReadonlyFile* file) {
  Source* first = new Source(file);
  if (util::ZlibSource::IsZlibSource(first))
    return new util::ZlibSource(first);
  return first;
}

Sink::~Sink() {
  if (ownership_ == TAKE_OWNERSHIP)
    CHECK(file_->Close());
}

util::Status Sink::Append(const strings::ByteRange& slice) {
  return file_->Write(slice.data(), slice.size());
}

void LineReader::Init(uint32_t buf_log) {
  CHECK_GT(buf_log, 10);
  page_size_ = 1 << buf_log;

  buf_.reset(new char[page_size_]);
  next_ = end_ = buf_.get();
  *next_ = '\n';
}

LineReader::~LineReader() {
  if (ownership_ == TAKE_OWNERSHIP) {
    delete source_;
  }
}

bool LineReader::Next(StringPiece* result, std::string* scratch) {
  bool use_scratch = false;

  if (scratch == nullptr)
    scratch = &scratch_;

  while (true) {
    // Common case: search of EOL.
    char* ptr = next_;
    while (*ptr != '\n')
      ++ptr;

    if (ptr < end_) {  // Found EOL.
      ++line_num_;

      unsigned delta = 1;
      if (ptr > next_ && ptr[-1] == '\r') {
        --ptr;
        delta = 2;
      }
      *ptr = '\0';

      if (use_scratch) {
        scratch->append(next_, ptr);
        *result = *scratch;
      } else {
        *result = StringPiece(next_, ptr - next_);
      }
      next_ = ptr + delta;

      return true;
    }

    if (end_ != next_) {  // The initial buffer was not empty.
      // We reach end of buffer. We must copy the data to accomodate the broken line.
      if (!use_scratch) {
        scratch->assign(next_, end_);
        use_scratch = true;
      } else {
        scratch->append(next_, end_);
      }
      next_ = end_;
    }

    strings::MutableByteRange range{reinterpret_cast<uint8_t*>(buf_.get()),
                                    /* -1 to allow sentinel */ page_size_ - 1};
    auto s = source_->Read(range);
    if (!s.ok()) {
      status_ = s.status;
      return false;
    }

    // Sources may return short reads, only 0 marks the end of the stream.
    if (s.obj == 0)
      break;
    next_ = buf_.get();
    end_ = next_ + s.obj;
    *end_ = '\n';  // sentinel.
  }

  // The last line without EOL.
  if (use_scratch && !scratch->empty()) {
    if (scratch->back() == '\r')
      scratch->pop_back();
    ++line_num_;
    *result = *scratch;
    return true;
  }
  return false;
}

CsvReader::CsvReader(util::Source* source, char delimiter)
    : reader_(source, TAKE_OWNERSHIP), delimiter_(delimiter) {}

void CsvReader::SkipHeader(unsigned rows) {
  string tmp;
  StringPiece tmp2;
  for (unsigned i = 0; i < rows; ++i) {
    if (!reader_.Next(&tmp2, &tmp))
      return;
  }
}

bool CsvReader::Next(std::vector<StringPiece>* result) {
  StringPiece line;

  while (reader_.Next(&line, &scratch_)) {
    if (absl::StripAsciiWhitespace(line).empty())
      continue;

    // LineReader null-terminates the line, both in its buffer and in the scratch.
    char* ptr = const_cast<char*>(line.data());
    parts_.clear();
    SplitCSVLineWithDelimiter(ptr, delimiter_, &parts_);
    result->assign(parts_.begin(), parts_.end());

    return true;
  }
  return false;
}

}  // namespace file
