// Copyright 2012 Google Inc. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// Author: tomasz.kaftal@gmail.com (Tomasz Kaftal)
//
// File wrapper implementation.
#include "file/file.h"

#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>

#include "absl/strings/str_cat.h"
#include "base/logging.h"

using std::string;
using util::Status;
using util::StatusCode;
using util::StatusObject;
using strings::AsString;

namespace file {

Status StatusFileError() {
  char buf[1024];
  char* result = strerror_r(errno, buf, sizeof(buf));

  return Status(StatusCode::IO_ERROR, result);
}

namespace {

static ssize_t read_all(int fd, uint8* buffer, size_t length, size_t offset) {
  size_t left_to_read = length;
  uint8* curr_buf = buffer;
  while (left_to_read > 0) {
    ssize_t read = pread(fd, curr_buf, left_to_read, offset);
    if (read <= 0) {
      return read == 0 ? length - left_to_read : read;
    }

    curr_buf += read;
    offset += read;
    left_to_read -= read;
  }
  return length;
}

// ----------------- LocalFileImpl --------------------------------------------
// Simple file implementation used for local-machine files.
class LocalFileImpl : public WriteFile {
 public:
  // flags defined at http://man7.org/linux/man-pages/man2/open.2.html
  LocalFileImpl(StringPiece file_name, int flags) : WriteFile(file_name), flags_(flags) {}

  LocalFileImpl(const LocalFileImpl&) = delete;

  virtual ~LocalFileImpl();

  // File handling methods.
  bool Open() final;
  bool Close() final;

  Status Write(const uint8* buffer, uint64 length) final;

 protected:
  int fd_ = -1;
  int flags_;
};

LocalFileImpl::~LocalFileImpl() {}

bool LocalFileImpl::Open() {
  if (fd_ >= 0) {
    LOG(ERROR) << "File already open: " << fd_;
    return false;
  }

  fd_ = open(create_file_name_.c_str(), flags_, 0644);
  if (fd_ < 0) {
    LOG(ERROR) << "Could not open file " << strerror(errno) << " file " << create_file_name_;
    return false;
  }
  return true;
}

bool LocalFileImpl::Close() {
  bool res = true;
  if (fd_ >= 0) {
    res = close(fd_) == 0;
  }
  delete this;
  return res;
}

Status LocalFileImpl::Write(const uint8* buffer, uint64 length) {
  DCHECK(buffer || length == 0);

  uint64 left_to_write = length;
  while (left_to_write > 0) {
    ssize_t written = write(fd_, buffer, left_to_write);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      return StatusFileError();
    }
    buffer += written;
    left_to_write -= written;
  }

  return Status::OK;
}

}  // namespace

WriteFile::WriteFile(StringPiece name) : create_file_name_(AsString(name)) {}

WriteFile::~WriteFile() {}

WriteFile* Open(StringPiece file_name, OpenOptions opts) {
  int flags = O_CREAT | O_WRONLY | O_CLOEXEC;
  if (opts.append)
    flags |= O_APPEND;
  else
    flags |= O_TRUNC;
  WriteFile* ptr = new LocalFileImpl(file_name, flags);
  if (ptr->Open())
    return ptr;
  ptr->Close();  // to delete the object.
  return nullptr;
}

bool Exists(StringPiece fname) {
  return access(AsString(fname).c_str(), F_OK) == 0;
}

bool Delete(StringPiece name) {
  return unlink(AsString(name).c_str()) == 0;
}

Status Rename(StringPiece from, StringPiece to) {
  if (rename(AsString(from).c_str(), AsString(to).c_str()) != 0) {
    Status st = StatusFileError();
    st.AddErrorMsg(StatusCode::IO_ERROR, absl::StrCat("rename ", from, " -> ", to));
    return st;
  }
  return Status::OK;
}

ReadonlyFile::~ReadonlyFile() {}

// pread() based access.
class PosixReadFile final : public ReadonlyFile {
 private:
  int fd_;
  const size_t file_size_;
  bool drop_cache_;

 public:
  PosixReadFile(int fd, size_t sz, int advice, bool drop)
      : fd_(fd), file_size_(sz), drop_cache_(drop) {
    posix_fadvise(fd_, 0, 0, advice);
  }

  virtual ~PosixReadFile() {
    auto st = Close();
    if (!st.ok())
      LOG(WARNING) << st;
  }

  Status Close() override {
    if (fd_ >= 0) {
      if (drop_cache_)
        posix_fadvise(fd_, 0, 0, POSIX_FADV_DONTNEED);
      close(fd_);
      fd_ = -1;
    }
    return Status::OK;
  }

  StatusObject<size_t> Read(size_t offset, const strings::MutableByteRange& range) override {
    if (range.empty())
      return size_t(0);

    if (offset > file_size_) {
      return Status(StatusCode::INTERNAL_ERROR, "Invalid read range");
    }
    ssize_t r = read_all(fd_, range.data(), range.size(), offset);
    if (r < 0) {
      return StatusFileError();
    }
    return size_t(r);
  }

  size_t Size() const final { return file_size_; }
};

StatusObject<ReadonlyFile*> ReadonlyFile::Open(StringPiece name, const Options& opts) {
  string fname = AsString(name);
  int fd = open(fname.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    Status st = StatusFileError();
    st.AddErrorMsg(StatusCode::IO_ERROR, fname);
    return st;
  }
  struct stat sb;
  if (fstat(fd, &sb) < 0) {
    close(fd);
    return StatusFileError();
  }
  if (S_ISDIR(sb.st_mode)) {
    close(fd);
    return Status(StatusCode::IO_ERROR, absl::StrCat(fname, " is a directory"));
  }

  int advice = opts.sequential ? POSIX_FADV_SEQUENTIAL : POSIX_FADV_NORMAL;
  return static_cast<ReadonlyFile*>(new PosixReadFile(fd, sb.st_size, advice,
                                                      opts.drop_cache_on_close));
}

}  // namespace file

namespace std {

void default_delete<::file::WriteFile>::operator()(::file::WriteFile* ptr) const {
  ptr->Close();
}

}  // namespace std
