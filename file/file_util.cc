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
// Modified by Roman Gershman (romange@gmail.com)
// File management utilities' implementation.

#include "file/file_util.h"

#include <dirent.h>
#include <fcntl.h>
#include <glob.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wordexp.h>

#include <memory>
#include <vector>

#include "absl/strings/str_cat.h"
#include "base/logging.h"

using std::string;
using std::vector;
using strings::AsString;
using util::Status;
using util::StatusCode;

namespace file_util {

static string error_str(int err) {
  string buf(512, '\0');
  char* result = strerror_r(err, &buf.front(), buf.size());
  return string(result);
}

string JoinPath(StringPiece dirname, StringPiece basename) {
  if ((!basename.empty() && basename[0] == '/') || dirname.empty()) {
    return AsString(basename);
  } else if (dirname[dirname.size() - 1] == '/') {
    return absl::StrCat(dirname, basename);
  } else {
    return absl::StrCat(dirname, "/", basename);
  }
}

StringPiece GetNameFromPath(StringPiece path) {
  size_t file_name_pos = path.rfind('/');
  if (file_name_pos == StringPiece::npos) {
    return path;
  }
  return path.substr(file_name_pos + 1);
}

StringPiece DirName(StringPiece path) {
  size_t file_name_pos = path.rfind('/');
  if (file_name_pos == StringPiece::npos) {
    return path;
  }
  return path.substr(0, file_name_pos);
}

bool ReadFileToString(StringPiece name, string* output) {
  auto res = file::ReadonlyFile::Open(name);
  if (!res.ok())
    return false;

  std::unique_ptr<file::ReadonlyFile> fl(res.obj);

  size_t sz = fl->Size();
  output->resize(sz);
  if (sz == 0)
    return fl->Close().ok();

  auto status = fl->Read(0, strings::AsMutableByteRange(*output));
  if (!status.ok())
    return false;
  output->resize(status.obj);

  return fl->Close().ok();
}

Status WriteStringToFile(StringPiece contents, StringPiece name) {
  file::WriteFile* fl = file::Open(name);
  if (!fl) {
    return Status(StatusCode::IO_ERROR, absl::StrCat("Could not open ", name));
  }
  Status st = fl->Write(contents);
  if (!fl->Close() && st.ok()) {
    st = file::StatusFileError();
  }
  return st;
}

bool CreateDir(StringPiece name, int mode) { return mkdir(AsString(name).c_str(), mode) == 0; }

bool RecursivelyCreateDir(StringPiece path, int mode) {
  if (CreateDir(path, mode))
    return true;

  struct stat st;
  if (stat(AsString(path).c_str(), &st) == 0)
    return S_ISDIR(st.st_mode);

  // Try creating the parent.
  string::size_type slashpos = path.rfind('/');
  if (slashpos == string::npos || slashpos == 0) {
    // No parent given.
    return false;
  }

  return RecursivelyCreateDir(path.substr(0, slashpos), mode) && CreateDir(path, mode);
}

Status DeleteRecursively(StringPiece name) {
  // lstat = Don't follow symbolic links.
  string path = AsString(name);
  struct stat stats;
  if (lstat(path.c_str(), &stats) != 0) {
    if (errno == ENOENT)
      return Status::OK;
    return Status(StatusCode::IO_ERROR, absl::StrCat(path, ": ", error_str(errno)));
  }

  if (S_ISDIR(stats.st_mode)) {
    DIR* dir = opendir(path.c_str());
    if (dir == NULL) {
      return Status(StatusCode::IO_ERROR, absl::StrCat(path, ": ", error_str(errno)));
    }
    Status res;
    while (true) {
      struct dirent* entry = readdir(dir);
      if (entry == NULL)
        break;
      string entry_name = entry->d_name;
      if (entry_name != "." && entry_name != "..") {
        res.AddError(DeleteRecursively(JoinPath(path, entry_name)));
      }
    }
    closedir(dir);
    RETURN_IF_ERROR(res);

    if (rmdir(path.c_str()) != 0) {
      return Status(StatusCode::IO_ERROR, absl::StrCat("rmdir ", path, ": ", error_str(errno)));
    }
  } else if (remove(path.c_str()) != 0) {
    return Status(StatusCode::IO_ERROR, absl::StrCat("remove ", path, ": ", error_str(errno)));
  }
  return Status::OK;
}

string ExpandPath(StringPiece path) {
  wordexp_t p;
  string src = AsString(path);
  if (wordexp(src.c_str(), &p, WRDE_NOCMD) != 0)
    return src;

  string res = p.we_wordc > 0 ? string(p.we_wordv[0]) : src;
  if (p.we_wordc > 1) {
    LOG(WARNING) << path << " expands to " << p.we_wordc << " paths, using the first one";
  }
  wordfree(&p);

  return res;
}

// callback funcion for use of glob() at following StatFiles() functions.
static int errfunc(const char* epath, int eerrno) {
  LOG(ERROR) << "Error in glob() path: <" << epath << ">. errno: " << eerrno;
  return 0;
}

// glob(3) returns the paths sorted unless GLOB_NOSORT is given.
Status StatFilesSafe(StringPiece path, std::vector<StatShort>* res) {
  CHECK_NOTNULL(res);
  glob_t glob_result;
  string pattern = AsString(path);
  int rv = glob(pattern.c_str(), GLOB_TILDE_CHECK, errfunc, &glob_result);
  if (rv && rv != GLOB_NOMATCH) {
    globfree(&glob_result);
    return Status(StatusCode::IO_ERROR, absl::StrCat("glob ", pattern, " failed with ", rv));
  }

  struct stat statbuf;
  for (size_t i = 0; i < glob_result.gl_pathc; i++) {
    if (stat(glob_result.gl_pathv[i], &statbuf) == 0) {
      StatShort sshort{glob_result.gl_pathv[i], statbuf.st_mtime, statbuf.st_size,
                       statbuf.st_mode};
      res->emplace_back(std::move(sshort));
    } else {
      LOG(WARNING) << "Bad stat for " << glob_result.gl_pathv[i];
    }
  }
  globfree(&glob_result);
  return Status::OK;
}

}  // namespace file_util
