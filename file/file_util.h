// Copyright 2016, Beeri 15.  All rights reserved.
//
#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "file/file.h"

namespace file_util {

struct StatShort {
  std::string name;
  time_t last_modified;
  off_t size;
  mode_t st_mode;
};

// Join two path components, adding a slash if necessary.  If basename is an
// absolute path then JoinPath ignores dirname and simply returns basename.
std::string JoinPath(StringPiece dirname, StringPiece basename);

// Retrieve file name from a path. If path dosnt's contain dir returns the path itself.
StringPiece GetNameFromPath(StringPiece path);

StringPiece DirName(StringPiece path);

// Read an entire file to a std::string.  Return true if successful, false
// otherwise.
bool ReadFileToString(StringPiece name, std::string* output);

// Creates a file and writes contents into it. Overwrites existing files.
util::Status WriteStringToFile(StringPiece contents, StringPiece name);

// Create a directory.
bool CreateDir(StringPiece name, int mode);

// Create a directory and all parent directories if necessary.
// Returns true if the directory exists when the call returns.
bool RecursivelyCreateDir(StringPiece path, int mode);

// If "name" is a file, we delete it.  If it is a directory, we
// call DeleteRecursively() for each file or directory (other than
// dot and double-dot) within it, and then delete the directory itself.
util::Status DeleteRecursively(StringPiece name);

// Expands path according to sh rules using wordexp. Does not check the existence of the files.
std::string ExpandPath(StringPiece path);

// Uses glob rules for local file system. Returns files that exists, sorted by name.
util::Status StatFilesSafe(StringPiece path, std::vector<StatShort>* res);

}  // namespace file_util
