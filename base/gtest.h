// Copyright 2017, Beeri 15.  All rights reserved.
//
#pragma once

#include <gtest/gtest.h>

#include <string>

namespace base {

// Returns a fresh directory under TEST_TMPDIR (or /tmp) named after the running test.
// The directory is emptied if it exists.
std::string TestTempDir();

}  // namespace base
