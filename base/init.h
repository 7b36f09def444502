// Copyright 2017, Beeri 15.  All rights reserved.
//
#pragma once

#include <gflags/gflags.h>

// Parses command line flags and initializes glog. Must be the first object created in main().
class MainInitGuard {
 public:
  MainInitGuard(int* argc, char*** argv);
  ~MainInitGuard();

  MainInitGuard(const MainInitGuard&) = delete;
  void operator=(const MainInitGuard&) = delete;
};

#define MainInitGuard(x, y) static_assert(false, "Forgot variable name")
