// Copyright 2017, Beeri 15.  All rights reserved.
//
#include "base/init.h"
#include "base/logging.h"

#undef MainInitGuard

MainInitGuard::MainInitGuard(int* argc, char*** argv) {
  google::ParseCommandLineFlags(argc, argv, true);
  google::InitGoogleLogging((*argv)[0]);

#if defined NDEBUG
  LOG(INFO) << (*argv)[0] << " running in opt mode.";
#else
  LOG(INFO) << (*argv)[0] << " running in debug mode.";
#endif
}

MainInitGuard::~MainInitGuard() {
  google::ShutdownGoogleLogging();
}
