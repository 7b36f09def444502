// Copyright 2017, Beeri 15.  All rights reserved.
//
#include <gflags/gflags.h>

#include "base/gtest.h"
#include "base/logging.h"
#include "file/file_util.h"

#include "absl/strings/str_cat.h"

namespace base {

std::string TestTempDir() {
  const char* env = getenv("TEST_TMPDIR");
  std::string root = env && *env ? env : "/tmp";

  const testing::TestInfo* info = testing::UnitTest::GetInstance()->current_test_info();
  std::string name = info ? absl::StrCat(info->test_case_name(), ".", info->name()) : "cinedoc";
  std::string dir = file_util::JoinPath(root, absl::StrCat("cinedoc_test/", name));

  CHECK_STATUS(file_util::DeleteRecursively(dir));
  CHECK(file_util::RecursivelyCreateDir(dir, 0755)) << dir;

  return dir;
}

}  // namespace base

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  return RUN_ALL_TESTS();
}
