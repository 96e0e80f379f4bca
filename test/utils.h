#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <filesystem>
#include <sys/types.h>

#include <gtest/gtest.h>
#include <pysandbox/policy.h>

namespace fs = std::filesystem;

// all boxes and scratch files of the test run live here
fs::path TestRoot();

// absolute path of a python3 interpreter, empty if none is installed
// (PYSANDBOX_TEST_PYTHON overrides the search)
fs::path FindPython();

// tool "none" with short limits, boxes under TestRoot()
IsolationPolicy LocalPolicy(const fs::path& interpreter);

// wait until no process pid exists, reaping it if it was reparented to us
bool WaitGone(pid_t pid, long timeout_ms = 3000);

// a fresh empty directory under TestRoot()
fs::path MakeTempDir(const std::string& name);

void WriteText(const fs::path&, const std::string&);
std::string ReadText(const fs::path&);

#define REQUIRE_PYTHON(var) \
  fs::path var = FindPython(); \
  if (var.empty()) GTEST_SKIP() << "python3 not available"

#endif // TEST_UTILS_H_
