#include "utils.h"

#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <thread>
#include <fstream>
#include <sstream>

fs::path TestRoot() {
  static const fs::path root = fs::temp_directory_path() / ("pysandbox_test_" + std::to_string(getpid()));
  return root;
}

fs::path FindPython() {
  std::vector<fs::path> candidates;
  if (const char* env = getenv("PYSANDBOX_TEST_PYTHON"); env && *env) candidates.push_back(env);
  candidates.push_back("/usr/bin/python3");
  candidates.push_back("/usr/local/bin/python3");
  for (auto& i : candidates) {
    if (i.is_absolute() && access(i.c_str(), X_OK) == 0) return i;
  }
  return fs::path();
}

IsolationPolicy LocalPolicy(const fs::path& interpreter) {
  IsolationPolicy policy;
  policy.tool = IsolationTool::NONE;
  policy.interpreter = interpreter;
  policy.box_root = TestRoot() / "box";
  policy.wall_clock_timeout_seconds = 5;
  policy.cpu_time_limit_seconds = 5;
  // RLIMIT_NPROC counts every process of the user running the tests
  policy.process_count_limit = 0;
  policy.kill_grace_period_ms = 200;
  return policy;
}

bool WaitGone(pid_t pid, long timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    waitpid(pid, nullptr, WNOHANG);
    if (kill(pid, 0) < 0 && errno == ESRCH) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

fs::path MakeTempDir(const std::string& name) {
  fs::path ret = TestRoot() / name;
  fs::remove_all(ret);
  fs::create_directories(ret);
  return ret;
}

void WriteText(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  fout << content;
}

std::string ReadText(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  std::stringstream buf;
  buf << fin.rdbuf();
  return buf.str();
}
