#include "paths.h"

#include <unistd.h>
#include <string>

namespace internal {
fs::path kDataDir = fs::path(PYSANDBOX_DATA_DIR);
} // internal

const char kInsideCodeDir[] = "/sandbox";
const char kInsideScratchDir[] = "/tmp";
const char kHarnessName[] = "harness.py";
const char kScriptName[] = "script.py";
const char kResultChannelName[] = ".pysandbox_result.json";

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

} // namespace

fs::path RequestBoxPath(const fs::path& box_root, long id) {
  return box_root / (std::to_string(getpid()) + "_" + PadInt(id, 6));
}

fs::path BoxCodeDir(const fs::path& box) {
  return box / "code";
}
fs::path BoxScratchDir(const fs::path& box) {
  return box / "scratch";
}
fs::path BoxChrootDir(const fs::path& box) {
  return box / "root";
}
fs::path BoxNsjailConfig(const fs::path& box) {
  return box / "nsjail.cfg";
}
fs::path BoxNsjailLog(const fs::path& box) {
  return box / "nsjail.log";
}
fs::path BoxCJailOptions(const fs::path& box) {
  return box / "cjail.opt";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "pysandbox-exec";
}
