#ifndef PATHS_H_
#define PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// where pysandbox-exec is installed; overridden by tests
extern fs::path kDataDir;

} // internal

// Per-request box layout (host side):
//   <box_root>/<pid>_<id>/code/      harness & user script, read-only at /sandbox
//   <box_root>/<pid>_<id>/scratch/   the only writable location, at /tmp
//   <box_root>/<pid>_<id>/root/      chroot for the cjail helper
//   <box_root>/<pid>_<id>/*.cfg      isolation tool configuration
fs::path RequestBoxPath(const fs::path& box_root, long id);
fs::path BoxCodeDir(const fs::path& box);
fs::path BoxScratchDir(const fs::path& box);
fs::path BoxChrootDir(const fs::path& box);
fs::path BoxNsjailConfig(const fs::path& box);
fs::path BoxNsjailLog(const fs::path& box);
fs::path BoxCJailOptions(const fs::path& box);

// Paths as seen by the sandboxed interpreter
extern const char kInsideCodeDir[];
extern const char kInsideScratchDir[];
extern const char kHarnessName[];
extern const char kScriptName[];
extern const char kResultChannelName[];

fs::path SandboxExecPath();

#endif  // PATHS_H_
