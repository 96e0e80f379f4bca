#ifndef LAUNCHER_H_
#define LAUNCHER_H_

#include <string>
#include <vector>
#include <filesystem>
#include <sys/types.h>

#include <pysandbox/policy.h>

#include "harness.h"
#include "sandbox.h"

namespace fs = std::filesystem;

// One isolation-tool run; owned by the caller of StartSandbox for one request.
struct SandboxInvocation {
  std::string command;
  std::vector<std::string> arguments; // including argv[0]
  std::vector<std::string> environment; // of the launched process itself
  fs::path working_directory;
  fs::path result_channel_path; // as seen by the interpreter
  fs::path host_result_channel_path;

  // only for IsolationTool::NONE; other tools apply limits inside the jail
  bool apply_rlimits;
  long rlimit_as, rlimit_cpu, rlimit_fsize, rlimit_nproc; // bytes / seconds / count; 0 = unlimited

  SandboxInvocation() :
      apply_rlimits(false),
      rlimit_as(0), rlimit_cpu(0), rlimit_fsize(0), rlimit_nproc(0) {}
};

struct SpawnedProcess {
  pid_t pid; // also the process group id
  int stdout_fd, stderr_fd;

  SpawnedProcess() : pid(-1), stdout_fd(-1), stderr_fd(-1) {}
};

// Drop optional mounts whose source is missing; false if a required one is missing
bool FilterMounts(const std::vector<MountPoint>& mounts, std::vector<MountPoint>& result, std::string& error);

// Write harness and script into the box and create the scratch directory
bool PrepareBox(const fs::path& box, const HarnessedScript&, std::string& error);

// Render the nsjail text-format configuration for one request
std::string RenderNsjailConfig(const IsolationPolicy&, const std::vector<MountPoint>& mounts, const fs::path& box);
SandboxOptions BuildCJailOptions(const IsolationPolicy&, const std::vector<MountPoint>& mounts, const fs::path& box);

// Build the invocation for policy.tool and write whatever configuration
// the isolation tool reads into the box.
bool BuildInvocation(const IsolationPolicy&, const fs::path& box, SandboxInvocation&, std::string& error);

// fork & exec the isolation tool in a new process group, stdin = /dev/null,
// stdout/stderr connected to pipes. exec failures are reported here, not as exit codes.
bool StartSandbox(const SandboxInvocation&, SpawnedProcess&, std::string& error);

#endif  // LAUNCHER_H_
