#include "launcher.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"

namespace {

constexpr long kMiB = 1024 * 1024;
constexpr int kStatusFd = 3;

// ceil to whole MiB; nsjail takes its size limits in MiB
long ToMiB(long bytes) {
  return (bytes + kMiB - 1) / kMiB;
}

std::string ProtoString(const std::string& str) {
  std::string ret = "\"";
  for (char c : str) {
    switch (c) {
      case '"': ret += "\\\""; break;
      case '\\': ret += "\\\\"; break;
      case '\n': ret += "\\n"; break;
      default: ret += c;
    }
  }
  return ret + "\"";
}

std::string RLimitLine(const char* name, long value) {
  if (value == 0) return fmt::format("{}_type: INF\n", name);
  return fmt::format("{}: {}\n", name, value);
}

// The jail's own mounts, followed by the code and scratch directories
std::vector<MountPoint> BoxMounts(const std::vector<MountPoint>& mounts, const fs::path& box) {
  std::vector<MountPoint> ret = mounts;
  ret.push_back(MountPoint{BoxCodeDir(box).string(), kInsideCodeDir, false, true});
  ret.push_back(MountPoint{BoxScratchDir(box).string(), kInsideScratchDir, true, true});
  return ret;
}

// Create every mount target under the chroot; device nodes need a file to bind onto
bool PrepareChroot(const fs::path& root, const std::vector<MountPoint>& mounts) {
  if (!CreateDirs(root, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec)) {
    return false;
  }
  for (auto& mnt : mounts) {
    fs::path target = root / fs::path(mnt.destination).relative_path();
    std::error_code ec;
    if (fs::is_directory(mnt.source, ec)) {
      if (!CreateDirs(target)) return false;
    } else {
      if (!CreateDirs(target.parent_path())) return false;
      if (!WriteFile(target, "", kPerm644)) return false;
    }
  }
  return true;
}

// Runs in the forked child: report the failing step and errno, then exit
[[noreturn]] void ChildDie(int step) {
  int msg[2] = {step, errno};
  IGNORE_RETURN(write(kStatusFd, msg, sizeof(msg)));
  _exit(127);
}

#define ENUM_CHILD_STEP_ \
  X(PIPE, "pipe") \
  X(DUP, "dup2") \
  X(CHDIR, "chdir") \
  X(RLIMIT, "setrlimit") \
  X(EXEC, "execve")
enum class ChildStep {
#define X(name, desc) name,
  ENUM_CHILD_STEP_
#undef X
};

const char* kChildStepDesc[] = {
#define X(name, desc) desc,
  ENUM_CHILD_STEP_
#undef X
};

// 0 keeps the inherited limit
#define SET_RLIM(res, value) if (value) { \
  struct rlimit rlim; \
  rlim.rlim_cur = rlim.rlim_max = (rlim_t)(value); \
  if (setrlimit(RLIMIT_##res, &rlim) < 0) ChildDie((int)ChildStep::RLIMIT); \
}

} // namespace

bool FilterMounts(const std::vector<MountPoint>& mounts, std::vector<MountPoint>& result, std::string& error) {
  result.clear();
  for (auto& mnt : mounts) {
    std::error_code ec;
    if (fs::exists(mnt.source, ec)) {
      result.push_back(mnt);
    } else if (mnt.required) {
      error = fmt::format("mount source {} does not exist", mnt.source);
      return false;
    } else {
      spdlog::debug("Skip optional mount {}: source missing", mnt.source);
    }
  }
  return true;
}

bool PrepareBox(const fs::path& box, const HarnessedScript& harnessed, std::string& error) {
  fs::path code = BoxCodeDir(box), scratch = BoxScratchDir(box);
  // the sandbox user needs to traverse the box, read code and write scratch
  constexpr fs::perms kTraverse = fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
  constexpr fs::perms kCode = fs::perms::owner_all |
      fs::perms::group_read | fs::perms::group_exec |
      fs::perms::others_read | fs::perms::others_exec;
  if (!CreateDirs(box, kTraverse) ||
      !CreateDirs(code, kCode) ||
      !CreateDirs(scratch, fs::perms::all) ||
      !WriteFile(code / kHarnessName, harnessed.harness_source, kPerm644) ||
      !WriteFile(code / kScriptName, harnessed.script_source, kPerm644)) {
    error = fmt::format("cannot prepare sandbox directory {}", box.c_str());
    return false;
  }
  return true;
}

std::string RenderNsjailConfig(const IsolationPolicy& policy, const std::vector<MountPoint>& mounts, const fs::path& box) {
  std::string ret;
  ret += "name: \"pysandbox\"\n";
  ret += "mode: ONCE\n";
  ret += "hostname: \"sandbox\"\n";
  ret += fmt::format("cwd: {}\n", ProtoString(kInsideScratchDir));
  // backstop only; the supervisor enforces the wall-clock timeout
  ret += fmt::format("time_limit: {}\n", policy.wall_clock_timeout_seconds + 1);
  // stay in the supervisor's process group
  ret += "skip_setsid: true\n";
  ret += "keep_env: false\n";
  ret += fmt::format("keep_caps: {}\n", policy.drop_privileges ? "false" : "true");
  ret += fmt::format("clone_newnet: {}\n", policy.network_isolated ? "true" : "false");
  ret += "mount_proc: false\n";
  ret += RLimitLine("rlimit_as", ToMiB(policy.memory_limit_bytes));
  ret += RLimitLine("rlimit_cpu", policy.cpu_time_limit_seconds);
  ret += RLimitLine("rlimit_fsize", ToMiB(policy.file_size_limit_bytes));
  ret += RLimitLine("rlimit_nproc", policy.process_count_limit);
  ret += "rlimit_core: 0\n";
  if (policy.drop_privileges) {
    ret += fmt::format("uidmap {{\n  inside_id: \"{}\"\n  outside_id: \"{}\"\n  count: 1\n}}\n",
        policy.sandbox_uid, geteuid());
    ret += fmt::format("gidmap {{\n  inside_id: \"{}\"\n  outside_id: \"{}\"\n  count: 1\n}}\n",
        policy.sandbox_gid, getegid());
  }
  for (auto& env : policy.environment) {
    ret += fmt::format("envar: {}\n", ProtoString(env));
  }
  for (auto& mnt : BoxMounts(mounts, box)) {
    ret += fmt::format("mount {{\n  src: {}\n  dst: {}\n  is_bind: true\n  rw: {}\n  mandatory: {}\n}}\n",
        ProtoString(mnt.source), ProtoString(mnt.destination),
        mnt.writable ? "true" : "false", mnt.required ? "true" : "false");
  }
  return ret;
}

SandboxOptions BuildCJailOptions(const IsolationPolicy& policy, const std::vector<MountPoint>& mounts, const fs::path& box) {
  SandboxOptions opt;
  opt.boxdir = BoxChrootDir(box).string();
  opt.command = HarnessCommand(policy.interpreter, kInsideCodeDir,
                               fs::path(kInsideScratchDir) / kResultChannelName);
  opt.envs = policy.environment;
  opt.workdir = kInsideScratchDir;
  if (policy.drop_privileges) {
    opt.uid = policy.sandbox_uid;
    opt.gid = policy.sandbox_gid;
  } else {
    opt.uid = geteuid();
    opt.gid = getegid();
  }
  opt.wall_time = (policy.wall_clock_timeout_seconds + 1) * 1'000'000L;
  opt.cpu_time = policy.cpu_time_limit_seconds * 1'000'000L;
  opt.vss = policy.memory_limit_bytes / 1024;
  opt.proc_num = policy.process_count_limit;
  opt.fsize = policy.file_size_limit_bytes / 1024;
  opt.share_net = !policy.network_isolated;
  for (auto& mnt : BoxMounts(mounts, box)) {
    opt.mounts.push_back(SandboxMount{mnt.source, mnt.destination, mnt.writable});
  }
  return opt;
}

bool BuildInvocation(const IsolationPolicy& policy, const fs::path& box, SandboxInvocation& inv, std::string& error) {
  inv = SandboxInvocation();
  inv.host_result_channel_path = BoxScratchDir(box) / kResultChannelName;
  inv.environment = {"PATH=/usr/local/bin:/usr/bin:/bin"};
  inv.working_directory = box;

  if (policy.tool == IsolationTool::NONE) {
    // the host paths are used directly
    inv.result_channel_path = inv.host_result_channel_path;
    inv.arguments = HarnessCommand(policy.interpreter, BoxCodeDir(box), inv.result_channel_path);
    inv.command = inv.arguments[0];
    inv.environment = policy.environment;
    inv.working_directory = BoxScratchDir(box);
    inv.apply_rlimits = true;
    inv.rlimit_as = policy.memory_limit_bytes;
    inv.rlimit_cpu = policy.cpu_time_limit_seconds;
    inv.rlimit_fsize = policy.file_size_limit_bytes;
    inv.rlimit_nproc = policy.process_count_limit;
    return true;
  }

  std::vector<MountPoint> mounts;
  if (!FilterMounts(policy.mounts, mounts, error)) return false;
  inv.result_channel_path = fs::path(kInsideScratchDir) / kResultChannelName;

  switch (policy.tool) {
    case IsolationTool::NSJAIL: {
      if (!WriteFile(BoxNsjailConfig(box), RenderNsjailConfig(policy, mounts, box), kPerm644)) {
        error = "cannot write nsjail configuration";
        return false;
      }
      inv.command = policy.nsjail_path.string();
      inv.arguments = {
        inv.command, "--config", BoxNsjailConfig(box).string(),
        "--quiet", "--log", BoxNsjailLog(box).string(), "--",
      };
      auto harness = HarnessCommand(policy.interpreter, kInsideCodeDir, inv.result_channel_path);
      inv.arguments.insert(inv.arguments.end(), harness.begin(), harness.end());
      return true;
    }
    case IsolationTool::CJAIL: {
      SandboxOptions opt = BuildCJailOptions(policy, mounts, box);
      auto serial = opt.Serialize();
      if (!PrepareChroot(BoxChrootDir(box), BoxMounts(mounts, box)) ||
          !WriteFile(BoxCJailOptions(box), std::string(serial.begin(), serial.end()),
                     fs::perms::owner_read | fs::perms::owner_write)) {
        error = "cannot prepare cjail box";
        return false;
      }
      inv.command = SandboxExecPath().string();
      inv.arguments = {inv.command, BoxCJailOptions(box).string()};
      return true;
    }
    case IsolationTool::NONE: break;
  }
  __builtin_unreachable();
}

bool StartSandbox(const SandboxInvocation& inv, SpawnedProcess& proc, std::string& error) {
  // no allocation after fork
  std::vector<char*> argv, envp;
  for (auto& i : inv.arguments) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : inv.environment) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
  auto CloseAll = [&]() {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) {
      if (fd >= 0) close(fd);
    }
  };
  if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(status_pipe, O_CLOEXEC) < 0) {
    error = fmt::format("pipe: {}", strerror(errno));
    CloseAll();
    return false;
  }
  spdlog::debug("Launch {}", fmt::join(inv.arguments, " "));

  pid_t pid = fork();
  if (pid < 0) {
    error = fmt::format("fork: {}", strerror(errno));
    CloseAll();
    return false;
  }
  if (pid == 0) {
    setpgid(0, 0);
    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    signal(SIGPIPE, SIG_DFL);
    // fds 0-3 may be any of the pipe ends; move the status pipe out of the way first
    int status_fd = fcntl(status_pipe[1], F_DUPFD_CLOEXEC, 10);
    if (status_fd < 0) _exit(127);
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0 || dup2(devnull, 0) < 0 || dup2(out_pipe[1], 1) < 0 ||
        dup2(err_pipe[1], 2) < 0 || dup2(status_fd, kStatusFd) < 0) {
      IGNORE_RETURN(dup2(status_fd, kStatusFd));
      ChildDie((int)ChildStep::DUP);
    }
    // dup2 onto itself keeps FD_CLOEXEC
    for (int fd = 0; fd < 3; fd++) {
      if (fcntl(fd, F_SETFD, 0) < 0) ChildDie((int)ChildStep::DUP);
    }
    if (fcntl(kStatusFd, F_SETFD, FD_CLOEXEC) < 0 || CloseFrom(kStatusFd + 1) < 0) {
      ChildDie((int)ChildStep::PIPE);
    }
    if (!inv.working_directory.empty() && chdir(inv.working_directory.c_str()) < 0) {
      ChildDie((int)ChildStep::CHDIR);
    }
    if (inv.apply_rlimits) {
      SET_RLIM(AS, inv.rlimit_as);
      SET_RLIM(CPU, inv.rlimit_cpu);
      SET_RLIM(FSIZE, inv.rlimit_fsize);
      SET_RLIM(NPROC, inv.rlimit_nproc);
      struct rlimit no_core = {0, 0};
      if (setrlimit(RLIMIT_CORE, &no_core) < 0) ChildDie((int)ChildStep::RLIMIT);
    }
    execve(inv.command.c_str(), argv.data(), envp.data());
    ChildDie((int)ChildStep::EXEC);
  }

  // also in the parent, so that the group exists before anyone signals it
  if (setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH) {
    spdlog::warn("setpgid {} failed: {}", pid, strerror(errno));
  }
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(status_pipe[1]);
  int msg[2];
  ssize_t sz;
  while ((sz = read(status_pipe[0], msg, sizeof(msg))) < 0 && errno == EINTR);
  close(status_pipe[0]);
  if (sz != 0) {
    if (sz == (ssize_t)sizeof(msg)) {
      error = fmt::format("{} {}: {}", kChildStepDesc[msg[0]], inv.command, strerror(msg[1]));
    } else {
      error = fmt::format("cannot start {}", inv.command);
    }
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    close(out_pipe[0]);
    close(err_pipe[0]);
    return false;
  }
  proc.pid = pid;
  proc.stdout_fd = out_pipe[0];
  proc.stderr_fd = err_pipe[0];
  spdlog::debug("Launched pid={}", pid);
  return true;
}
