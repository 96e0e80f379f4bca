#include <pysandbox/policy.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

constexpr long kMiB = 1024 * 1024;
constexpr size_t kMaxNumberedSections = 256;

// [mount.0], [mount.1], ... up to the first missing index
std::vector<MountPoint> ReadMounts(tortellini::ini& ini) {
  std::vector<MountPoint> ret;
  for (size_t i = 0; i < kMaxNumberedSections; i++) {
    auto section = ini["mount." + std::to_string(i)];
    std::string src = section["src"] | "";
    std::string dst = section["dst"] | "";
    if (src.empty() && dst.empty()) break;
    MountPoint mnt;
    mnt.source = src;
    mnt.destination = dst.empty() ? src : dst;
    mnt.writable = section["rw"] | false;
    mnt.required = section["mandatory"] | true;
    ret.push_back(mnt);
  }
  return ret;
}

std::vector<std::string> ReadEnvironment(tortellini::ini& ini) {
  std::vector<std::string> ret;
  for (size_t i = 0; i < kMaxNumberedSections; i++) {
    std::string value = ini["env." + std::to_string(i)]["value"] | "";
    if (value.empty()) break;
    ret.push_back(value);
  }
  return ret;
}

} // namespace

IsolationPolicy::IsolationPolicy() :
    tool(IsolationTool::NSJAIL),
    nsjail_path("/usr/local/bin/nsjail"),
    interpreter("/usr/bin/python3"),
    box_root("/tmp/pysandbox_box"),
    memory_limit_bytes(512 * kMiB),
    cpu_time_limit_seconds(10),
    file_size_limit_bytes(1 * kMiB),
    process_count_limit(1),
    wall_clock_timeout_seconds(15),
    mounts(DefaultMounts()),
    environment(DefaultEnvironment()),
    network_isolated(true),
    drop_privileges(true),
    sandbox_uid(65534), sandbox_gid(65534),
    kill_grace_period_ms(500),
    max_captured_output_bytes(1 * kMiB) {}

std::vector<MountPoint> IsolationPolicy::DefaultMounts() {
  return {
    {"/bin", "/bin", false, true},
    {"/lib", "/lib", false, true},
    {"/lib64", "/lib64", false, false},
    {"/usr/bin", "/usr/bin", false, true},
    {"/usr/lib", "/usr/lib", false, true},
    {"/usr/local/lib", "/usr/local/lib", false, false},
    {"/usr/local/bin", "/usr/local/bin", false, false},
    {"/dev/null", "/dev/null", false, true},
    {"/dev/urandom", "/dev/urandom", false, true},
    {"/dev/zero", "/dev/zero", false, true},
  };
}

std::vector<std::string> IsolationPolicy::DefaultEnvironment() {
  return {
    "LD_LIBRARY_PATH=/usr/local/lib:/usr/lib:/lib",
    "MPLBACKEND=Agg",
    "MPLCONFIGDIR=/tmp/matplotlib",
    "HOME=/tmp",
    "PYTHONIOENCODING=utf-8",
  };
}

bool LoadPolicy(const fs::path& conf_path, IsolationPolicy& policy, ServiceConfig& service) {
  std::error_code ec;
  if (!fs::exists(conf_path, ec)) {
    spdlog::info("Configuration file {} not found, using defaults", conf_path.c_str());
    return true;
  }
  std::ifstream fin(conf_path);
  if (!fin) {
    spdlog::error("Cannot open configuration file {}", conf_path.c_str());
    return false;
  }
  tortellini::ini ini;
  fin >> ini;

  auto global = ini[""];
  std::string tool = global["isolation_tool"] | IsolationToolName(policy.tool);
  if (!GetIsolationTool(tool, policy.tool)) {
    spdlog::error("Unknown isolation_tool {}", tool);
    return false;
  }
  policy.nsjail_path = global["nsjail_path"] | policy.nsjail_path.string();
  policy.interpreter = global["interpreter"] | policy.interpreter.string();
  policy.box_root = global["box_root"] | policy.box_root.string();
  policy.memory_limit_bytes = (global["memory_limit_mb"] | (policy.memory_limit_bytes / kMiB)) * kMiB;
  policy.cpu_time_limit_seconds = global["cpu_time_limit_s"] | policy.cpu_time_limit_seconds;
  policy.file_size_limit_bytes = (global["file_size_limit_mb"] | (policy.file_size_limit_bytes / kMiB)) * kMiB;
  policy.process_count_limit = global["process_count_limit"] | policy.process_count_limit;
  policy.wall_clock_timeout_seconds = global["wall_clock_timeout_s"] | policy.wall_clock_timeout_seconds;
  policy.network_isolated = global["network_isolated"] | policy.network_isolated;
  policy.drop_privileges = global["drop_privileges"] | policy.drop_privileges;
  policy.sandbox_uid = global["sandbox_uid"] | policy.sandbox_uid;
  policy.sandbox_gid = global["sandbox_gid"] | policy.sandbox_gid;
  policy.kill_grace_period_ms = global["kill_grace_period_ms"] | policy.kill_grace_period_ms;
  policy.max_captured_output_bytes =
      (global["max_captured_output_kb"] | (policy.max_captured_output_bytes / 1024)) * 1024;

  service.listen_host = global["listen_host"] | service.listen_host;
  service.listen_port = global["listen_port"] | service.listen_port;
  service.http_threads = global["http_threads"] | service.http_threads;

  if (auto mounts = ReadMounts(ini); !mounts.empty()) policy.mounts = std::move(mounts);
  if (auto envs = ReadEnvironment(ini); !envs.empty()) policy.environment = std::move(envs);

  std::string message;
  if (!ValidatePolicy(policy, message)) {
    spdlog::error("Invalid configuration in {}: {}", conf_path.c_str(), message);
    return false;
  }
  return true;
}

bool ValidatePolicy(const IsolationPolicy& policy, std::string& message) {
  if (policy.wall_clock_timeout_seconds <= 0) {
    message = "wall_clock_timeout_s must be positive";
    return false;
  }
  if (policy.memory_limit_bytes < 0 || policy.cpu_time_limit_seconds < 0 ||
      policy.file_size_limit_bytes < 0 || policy.process_count_limit < 0) {
    message = "resource limits must not be negative";
    return false;
  }
  if (policy.kill_grace_period_ms < 0) {
    message = "kill_grace_period_ms must not be negative";
    return false;
  }
  if (policy.max_captured_output_bytes <= 0) {
    message = "max_captured_output_kb must be positive";
    return false;
  }
  if (policy.box_root.empty() || !policy.interpreter.is_absolute()) {
    message = "box_root must be set and interpreter must be an absolute path";
    return false;
  }
  for (auto& mnt : policy.mounts) {
    if (mnt.source.empty()) {
      message = "mount without src";
      return false;
    }
    fs::path dst = mnt.destination;
    if (!dst.is_absolute() || dst.lexically_normal() == "/") {
      message = "mount destination " + mnt.destination + " must be an absolute path below /";
      return false;
    }
    // these two are always provided per request
    if (dst.lexically_normal() == "/sandbox" || dst.lexically_normal() == "/tmp") {
      message = "mount destination " + mnt.destination + " is reserved";
      return false;
    }
  }
  for (auto& env : policy.environment) {
    if (env.find('=') == std::string::npos || env.front() == '=') {
      message = "environment entry " + env + " is not KEY=VALUE";
      return false;
    }
  }
  return true;
}
