#ifndef INCLUDE_PYSANDBOX_POLICY_H_
#define INCLUDE_PYSANDBOX_POLICY_H_

#include <string>
#include <vector>
#include <filesystem>

#define ENUM_ISOLATION_TOOL_ \
  X(NSJAIL, "nsjail") \
  X(CJAIL, "cjail") \
  X(NONE, "none") /* development only: no namespaces, rlimits only */
enum class IsolationTool {
#define X(name, confname) name,
  ENUM_ISOLATION_TOOL_
#undef X
};

struct MountPoint {
  std::string source, destination;
  bool writable;
  bool required; // fail the launch if source is missing
};

// Loaded once at startup and shared read-only by every request.
class IsolationPolicy {
 public:
  IsolationTool tool;
  std::filesystem::path nsjail_path;
  std::filesystem::path interpreter;
  std::filesystem::path box_root;

  // resource ceilings; 0 = unlimited
  long memory_limit_bytes;
  long cpu_time_limit_seconds;
  long file_size_limit_bytes;
  long process_count_limit;
  long wall_clock_timeout_seconds; // must be positive

  std::vector<MountPoint> mounts;
  std::vector<std::string> environment; // KEY=VALUE
  bool network_isolated;
  bool drop_privileges;
  int sandbox_uid, sandbox_gid;

  long kill_grace_period_ms;
  long max_captured_output_bytes;

  IsolationPolicy();

  static std::vector<MountPoint> DefaultMounts();
  static std::vector<std::string> DefaultEnvironment();
};

// Settings of the outer service; they share the configuration file with the policy.
struct ServiceConfig {
  std::string listen_host;
  int listen_port;
  int http_threads;

  ServiceConfig() : listen_host("0.0.0.0"), listen_port(8080), http_threads(8) {}
};

// Missing file -> defaults (returns true). Parse or validation errors are logged, return false.
bool LoadPolicy(const std::filesystem::path& conf_path, IsolationPolicy& policy, ServiceConfig& service);
bool ValidatePolicy(const IsolationPolicy&, std::string& message);

#endif  // INCLUDE_PYSANDBOX_POLICY_H_
