#include <pysandbox/execution.h>

#include <spdlog/spdlog.h>

#include <pysandbox/policy.h>
#include "classifier.h"
#include "harness.h"
#include "launcher.h"
#include "paths.h"
#include "supervisor.h"
#include "utils.h"

namespace {

SupervisorLimits LimitsFromPolicy(const IsolationPolicy& policy) {
  SupervisorLimits ret;
  ret.timeout = std::chrono::seconds(policy.wall_clock_timeout_seconds);
  ret.kill_grace = std::chrono::milliseconds(policy.kill_grace_period_ms);
  ret.max_capture = policy.max_captured_output_bytes;
  return ret;
}

SandboxOutcome RunInBox(const ExecutionRequest& req, const IsolationPolicy& policy, const fs::path& box) {
  SandboxOutcome ret;
  SandboxInvocation inv;
  SpawnedProcess proc;
  if (!PrepareBox(box, BuildHarness(req.script), ret.launch_error) ||
      !BuildInvocation(policy, box, inv, ret.launch_error) ||
      !StartSandbox(inv, proc, ret.launch_error)) {
    spdlog::warn("Sandbox launch failed: {}", ret.launch_error);
    return ret;
  }
  ret = Supervise(proc, LimitsFromPolicy(policy));
  // a timed-out run may have left a partial or forged channel behind
  if (!ret.TimedOut()) {
    ret.has_channel_payload = ReadFile(inv.host_result_channel_path, ret.channel_payload);
  }
  return ret;
}

} // namespace

ErrorCategory ExecutionOutcome::Category() const {
  return ErrorKindCategory(kind);
}

nlohmann::json ExecutionOutcome::ToJson() const {
  if (Success()) return {{"stdout", output}, {"result", result}};
  return {{"error", message}, {"error_type", ErrorKindName(kind)}, {"stdout", output}};
}

ExecutionOutcome ExecutionOutcome::Ok(std::string output, nlohmann::json result) {
  ExecutionOutcome ret;
  ret.output = std::move(output);
  ret.result = std::move(result);
  return ret;
}

ExecutionOutcome ExecutionOutcome::Error(ErrorKind kind, std::string message, std::string output) {
  ExecutionOutcome ret;
  ret.kind = kind;
  ret.message = std::move(message);
  ret.output = std::move(output);
  return ret;
}

bool ValidateScript(const std::string& script, std::string& message) {
  if (script.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    message = "script must not be empty";
    return false;
  }
  return true;
}

ExecutionOutcome Execute(const ExecutionRequest& req, const IsolationPolicy& policy) {
  std::string message;
  if (!ValidateScript(req.script, message)) {
    return ExecutionOutcome::Error(ErrorKind::VALIDATION, message);
  }
  long id = GetUniqueRequestId();
  fs::path box = RequestBoxPath(policy.box_root, id);
  spdlog::info("Execute request {}: tool={} script={}B box={}",
      id, IsolationToolName(policy.tool), req.script.size(), box.c_str());

  SandboxOutcome outcome = RunInBox(req, policy, box);
  ExecutionOutcome ret = Classify(outcome);
  RemoveAll(box);

  if (ret.Success()) {
    spdlog::info("Request {} finished in {}ms, stdout {}B", id, outcome.elapsed_ms, ret.output.size());
  } else {
    spdlog::info("Request {} failed in {}ms: {} [{}] ({})", id, outcome.elapsed_ms,
        ErrorKindName(ret.kind), ErrorCategoryName(ret.Category()), SupervisorStateName(outcome.state));
    spdlog::debug("Request {} error message: {}", id, ret.message);
  }
  if (outcome.output_truncated || outcome.error_truncated) {
    spdlog::info("Request {} output truncated (stdout={}, stderr={})", id,
        outcome.output_truncated, outcome.error_truncated);
  }
  return ret;
}
