#include "classifier.h"

#include <set>

#include <fmt/format.h>

#include "utils.h"

namespace {

const char kTimeoutMessage[] = "Script execution timed out.";
const char kNoResultMessage[] = "entry point finished without producing a result";

bool IsSpace(char c) {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

std::string Trim(const std::string& str) {
  size_t l = 0, r = str.size();
  while (l < r && IsSpace(str[l])) l++;
  while (r > l && IsSpace(str[r - 1])) r--;
  return str.substr(l, r - l);
}

ErrorKind TagKind(HarnessTag tag) {
  switch (tag) {
    case HarnessTag::SYNTAX_ERROR: return ErrorKind::SYNTAX;
    case HarnessTag::MISSING_ENTRYPOINT: return ErrorKind::MISSING_ENTRYPOINT;
    case HarnessTag::NOT_SERIALIZABLE: return ErrorKind::NON_SERIALIZABLE_RETURN;
    case HarnessTag::RUNTIME_ERROR:
    case HarnessTag::STARTED: break;
  }
  return ErrorKind::RUNTIME;
}

std::string RuntimeMessage(const SandboxOutcome& outcome, const std::string& error_output) {
  std::string tail = StderrTail(error_output);
  if (outcome.term_signal) {
    std::string sig = "Killed by " + SignalName(outcome.term_signal);
    return tail.empty() ? sig : sig + ": " + tail;
  }
  if (tail.empty()) return fmt::format("Script exited with status {}", outcome.exit_code);
  return tail;
}

} // namespace

DiagnosticScan ScanDiagnostics(const std::string& error_output) {
  DiagnosticScan ret;
  size_t pos = 0;
  while (pos < error_output.size()) {
    size_t end = error_output.find('\n', pos);
    size_t next = end == std::string::npos ? error_output.size() : end + 1;
    std::string line = error_output.substr(pos, next - pos);
    if (!line.empty() && line.back() == '\n') line.pop_back();
    HarnessDiagnostic diag;
    if (!ParseDiagnostic(line, diag)) {
      ret.error_output += error_output.substr(pos, next - pos);
    } else if (diag.tag == HarnessTag::STARTED) {
      ret.started = true;
    } else {
      ret.terminal.push_back(std::move(diag));
    }
    pos = next;
  }
  return ret;
}

std::string StderrTail(const std::string& text, size_t max_bytes) {
  std::string str = Trim(text);
  if (str.size() <= max_bytes) return str;
  size_t start = str.size() - max_bytes;
  size_t newline = str.find('\n', start);
  if (newline != std::string::npos && newline + 1 < str.size()) start = newline + 1;
  return Trim(str.substr(start));
}

ExecutionOutcome Classify(const SandboxOutcome& outcome) {
  if (outcome.LaunchFailed()) {
    return ExecutionOutcome::Error(ErrorKind::SANDBOX_LAUNCH,
        "Failed to start the sandbox: " + outcome.launch_error, outcome.output);
  }
  if (outcome.TimedOut()) {
    return ExecutionOutcome::Error(ErrorKind::TIMEOUT, kTimeoutMessage, outcome.output);
  }
  DiagnosticScan scan = ScanDiagnostics(outcome.error_output);
  if (outcome.state == SupervisorState::COMPLETED && outcome.exit_code == 0) {
    if (outcome.has_channel_payload) {
      auto result = nlohmann::json::parse(outcome.channel_payload, nullptr, false);
      if (!result.is_discarded()) return ExecutionOutcome::Ok(outcome.output, std::move(result));
    }
    return ExecutionOutcome::Error(ErrorKind::RUNTIME, kNoResultMessage, outcome.output);
  }
  if (!scan.started) {
    std::string detail = StderrTail(scan.error_output);
    if (detail.empty()) detail = fmt::format("isolation tool exited with status {}", outcome.exit_code);
    return ExecutionOutcome::Error(ErrorKind::SANDBOX_LAUNCH,
        "Failed to start the sandbox: " + detail, outcome.output);
  }
  std::set<HarnessTag> tags;
  for (auto& i : scan.terminal) tags.insert(i.tag);
  if (tags.size() == 1) {
    ErrorKind kind = TagKind(scan.terminal.front().tag);
    if (kind != ErrorKind::RUNTIME) {
      return ExecutionOutcome::Error(kind, scan.terminal.front().message, outcome.output);
    }
  }
  return ExecutionOutcome::Error(ErrorKind::RUNTIME, RuntimeMessage(outcome, scan.error_output), outcome.output);
}
