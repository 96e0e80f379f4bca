#ifndef SUPERVISOR_H_
#define SUPERVISOR_H_

#include <string>
#include <chrono>
#include <sys/types.h>

#include "launcher.h"

#define ENUM_SUPERVISOR_STATE_ \
  X(NOT_STARTED) /* launch failed */ \
  X(COMPLETED) /* exited on its own */ \
  X(KILLED) /* terminated by a signal we did not send */ \
  X(TIMED_OUT)
enum class SupervisorState {
#define X(name) name,
  ENUM_SUPERVISOR_STATE_
#undef X
};

const char* SupervisorStateName(SupervisorState);

// What was observed about one sandboxed run, before any interpretation
struct SandboxOutcome {
  SupervisorState state;
  int exit_code; // 128+N if killed by signal N
  int term_signal; // 0 if not killed
  std::string output, error_output;
  bool output_truncated, error_truncated;
  std::string channel_payload;
  bool has_channel_payload;
  std::string launch_error;
  pid_t pgid;
  long elapsed_ms;

  SandboxOutcome() :
      state(SupervisorState::NOT_STARTED),
      exit_code(-1), term_signal(0),
      output_truncated(false), error_truncated(false),
      has_channel_payload(false),
      pgid(-1), elapsed_ms(0) {}

  bool LaunchFailed() const { return state == SupervisorState::NOT_STARTED; }
  bool TimedOut() const { return state == SupervisorState::TIMED_OUT; }
};

struct SupervisorLimits {
  std::chrono::milliseconds timeout;
  std::chrono::milliseconds kill_grace;
  // per stream; stderr also keeps the last 64 KiB past the cap, joined to
  // the head at a line boundary
  size_t max_capture;
};

// Wait for the process started by StartSandbox while draining its output.
// At the deadline the whole process group gets SIGTERM, then SIGKILL after
// the grace period. When this returns, the group has been sent SIGKILL and
// the leader has been reaped; the pipe fds in proc are closed.
SandboxOutcome Supervise(SpawnedProcess& proc, const SupervisorLimits&);

#endif  // SUPERVISOR_H_
