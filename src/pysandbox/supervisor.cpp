#include "supervisor.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

using Clock = std::chrono::steady_clock;
constexpr long kPollIntervalMs = 20;
// after the final SIGKILL, how long to wait for the pipes to reach EOF
constexpr long kDrainMs = 1000;
// stderr past the capture limit: this much of the end is kept, so the
// harness diagnostic written last is never cut off
constexpr size_t kErrorTailBytes = 64 * 1024;

static const char* kSupervisorStateNameTable[] = {
#define X(name) #name,
  ENUM_SUPERVISOR_STATE_
#undef X
};

struct Stream {
  int fd;
  std::string* buf;
  bool* truncated;
  bool keep_tail;
  std::string tail; // bytes after the cap, at most 2*kErrorTailBytes
  bool tail_cut; // tail no longer follows buf directly

  Stream(int fd, std::string* buf, bool* truncated, bool keep_tail) :
      fd(fd), buf(buf), truncated(truncated), keep_tail(keep_tail), tail_cut(false) {}
};

long MillisecondsUntil(Clock::time_point tp) {
  auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(tp - Clock::now()).count();
  return std::max<long>(diff, 0);
}

void KeepTail(Stream& s, const char* data, size_t len) {
  s.tail.append(data, len);
  if (s.tail.size() <= 2 * kErrorTailBytes) return;
  // restart at a line boundary so a partial line is not glued to the head
  size_t cut = s.tail.size() - kErrorTailBytes;
  size_t newline = s.tail.find('\n', cut);
  if (newline != std::string::npos) cut = newline + 1;
  s.tail.erase(0, cut);
  s.tail_cut = true;
}

// false on EOF or a read error
bool Drain(Stream& s, size_t max_capture) {
  char buf[65536];
  ssize_t n = read(s.fd, buf, sizeof(buf));
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) return true;
    spdlog::warn("Read from sandbox pipe failed: {}", strerror(errno));
    return false;
  }
  if (n == 0) return false;
  size_t room = max_capture > s.buf->size() ? max_capture - s.buf->size() : 0;
  if ((size_t)n > room) {
    *s.truncated = true;
    if (s.keep_tail) KeepTail(s, buf + room, n - room);
    n = room;
  }
  s.buf->append(buf, n);
  return true;
}

// Wait up to wait_ms for output and read whatever arrived
void Pump(Stream* streams, size_t num, size_t max_capture, long wait_ms) {
  struct pollfd pfd[2];
  Stream* owner[2];
  nfds_t n = 0;
  for (size_t i = 0; i < num; i++) {
    if (streams[i].fd < 0) continue;
    pfd[n] = {streams[i].fd, POLLIN, 0};
    owner[n++] = &streams[i];
  }
  int ret = poll(n ? pfd : nullptr, n, wait_ms);
  if (ret < 0) {
    if (errno != EINTR) spdlog::warn("poll failed: {}", strerror(errno));
    return;
  }
  for (nfds_t i = 0; i < n; i++) {
    if (!(pfd[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL))) continue;
    if (!Drain(*owner[i], max_capture)) {
      close(owner[i]->fd);
      owner[i]->fd = -1;
    }
  }
}

void KillGroup(pid_t pgid, int sig) {
  if (kill(-pgid, sig) < 0 && errno != ESRCH) {
    spdlog::warn("Failed to send signal {} to process group {}: {}", sig, pgid, strerror(errno));
  }
}

} // namespace

const char* SupervisorStateName(SupervisorState state) {
  return kSupervisorStateNameTable[(int)state];
}

SandboxOutcome Supervise(SpawnedProcess& proc, const SupervisorLimits& limits) {
  SandboxOutcome ret;
  ret.pgid = proc.pid;
  Stream streams[2] = {
    Stream(proc.stdout_fd, &ret.output, &ret.output_truncated, false),
    Stream(proc.stderr_fd, &ret.error_output, &ret.error_truncated, true),
  };
  for (auto& s : streams) {
    int flags = fcntl(s.fd, F_GETFL);
    if (flags < 0 || fcntl(s.fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      spdlog::warn("Cannot make pipe {} non-blocking: {}", s.fd, strerror(errno));
    }
  }

  const auto start = Clock::now();
  const auto deadline = start + limits.timeout;
  int status = 0;
  bool exited = false, timed_out = false, lost = false;
  auto Reap = [&](int flags) {
    if (exited) return true;
    pid_t r;
    while ((r = waitpid(proc.pid, &status, flags)) < 0 && errno == EINTR);
    if (r == proc.pid) {
      exited = true;
      ret.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    } else if (r < 0) {
      spdlog::error("waitpid {} failed: {}", proc.pid, strerror(errno));
      exited = lost = true;
    }
    return exited;
  };

  while (!Reap(WNOHANG)) {
    long remain = MillisecondsUntil(deadline);
    if (remain == 0) {
      timed_out = true;
      break;
    }
    Pump(streams, 2, limits.max_capture, std::min(remain, kPollIntervalMs));
  }

  if (timed_out) {
    spdlog::info("Timeout reached, terminating process group {}", proc.pid);
    KillGroup(proc.pid, SIGTERM);
    const auto kill_deadline = Clock::now() + limits.kill_grace;
    while (!Reap(WNOHANG)) {
      long remain = MillisecondsUntil(kill_deadline);
      if (remain == 0) {
        spdlog::info("Process group {} survived SIGTERM, killing", proc.pid);
        KillGroup(proc.pid, SIGKILL);
        Reap(0);
        break;
      }
      Pump(streams, 2, limits.max_capture, std::min(remain, kPollIntervalMs));
    }
  }
  // reclaim anything left behind by the leader
  KillGroup(proc.pid, SIGKILL);

  const auto drain_deadline = Clock::now() + std::chrono::milliseconds(kDrainMs);
  while (streams[0].fd >= 0 || streams[1].fd >= 0) {
    long remain = MillisecondsUntil(drain_deadline);
    if (remain == 0) {
      spdlog::warn("Output pipes of process group {} still open, giving up", proc.pid);
      break;
    }
    Pump(streams, 2, limits.max_capture, remain);
  }
  for (auto& s : streams) {
    if (s.fd >= 0) close(s.fd);
    if (s.tail.empty()) continue;
    if (s.tail_cut) s.buf->push_back('\n');
    s.buf->append(s.tail);
  }
  proc.stdout_fd = proc.stderr_fd = -1;

  if (lost) {
    ret.state = timed_out ? SupervisorState::TIMED_OUT : SupervisorState::COMPLETED;
    ret.exit_code = -1;
  } else if (WIFSIGNALED(status)) {
    ret.term_signal = WTERMSIG(status);
    ret.exit_code = 128 + ret.term_signal;
    ret.state = timed_out ? SupervisorState::TIMED_OUT : SupervisorState::KILLED;
  } else {
    ret.exit_code = WEXITSTATUS(status);
    ret.state = timed_out ? SupervisorState::TIMED_OUT : SupervisorState::COMPLETED;
  }
  if (timed_out) {
    ret.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
  }
  spdlog::debug("Supervised pid={} state={} exit={} signal={} elapsed={}ms stdout={}B stderr={}B",
      proc.pid, SupervisorStateName(ret.state), ret.exit_code, ret.term_signal, ret.elapsed_ms,
      ret.output.size(), ret.error_output.size());
  return ret;
}
