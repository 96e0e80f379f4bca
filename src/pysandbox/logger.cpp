#include <pysandbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

// The console sinks share one global mutex. A request thread may fork while
// another thread is logging; hold the mutex across fork() so the child
// never starts with it locked.
using console_mutex = spdlog::details::console_mutex;

namespace {

void Prepare() {
  console_mutex::mutex().lock();
}

void Parent() {
  console_mutex::mutex().unlock();
}

void Child() {
  console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
