#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

#include "sandbox.h"

// pysandbox-exec <options file>
// Runs the command described by the options file under cjail, with stdio
// inherited. Exit status: the command's, 128+N if it was killed by signal N,
// 125 if the jail could not be set up.

namespace {

constexpr int kSetupFailure = 125;

int Fail(const char* what, int err) {
  fprintf(stderr, "pysandbox-exec: %s: %s\n", what, strerror(err));
  return kSetupFailure;
}

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    fprintf(stderr, "usage: %s <options file>\n", argv[0]);
    return kSetupFailure;
  }
  std::ifstream fin(argv[1], std::ios::binary);
  if (!fin) return Fail(argv[1], errno);
  std::vector<uint8_t> buf{std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>()};
  SandboxOptions opt;
  if (!opt.Deserialize(buf)) return Fail(argv[1], EINVAL);

  CJailCtxClass ctx = opt.ToCJailCtx();
  struct cjail_result res = {};
  if (cjail_exec(&ctx.GetCtx(), &res) < 0) return Fail("cjail_exec", errno);
  switch (res.info.si_code) {
    case CLD_EXITED:
      return res.info.si_status;
    case CLD_KILLED:
    case CLD_DUMPED:
      return 128 + res.info.si_status;
  }
  fprintf(stderr, "pysandbox-exec: unexpected child state %d\n", res.info.si_code);
  return kSetupFailure;
}
