#ifndef SANDBOX_H_
#define SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass(CJailCtxClass&& x) :
      argv_buf_(std::move(x.argv_buf_)), env_buf_(std::move(x.env_buf_)),
      str_buf_(std::move(x.str_buf_)), mnt_buf_(std::move(x.mnt_buf_)),
      mnt_list_(x.mnt_list_), ctx_(x.ctx_) {
    x.mnt_list_ = nullptr;
  }
  ~CJailCtxClass() {
    if (mnt_list_) mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

struct SandboxMount {
  std::string source, target; // target is inside boxdir, starting with /
  bool writable;
};

// Everything pysandbox-exec needs to run one harness under cjail.
// Written to a file in the request box; the helper reads it back.
class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir; // chroot
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir; // inside box
  int uid, gid;
  long wall_time, cpu_time; // us
  long vss; // KiB
  int proc_num;
  long fsize; // KiB
  bool share_net;
  std::vector<SandboxMount> mounts;

  SandboxOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      vss(0),
      proc_num(0),
      fsize(0),
      share_net(false) {}
  // false if the buffer is truncated
  bool Deserialize(const std::vector<uint8_t>& serial);

  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result is invalidated after reassignment/reallocation of any string/vector member
  CJailCtxClass ToCJailCtx() const;
};

#endif  // SANDBOX_H_
