#include "sandbox.h"

#include <unistd.h>
#include <sys/mount.h>
#include <cstring>

bool SandboxOptions::Deserialize(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  bool ok = true;
  auto ReadInt = [&]() -> Int {
    if (cur + sizeof(Int) > vec.size()) {
      ok = false;
      return 0;
    }
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0 || cur + size > vec.size()) {
      ok = false;
      return std::string();
    }
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadSize = [&]() -> size_t {
    Int size = ReadInt();
    // every element takes at least one Int
    if (size < 0 || (size_t)size > vec.size() / sizeof(Int)) {
      ok = false;
      return 0;
    }
    return size;
  };
  boxdir = ReadString();
  command.resize(ReadSize());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadSize());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  fsize = ReadInt();
  share_net = ReadInt();
  mounts.resize(ReadSize());
  for (auto& i : mounts) {
    i.source = ReadString();
    i.target = ReadString();
    i.writable = ReadInt();
  }
  return ok && cur == vec.size();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto AddLenWrite = [&](size_t len, Int r){
    Int cur = ret.size();
    ret.resize(cur + len);
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushInt = [&](Int r) { AddLenWrite(sizeof(Int), r); };
  auto PushString = [&](const std::string& str){
    Int cur = ret.size();
    AddLenWrite(str.size() + sizeof(Int), str.size());
    memcpy(ret.data() + (cur + sizeof(Int)), str.c_str(), str.size());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(fsize);
  PushInt(share_net);
  PushInt(mounts.size());
  for (auto& i : mounts) {
    PushString(i.source);
    PushString(i.target);
    PushInt(i.writable);
  }
  return ret;
}

CJailCtxClass SandboxOptions::ToCJailCtx() const {
  CJailCtxClass ret;
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd (stdio are the pipes of the supervisor)
  ctx.sharenet = share_net;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  // default: rlim_nofile, rlim_stack, cg_rss
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // default: cputime_poll_interval
  // default: seccomp_cfg
  // bind mounts
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(mounts.size());
  ret.mnt_buf_.reserve(mounts.size());
  for (auto& i : mounts) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = const_cast<char*>(i.source.data());
    mnt_ctx.target = const_cast<char*>(i.target.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = i.writable ? 0 : MS_RDONLY;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
  return ret;
}
