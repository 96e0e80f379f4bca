#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <pysandbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// return false if the file does not exist or cannot be read
bool ReadFile(const fs::path&, std::string& content);

// Close every fd >= minfd; only used in a freshly forked child
int CloseFrom(int minfd);

// "SIGKILL" etc.; "signal N" for unknown numbers
std::string SignalName(int sig);

#endif  // UTILS_H_
