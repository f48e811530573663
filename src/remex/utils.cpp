#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(BackendKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* BackendKindName, BackendKind, ENUM_BACKEND_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(Shell, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ShellExecutable, Shell, ENUM_SHELL_)
#undef X

#define X(...) X_RETURN_ARG2(FailureKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FailureKindName, FailureKind, ENUM_FAILURE_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ResultChannel, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultChannelName, ResultChannel, ENUM_RESULT_CHANNEL_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

std::string Preview(const std::string& str, size_t length) {
  if (str.size() <= length) return str;
  return str.substr(0, length) + "...";
}

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

std::optional<std::string> GetEnv(const char* name) {
  if (const char* val = getenv(name)) return std::string(val);
  return std::nullopt;
}

std::optional<std::string> ReadFileToString(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::ostringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

fs::path FindExecutable(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();
  }
  auto path_env = GetEnv("PATH");
  if (!path_env) return {};
  std::istringstream ss(*path_env);
  for (std::string dir; std::getline(ss, dir, ':');) {
    if (dir.empty()) dir = ".";
    fs::path candidate = fs::path(dir) / name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
      return fs::absolute(candidate, ec);
    }
  }
  return {};
}

std::string RandomToken(size_t length) {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static const char kHex[] = "0123456789abcdef";
  std::string ret(length, '0');
  for (auto& c : ret) c = kHex[gen() & 15];
  return ret;
}
