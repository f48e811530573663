#ifndef REMEX_UTILS_H_
#define REMEX_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include <remex/config.h>
#include <remex/outcome.h>
#include <remex/harness.h>

namespace fs = std::filesystem;

// bytes of stdout/stderr embedded in error messages
constexpr size_t kPreviewLength = 500;

std::string Preview(const std::string&, size_t length = kPreviewLength);

// close every descriptor >= minfd; async-signal-safe where close_range exists
int CloseFrom(int minfd);

std::optional<std::string> GetEnv(const char* name);
std::optional<std::string> ReadFileToString(const fs::path&);

// absolute path of an executable found on PATH, or empty
fs::path FindExecutable(const std::string& name);

// random lowercase hex
std::string RandomToken(size_t length);

#endif  // REMEX_UTILS_H_
