#ifndef INCLUDE_REMEX_CONFIG_H_
#define INCLUDE_REMEX_CONFIG_H_

#include <string>
#include <variant>
#include <istream>
#include <filesystem>

namespace fs = std::filesystem;

#define ENUM_BACKEND_KIND_ \
  X(LOCAL_PROCESS, "local-process") \
  X(TEMPLATE_SANDBOX, "template-sandbox") \
  X(SNAPSHOT_SANDBOX, "snapshot-sandbox")
enum class BackendKind {
#define X(name, str) name,
  ENUM_BACKEND_KIND_
#undef X
};
constexpr size_t kBackendKindCount = 3;

// shells able to allocate descriptors dynamically ({var}>&N)
#define ENUM_SHELL_ \
  X(BASH4, "bash") \
  X(ZSH, "zsh")
enum class Shell {
#define X(name, exe) name,
  ENUM_SHELL_
#undef X
};

struct LocalProcessConfig {
  Shell shell = Shell::ZSH;
  std::string interpreter = "python3";
  // working directory of the entrypoint; empty for the caller's cwd
  std::string project_root;

  bool operator==(const LocalProcessConfig&) const;
  bool operator!=(const LocalProcessConfig& x) const { return !(*this == x); }
};

struct TemplateSandboxConfig {
  std::string api_key; // empty: E2B_API_KEY
  std::string api_url = "https://api.e2b.dev";
  std::string project_root = ".";
  std::string dockerfile_path; // relative to project_root; empty: Dockerfile
  std::string template_prefix = "remex";
  std::string template_version; // empty: version field of the project manifest
  int cpu_count = 2;
  int memory_mb = 1024;
  std::string interpreter = "python";

  bool operator==(const TemplateSandboxConfig&) const;
  bool operator!=(const TemplateSandboxConfig& x) const { return !(*this == x); }
};

struct SnapshotSandboxConfig {
  std::string api_key; // empty: DAYTONA_API_KEY
  std::string api_url = "https://app.daytona.io/api";
  std::string project_root = ".";
  std::string dockerfile_path;
  std::string snapshot_name = "remex";
  std::string snapshot_version;
  int cpu_count = 1;
  int memory_gb = 1;
  int disk_gb = 3;
  std::string interpreter = "/app/.venv/bin/python";

  bool operator==(const SnapshotSandboxConfig&) const;
  bool operator!=(const SnapshotSandboxConfig& x) const { return !(*this == x); }
};

// alternative index == (int)BackendKind
using ExecutionConfig = std::variant<LocalProcessConfig, TemplateSandboxConfig, SnapshotSandboxConfig>;

inline BackendKind KindOf(const ExecutionConfig& config) {
  return (BackendKind)config.index();
}

const char* BackendKindName(BackendKind);
const char* ShellExecutable(Shell);

// INI layout: [backend] kind=... plus the keys of that kind
// throws ConfigurationError
ExecutionConfig LoadExecutionConfig(std::istream&);
ExecutionConfig LoadExecutionConfig(const fs::path&);

// name of the project manifest holding [project] version
extern const char kProjectManifest[];

#endif  // INCLUDE_REMEX_CONFIG_H_
