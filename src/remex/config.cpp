#include <remex/config.h>

#include <tuple>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <remex/errors.h>

const char kProjectManifest[] = "pyproject.toml";

bool LocalProcessConfig::operator==(const LocalProcessConfig& x) const {
  return std::tie(shell, interpreter, project_root) ==
         std::tie(x.shell, x.interpreter, x.project_root);
}

bool TemplateSandboxConfig::operator==(const TemplateSandboxConfig& x) const {
  return std::tie(api_key, api_url, project_root, dockerfile_path, template_prefix,
                  template_version, cpu_count, memory_mb, interpreter) ==
         std::tie(x.api_key, x.api_url, x.project_root, x.dockerfile_path, x.template_prefix,
                  x.template_version, x.cpu_count, x.memory_mb, x.interpreter);
}

bool SnapshotSandboxConfig::operator==(const SnapshotSandboxConfig& x) const {
  return std::tie(api_key, api_url, project_root, dockerfile_path, snapshot_name,
                  snapshot_version, cpu_count, memory_gb, disk_gb, interpreter) ==
         std::tie(x.api_key, x.api_url, x.project_root, x.dockerfile_path, x.snapshot_name,
                  x.snapshot_version, x.cpu_count, x.memory_gb, x.disk_gb, x.interpreter);
}

namespace {

BackendKind ParseKind(const std::string& str) {
#define X(name, kind_str) if (str == kind_str) return BackendKind::name;
  ENUM_BACKEND_KIND_
#undef X
  throw ConfigurationError("Unknown backend kind '" + str + "'");
}

Shell ParseShell(const std::string& str) {
#define X(name, exe) if (str == exe) return Shell::name;
  ENUM_SHELL_
#undef X
  throw ConfigurationError("Unknown shell '" + str + "'; expected bash or zsh");
}

void CheckPositive(int val, const char* key) {
  if (val <= 0) throw ConfigurationError(std::string(key) + " must be positive");
}

} // namespace

ExecutionConfig LoadExecutionConfig(std::istream& in) {
  tortellini::ini ini;
  in >> ini;
  auto&& sec = ini["backend"];
  std::string kind = sec["kind"] | "";
  if (kind.empty()) throw ConfigurationError("Missing [backend] kind");
  switch (ParseKind(kind)) {
    case BackendKind::LOCAL_PROCESS: {
      LocalProcessConfig conf;
      conf.shell = ParseShell(sec["shell"] | ShellExecutable(conf.shell));
      conf.interpreter = sec["interpreter"] | conf.interpreter;
      conf.project_root = sec["project_root"] | conf.project_root;
      return conf;
    }
    case BackendKind::TEMPLATE_SANDBOX: {
      TemplateSandboxConfig conf;
      conf.api_key = sec["api_key"] | conf.api_key;
      conf.api_url = sec["api_url"] | conf.api_url;
      conf.project_root = sec["project_root"] | conf.project_root;
      conf.dockerfile_path = sec["dockerfile"] | conf.dockerfile_path;
      conf.template_prefix = sec["template_prefix"] | conf.template_prefix;
      conf.template_version = sec["template_version"] | conf.template_version;
      conf.cpu_count = sec["cpu_count"] | conf.cpu_count;
      conf.memory_mb = sec["memory_mb"] | conf.memory_mb;
      conf.interpreter = sec["interpreter"] | conf.interpreter;
      CheckPositive(conf.cpu_count, "cpu_count");
      CheckPositive(conf.memory_mb, "memory_mb");
      return conf;
    }
    case BackendKind::SNAPSHOT_SANDBOX: {
      SnapshotSandboxConfig conf;
      conf.api_key = sec["api_key"] | conf.api_key;
      conf.api_url = sec["api_url"] | conf.api_url;
      conf.project_root = sec["project_root"] | conf.project_root;
      conf.dockerfile_path = sec["dockerfile"] | conf.dockerfile_path;
      conf.snapshot_name = sec["snapshot_name"] | conf.snapshot_name;
      conf.snapshot_version = sec["snapshot_version"] | conf.snapshot_version;
      conf.cpu_count = sec["cpu_count"] | conf.cpu_count;
      conf.memory_gb = sec["memory_gb"] | conf.memory_gb;
      conf.disk_gb = sec["disk_gb"] | conf.disk_gb;
      conf.interpreter = sec["interpreter"] | conf.interpreter;
      CheckPositive(conf.cpu_count, "cpu_count");
      CheckPositive(conf.memory_gb, "memory_gb");
      CheckPositive(conf.disk_gb, "disk_gb");
      return conf;
    }
  }
  __builtin_unreachable();
}

ExecutionConfig LoadExecutionConfig(const fs::path& path) {
  std::ifstream fin(path);
  if (!fin) throw ConfigurationError("Cannot open configuration file " + path.string());
  spdlog::debug("Loading execution config from {}", path.string());
  return LoadExecutionConfig(fin);
}
