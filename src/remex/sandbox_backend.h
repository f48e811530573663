#ifndef REMEX_SANDBOX_BACKEND_H_
#define REMEX_SANDBOX_BACKEND_H_

#include <tuple>
#include <memory>
#include <optional>
#include <string>

#include <remex/backend.h>
#include <remex/provider.h>
#include "memo.h"

// Provisions one remote instance per call from a named image, builds the
// image on first use if the provider lacks it. Serves both sandbox kinds.
class SandboxBackend : public Backend {
 public:
  // the config fields both kinds share, normalized
  struct Settings {
    std::string api_key;
    std::string api_url;
    fs::path project_root;
    std::string dockerfile_path;
    std::string image_prefix;
    std::string image_version;
    int cpu_count;
    int memory_mb;
    int disk_gb;
    std::string interpreter;
  };

  SandboxBackend(BackendKind kind, ProviderFactory factory = DefaultProviderFactory,
                 BuildLogSink build_log = nullptr);

  HarnessSpec GetHarnessSpec(const ExecutionConfig&) const override;
  void PreCheck(const ExecutionConfig&) override;
  ExecutionOutcome Execute(const ExecutionConfig&, const Payload&, long deadline_ms) override;

  // config value, else the kind's environment variable; throws ConfigurationError
  std::string ResolveApiKey(const Settings&);
  // "{prefix}-v{version}"; throws ConfigurationError
  std::string ResolveImageName(const Settings&);

  Settings Normalize(const ExecutionConfig&) const;
  const char* ApiKeyEnv() const;

 private:
  BackendKind kind_;
  ProviderFactory factory_;
  BuildLogSink build_log_;
  Memo<std::string, std::string> api_keys_;
  Memo<std::tuple<std::string, std::string, std::string>, std::string> image_names_;

  std::unique_ptr<SandboxProvider> Connect(const Settings&);
};

// [project] version of a manifest, quotes stripped; nullopt if absent
std::optional<std::string> ReadManifestVersion(const fs::path& manifest);

#endif  // REMEX_SANDBOX_BACKEND_H_
