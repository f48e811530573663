#ifndef INCLUDE_REMEX_PROVIDER_H_
#define INCLUDE_REMEX_PROVIDER_H_

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>

#include <remex/config.h>

namespace fs = std::filesystem;

using BuildLogSink = std::function<void(const std::string&)>;

// files the Dockerfile's COPY/ADD instructions read, as one tar archive
struct BuildContext {
  std::string archive;
  std::string sha256; // hex digest of archive; names the upload
  size_t entries;

  BuildContext() : entries(0) {}
};

struct ImageBuildSpec {
  std::string name;
  std::string dockerfile; // contents
  BuildContext context;
  int cpu_count;
  int memory_mb;
  int disk_gb; // 0 if the provider does not size disks
  std::string start_cmd;

  ImageBuildSpec() : cpu_count(0), memory_mb(0), disk_gb(0), start_cmd("echo ready") {}
};

struct CommandResult {
  int exit_code;
  std::string stdout_text;
  std::string stderr_text; // empty if the provider merges output

  CommandResult() : exit_code(-1) {}
};

// Remote control plane. Every call may block on the network and throws
// ProviderError on failure (ProviderTimeout once a timeout_ms elapses).
class SandboxProvider {
 public:
  virtual ~SandboxProvider() = default;

  virtual bool ImageExists(const std::string& image) = 0;
  // blocks until the image is published or the build fails
  virtual void BuildImage(const ImageBuildSpec&, const BuildLogSink&) = 0;
  // returns the instance id
  virtual std::string CreateInstance(const std::string& image, long timeout_ms) = 0;
  // blocks until a created instance accepts commands; a no-op where creation
  // already waits for that
  virtual void WaitForInstance(const std::string& /*instance*/, long /*timeout_ms*/) {}
  virtual CommandResult RunCommand(const std::string& instance, const std::string& command, long timeout_ms) = 0;
  // nullopt if the file does not exist
  virtual std::optional<std::string> ReadFile(const std::string& instance, const std::string& path) = 0;
  virtual void DestroyInstance(const std::string& instance) = 0;
};

struct ProviderEndpoint {
  std::string api_url;
  std::string api_key;
};

using ProviderFactory =
    std::function<std::unique_ptr<SandboxProvider>(BackendKind, const ProviderEndpoint&)>;

// REST clients for the two sandbox kinds
std::unique_ptr<SandboxProvider> DefaultProviderFactory(BackendKind, const ProviderEndpoint&);

#endif  // INCLUDE_REMEX_PROVIDER_H_
