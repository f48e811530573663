#ifndef REMEX_PROVIDERS_H_
#define REMEX_PROVIDERS_H_

#include <string>
#include <optional>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <remex/provider.h>

// JSON over HTTP(S) against one provider base URL. A fresh httplib::Client is
// made per request so instances can be shared between threads.
class RestEndpoint {
  std::string host_;   // scheme://host[:port]
  std::string prefix_; // path below the host, no trailing slash
  httplib::Headers headers_;

  std::unique_ptr<httplib::Client> MakeClient(long timeout_ms) const;
 public:
  RestEndpoint(const std::string& api_url, httplib::Headers headers);

  // Idempotent GET, retried on transport errors and 5xx
  httplib::Result Get(const std::string& path, const httplib::Params& params = {},
                      long timeout_ms = 0) const;
  httplib::Result Post(const std::string& path, const nlohmann::json& body,
                       long timeout_ms = 0) const;
  httplib::Result Put(const std::string& path, const std::string& body, const char* content_type,
                      long timeout_ms = 0) const;
  httplib::Result Delete(const std::string& path) const;

  // throws ProviderError (ProviderTimeout if a transport failure came after
  // timeout_ms had elapsed) unless the response is 2xx
  static void Check(const httplib::Result&, const std::string& what,
                    long timeout_ms = 0, long elapsed_ms = 0);
  static nlohmann::json ParseBody(const httplib::Result&, const std::string& what);
};

// Template-based sandboxes (E2B-style control plane). Image names are
// template aliases.
class TemplateProviderClient : public SandboxProvider {
  RestEndpoint api_;
 public:
  explicit TemplateProviderClient(const ProviderEndpoint&);

  bool ImageExists(const std::string& image) override;
  void BuildImage(const ImageBuildSpec&, const BuildLogSink&) override;
  std::string CreateInstance(const std::string& image, long timeout_ms) override;
  CommandResult RunCommand(const std::string& instance, const std::string& command, long timeout_ms) override;
  std::optional<std::string> ReadFile(const std::string& instance, const std::string& path) override;
  void DestroyInstance(const std::string& instance) override;
};

// Snapshot-based sandboxes (Daytona-style control plane). Output of a command
// comes back combined; files cannot be read back.
class SnapshotProviderClient : public SandboxProvider {
  RestEndpoint api_;
 public:
  explicit SnapshotProviderClient(const ProviderEndpoint&);

  bool ImageExists(const std::string& image) override;
  void BuildImage(const ImageBuildSpec&, const BuildLogSink&) override;
  std::string CreateInstance(const std::string& image, long timeout_ms) override;
  // polls the instance state until it is started
  void WaitForInstance(const std::string& instance, long timeout_ms) override;
  CommandResult RunCommand(const std::string& instance, const std::string& command, long timeout_ms) override;
  std::optional<std::string> ReadFile(const std::string& instance, const std::string& path) override;
  void DestroyInstance(const std::string& instance) override;
};

// polling cadence of image builds, overridable for tests
extern long kBuildPollInterval; // ms
extern long kBuildTimeout; // ms
extern long kInstancePollInterval; // ms

#endif  // REMEX_PROVIDERS_H_
