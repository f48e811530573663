#include "providers.h"

#include <chrono>
#include <thread>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <remex/errors.h>
#include "http_utils.h"
#include "utils.h"

long kBuildPollInterval = 1000;
long kBuildTimeout = 3600 * 1000;
long kInstancePollInterval = 500;

namespace {

using nlohmann::json;
using Clock = std::chrono::steady_clock;

const long kDefaultRequestTimeout = 30000; // ms
// added to the read timeout of calls the server itself bounds
const long kResponseSlack = 5000; // ms
// lifetime of an instance beyond its deadline, in case destroy never arrives
const long kInstanceLifetimeMargin = 60; // s

const char kJsonType[] = "application/json";
const char kTarType[] = "application/x-tar";
// uploading a build context may take far longer than a control call
const long kUploadTimeout = 600000; // ms

long ElapsedMs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

long CeilSeconds(long ms) {
  return ms <= 0 ? 1 : (ms + 999) / 1000;
}

std::string LogLine(const json& entry) {
  if (entry.is_string()) return entry.get<std::string>();
  if (entry.is_object() && entry.contains("message") && entry["message"].is_string()) {
    return entry["message"].get<std::string>();
  }
  return entry.dump();
}

std::string ReasonText(const json& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) return "unknown reason";
  return LogLine(*it);
}

enum class BuildState { RUNNING, DONE, FAILED };

struct BuildPoll {
  BuildState state;
  json logs;
  std::string reason;
};

// Polls until the build leaves RUNNING, forwarding each new log line once.
void WaitForBuild(const std::string& name, const BuildLogSink& sink,
                  const std::function<BuildPoll(size_t logs_offset)>& poll) {
  auto start = Clock::now();
  size_t offset = 0;
  while (true) {
    BuildPoll res = poll(offset);
    if (res.logs.is_array()) {
      for (auto& entry : res.logs) {
        if (sink) sink(LogLine(entry));
      }
      offset += res.logs.size();
    }
    if (res.state == BuildState::DONE) return;
    if (res.state == BuildState::FAILED) {
      throw ProviderError("Build of " + name + " failed: " + res.reason);
    }
    if (ElapsedMs(start) >= kBuildTimeout) {
      throw ProviderTimeout("Build of " + name + " did not finish in time");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kBuildPollInterval));
  }
}

} // namespace

RestEndpoint::RestEndpoint(const std::string& api_url, httplib::Headers headers) :
    headers_(std::move(headers)) {
  size_t scheme = api_url.find("://");
  if (scheme == std::string::npos || scheme == 0) {
    throw ConfigurationError("Invalid provider URL '" + api_url + "'");
  }
  size_t path = api_url.find('/', scheme + 3);
  host_ = api_url.substr(0, path);
  if (path != std::string::npos) prefix_ = api_url.substr(path);
  while (!prefix_.empty() && prefix_.back() == '/') prefix_.pop_back();
}

std::unique_ptr<httplib::Client> RestEndpoint::MakeClient(long timeout_ms) const {
  if (timeout_ms <= 0) timeout_ms = kDefaultRequestTimeout;
  auto cli = std::make_unique<httplib::Client>(host_);
  cli->set_default_headers(headers_);
  cli->set_connection_timeout(std::min(timeout_ms, kDefaultRequestTimeout) / 1000,
                              std::min(timeout_ms, kDefaultRequestTimeout) % 1000 * 1000);
  cli->set_read_timeout(timeout_ms / 1000, timeout_ms % 1000 * 1000);
  cli->set_write_timeout(timeout_ms / 1000, timeout_ms % 1000 * 1000);
  return cli;
}

httplib::Result RestEndpoint::Get(const std::string& path, const httplib::Params& params,
                                  long timeout_ms) const {
  auto cli = MakeClient(timeout_ms);
  std::string endpoint = prefix_ + path;
  if (!params.empty()) endpoint += "?" + httplib::detail::params_to_query_str(params);
  return RequestRetry<HTTPGet>(*cli, endpoint);
}

httplib::Result RestEndpoint::Post(const std::string& path, const json& body, long timeout_ms) const {
  auto cli = MakeClient(timeout_ms);
  return HTTPRequest<HTTPPost>(*cli, prefix_ + path, body.dump(), kJsonType);
}

httplib::Result RestEndpoint::Put(const std::string& path, const std::string& body,
                                  const char* content_type, long timeout_ms) const {
  auto cli = MakeClient(timeout_ms);
  return HTTPRequest<HTTPPut>(*cli, prefix_ + path, body, content_type);
}

httplib::Result RestEndpoint::Delete(const std::string& path) const {
  auto cli = MakeClient(0);
  return HTTPRequest<HTTPDelete>(*cli, prefix_ + path);
}

void RestEndpoint::Check(const httplib::Result& res, const std::string& what,
                         long timeout_ms, long elapsed_ms) {
  if (!res) {
    if (timeout_ms > 0 && elapsed_ms >= timeout_ms) {
      throw ProviderTimeout(fmt::format("{} timed out after {}ms", what, elapsed_ms));
    }
    throw ProviderError(what + " failed: " + httplib::to_string(res.error()));
  }
  if (!http_utils::IsSuccess(res->status)) {
    throw ProviderError(fmt::format("{} failed with HTTP {}: {}", what, res->status,
                                    Preview(res->body, 200)), res->status);
  }
}

json RestEndpoint::ParseBody(const httplib::Result& res, const std::string& what) {
  Check(res, what);
  json doc = json::parse(res->body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw ProviderError(what + " returned an invalid response: " + Preview(res->body, 200), res->status);
  }
  return doc;
}

namespace {

template <class T>
T Field(const json& doc, const char* key, const std::string& what) {
  auto it = doc.find(key);
  if (it == doc.end()) throw ProviderError(what + ": response lacks '" + key + "'");
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw ProviderError(what + ": bad '" + key + "' in response: " + e.what());
  }
}

} // namespace

// ---- template provider ----

TemplateProviderClient::TemplateProviderClient(const ProviderEndpoint& endpoint) :
    api_(endpoint.api_url, {{"X-API-Key", endpoint.api_key}}) {}

bool TemplateProviderClient::ImageExists(const std::string& image) {
  auto res = api_.Get("/templates/aliases/" + image);
  if (res && res->status == 404) return false;
  RestEndpoint::Check(res, "Template lookup of " + image);
  return true;
}

void TemplateProviderClient::BuildImage(const ImageBuildSpec& spec, const BuildLogSink& sink) {
  const std::string what = "Template build of " + spec.name;
  json req = {
    {"alias", spec.name},
    {"dockerfile", spec.dockerfile},
    {"cpuCount", spec.cpu_count},
    {"memoryMB", spec.memory_mb},
    {"startCmd", spec.start_cmd},
  };
  json doc = RestEndpoint::ParseBody(api_.Post("/templates", req), what);
  auto template_id = Field<std::string>(doc, "templateID", what);
  auto build_id = Field<std::string>(doc, "buildID", what);
  std::string build_path = "/templates/" + template_id + "/builds/" + build_id;
  json build_req = json::object();
  if (!spec.context.archive.empty()) {
    // uploads are content-addressed; an unchanged context is not sent again
    std::string files_path = "/templates/" + template_id + "/files/" + spec.context.sha256;
    json files = RestEndpoint::ParseBody(api_.Get(files_path), what);
    if (!files.value("present", false)) {
      spdlog::debug("Uploading build context {} ({} bytes)", spec.context.sha256, spec.context.archive.size());
      RestEndpoint::Check(api_.Put(files_path, spec.context.archive, kTarType, kUploadTimeout), what);
    }
    build_req["filesHash"] = spec.context.sha256;
  }
  RestEndpoint::Check(api_.Post(build_path, build_req), what);
  spdlog::debug("Template {} build {} started", template_id, build_id);

  WaitForBuild(spec.name, sink, [&](size_t offset) {
    json st = RestEndpoint::ParseBody(
        api_.Get(build_path + "/status", {{"logsOffset", std::to_string(offset)}}), what);
    BuildPoll ret;
    auto status = Field<std::string>(st, "status", what);
    ret.state = status == "ready" ? BuildState::DONE :
                status == "error" ? BuildState::FAILED : BuildState::RUNNING;
    ret.logs = st.value("logs", json::array());
    ret.reason = ReasonText(st, "reason");
    return ret;
  });
}

std::string TemplateProviderClient::CreateInstance(const std::string& image, long timeout_ms) {
  const std::string what = "Sandbox creation from " + image;
  json req = {
    {"templateID", image},
    {"timeout", CeilSeconds(timeout_ms) + kInstanceLifetimeMargin},
  };
  auto start = Clock::now();
  auto res = api_.Post("/sandboxes", req, timeout_ms);
  RestEndpoint::Check(res, what, timeout_ms, ElapsedMs(start));
  return Field<std::string>(RestEndpoint::ParseBody(res, what), "sandboxID", what);
}

CommandResult TemplateProviderClient::RunCommand(
    const std::string& instance, const std::string& command, long timeout_ms) {
  const std::string what = "Command in sandbox " + instance;
  json req = {
    {"cmd", command},
    {"user", "root"},
    {"timeoutMs", timeout_ms},
  };
  auto start = Clock::now();
  auto res = api_.Post("/sandboxes/" + instance + "/commands", req, timeout_ms + kResponseSlack);
  if (res && res->status == 504) throw ProviderTimeout(what + " timed out");
  RestEndpoint::Check(res, what, timeout_ms, ElapsedMs(start));
  json doc = RestEndpoint::ParseBody(res, what);
  if (doc.value("timedOut", false)) throw ProviderTimeout(what + " timed out");
  CommandResult ret;
  ret.exit_code = Field<int>(doc, "exitCode", what);
  ret.stdout_text = doc.value("stdout", "");
  ret.stderr_text = doc.value("stderr", "");
  return ret;
}

std::optional<std::string> TemplateProviderClient::ReadFile(
    const std::string& instance, const std::string& path) {
  auto res = api_.Get("/sandboxes/" + instance + "/files", {{"path", path}});
  if (res && res->status == 404) return std::nullopt;
  RestEndpoint::Check(res, "Reading " + path + " from sandbox " + instance);
  return res->body;
}

void TemplateProviderClient::DestroyInstance(const std::string& instance) {
  auto res = api_.Delete("/sandboxes/" + instance);
  // already gone
  if (res && res->status == 404) return;
  RestEndpoint::Check(res, "Destroying sandbox " + instance);
}

// ---- snapshot provider ----

SnapshotProviderClient::SnapshotProviderClient(const ProviderEndpoint& endpoint) :
    api_(endpoint.api_url, {{"Authorization", "Bearer " + endpoint.api_key}}) {}

bool SnapshotProviderClient::ImageExists(const std::string& image) {
  auto res = api_.Get("/snapshots/" + image);
  if (res && res->status == 404) return false;
  json doc = RestEndpoint::ParseBody(res, "Snapshot lookup of " + image);
  std::string state = doc.value("state", "");
  if (state == "error" || state == "build_failed") {
    throw ProviderError("Snapshot " + image + " is in state " + state + ": " + ReasonText(doc, "errorReason"));
  }
  return true;
}

void SnapshotProviderClient::BuildImage(const ImageBuildSpec& spec, const BuildLogSink& sink) {
  const std::string what = "Snapshot build of " + spec.name;
  json req = {
    {"name", spec.name},
    {"buildInfo", {{"dockerfileContent", spec.dockerfile}}},
    {"cpu", spec.cpu_count},
    {"memory", std::max(1, spec.memory_mb / 1024)},
    {"disk", spec.disk_gb},
    {"entrypoint", {"sh", "-c", spec.start_cmd}},
  };
  if (!spec.context.archive.empty()) {
    std::string context_path = "/snapshots/context/" + spec.context.sha256;
    auto res = api_.Get(context_path);
    if (res && res->status == 404) {
      spdlog::debug("Uploading build context {} ({} bytes)", spec.context.sha256, spec.context.archive.size());
      RestEndpoint::Check(api_.Put(context_path, spec.context.archive, kTarType, kUploadTimeout), what);
    } else {
      RestEndpoint::Check(res, what);
    }
    req["buildInfo"]["contextHashes"] = json::array({spec.context.sha256});
  }
  RestEndpoint::Check(api_.Post("/snapshots", req), what);

  WaitForBuild(spec.name, sink, [&](size_t offset) {
    json st = RestEndpoint::ParseBody(
        api_.Get("/snapshots/" + spec.name, {{"logsOffset", std::to_string(offset)}}), what);
    BuildPoll ret;
    auto state = Field<std::string>(st, "state", what);
    ret.state = state == "active" ? BuildState::DONE :
                state == "error" || state == "build_failed" ? BuildState::FAILED : BuildState::RUNNING;
    ret.logs = st.value("logs", json::array());
    ret.reason = ReasonText(st, "errorReason");
    return ret;
  });
}

std::string SnapshotProviderClient::CreateInstance(const std::string& image, long timeout_ms) {
  const std::string what = "Sandbox creation from snapshot " + image;
  json req = {{"snapshot", image}};
  auto start = Clock::now();
  auto res = api_.Post("/sandbox", req, timeout_ms);
  RestEndpoint::Check(res, what, timeout_ms, ElapsedMs(start));
  return Field<std::string>(RestEndpoint::ParseBody(res, what), "id", what);
}

void SnapshotProviderClient::WaitForInstance(const std::string& instance, long timeout_ms) {
  const std::string what = "Starting sandbox " + instance;
  auto start = Clock::now();
  while (true) {
    long remaining = timeout_ms - ElapsedMs(start);
    if (remaining <= 0) {
      throw ProviderTimeout(fmt::format("{} did not finish in {}ms", what, timeout_ms));
    }
    auto res = api_.Get("/sandbox/" + instance, {}, std::min(remaining, kDefaultRequestTimeout));
    RestEndpoint::Check(res, what, timeout_ms, ElapsedMs(start));
    json doc = RestEndpoint::ParseBody(res, what);
    auto state = Field<std::string>(doc, "state", what);
    if (state == "started") {
      spdlog::debug("Sandbox {} started after {}ms", instance, ElapsedMs(start));
      return;
    }
    if (state == "error" || state == "build_failed" || state == "destroyed" || state == "stopped") {
      throw ProviderError(what + " failed in state " + state + ": " + ReasonText(doc, "errorReason"));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(
        std::min(kInstancePollInterval, std::max(1L, timeout_ms - ElapsedMs(start)))));
  }
}

CommandResult SnapshotProviderClient::RunCommand(
    const std::string& instance, const std::string& command, long timeout_ms) {
  const std::string what = "Command in sandbox " + instance;
  json req = {
    {"command", command},
    {"timeout", CeilSeconds(timeout_ms)},
  };
  auto start = Clock::now();
  auto res = api_.Post("/toolbox/" + instance + "/toolbox/process/execute", req,
                       timeout_ms + kResponseSlack);
  if (res && (res->status == 504 || res->status == 408)) throw ProviderTimeout(what + " timed out");
  RestEndpoint::Check(res, what, timeout_ms, ElapsedMs(start));
  json doc = RestEndpoint::ParseBody(res, what);
  CommandResult ret;
  ret.exit_code = Field<int>(doc, "exitCode", what);
  ret.stdout_text = doc.value("result", "");
  return ret;
}

std::optional<std::string> SnapshotProviderClient::ReadFile(const std::string&, const std::string&) {
  return std::nullopt;
}

void SnapshotProviderClient::DestroyInstance(const std::string& instance) {
  auto res = api_.Delete("/sandbox/" + instance);
  if (res && res->status == 404) return;
  RestEndpoint::Check(res, "Destroying sandbox " + instance);
}

std::unique_ptr<SandboxProvider> DefaultProviderFactory(BackendKind kind, const ProviderEndpoint& endpoint) {
  switch (kind) {
    case BackendKind::TEMPLATE_SANDBOX: return std::make_unique<TemplateProviderClient>(endpoint);
    case BackendKind::SNAPSHOT_SANDBOX: return std::make_unique<SnapshotProviderClient>(endpoint);
    case BackendKind::LOCAL_PROCESS: break;
  }
  throw ConfigurationError(std::string("No sandbox provider for ") + BackendKindName(kind));
}
