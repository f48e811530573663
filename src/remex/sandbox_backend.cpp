#include "sandbox_backend.h"

#include <chrono>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <remex/errors.h>
#include "utils.h"
#include "build_context.h"

namespace {

using Clock = std::chrono::steady_clock;

long ElapsedMs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

std::string StripQuotes(std::string str) {
  if (str.size() >= 2 && (str[0] == '"' || str[0] == '\'') && str.back() == str[0]) {
    return str.substr(1, str.size() - 2);
  }
  return str;
}

// Destroys the instance exactly once, on whichever path leaves Execute.
class InstanceGuard {
  SandboxProvider& provider_;
  std::string instance_;
 public:
  explicit InstanceGuard(SandboxProvider& provider) : provider_(provider) {}
  InstanceGuard(const InstanceGuard&) = delete;
  InstanceGuard& operator=(const InstanceGuard&) = delete;
  ~InstanceGuard() { Release(); }

  void Attach(const std::string& instance) { instance_ = instance; }
  const std::string& instance() const { return instance_; }
  void Release() {
    if (instance_.empty()) return;
    std::string instance = std::move(instance_);
    instance_.clear();
    try {
      provider_.DestroyInstance(instance);
      spdlog::debug("Destroyed sandbox {}", instance);
    } catch (const ProviderError& e) {
      spdlog::warn("Failed to destroy sandbox {}: {}", instance, e.what());
    }
  }
};

// everything after the last marker line of captured output
std::optional<std::string> SplitCaptured(const std::string& out, const std::string& marker) {
  std::string line = "\n" + marker + "\n";
  size_t pos = out.rfind(line);
  if (pos == std::string::npos) return std::nullopt;
  return out.substr(pos + line.size());
}

} // namespace

std::optional<std::string> ReadManifestVersion(const fs::path& manifest) {
  std::ifstream fin(manifest);
  if (!fin) return std::nullopt;
  tortellini::ini ini;
  fin >> ini;
  std::string version = StripQuotes(ini["project"]["version"] | "");
  if (version.empty()) return std::nullopt;
  return version;
}

SandboxBackend::SandboxBackend(BackendKind kind, ProviderFactory factory, BuildLogSink build_log) :
    kind_(kind), factory_(std::move(factory)), build_log_(std::move(build_log)) {}

SandboxBackend::Settings SandboxBackend::Normalize(const ExecutionConfig& config) const {
  Settings ret;
  if (KindOf(config) != kind_) {
    throw ConfigurationError(std::string("Config of kind ") + BackendKindName(KindOf(config)) +
                             " given to the " + BackendKindName(kind_) + " backend");
  }
  if (kind_ == BackendKind::TEMPLATE_SANDBOX) {
    auto& conf = std::get<TemplateSandboxConfig>(config);
    ret.api_key = conf.api_key;
    ret.api_url = conf.api_url;
    ret.project_root = conf.project_root;
    ret.dockerfile_path = conf.dockerfile_path;
    ret.image_prefix = conf.template_prefix;
    ret.image_version = conf.template_version;
    ret.cpu_count = conf.cpu_count;
    ret.memory_mb = conf.memory_mb;
    ret.disk_gb = 0;
    ret.interpreter = conf.interpreter;
  } else {
    auto& conf = std::get<SnapshotSandboxConfig>(config);
    ret.api_key = conf.api_key;
    ret.api_url = conf.api_url;
    ret.project_root = conf.project_root;
    ret.dockerfile_path = conf.dockerfile_path;
    ret.image_prefix = conf.snapshot_name;
    ret.image_version = conf.snapshot_version;
    ret.cpu_count = conf.cpu_count;
    ret.memory_mb = conf.memory_gb * 1024;
    ret.disk_gb = conf.disk_gb;
    ret.interpreter = conf.interpreter;
  }
  return ret;
}

const char* SandboxBackend::ApiKeyEnv() const {
  return kind_ == BackendKind::TEMPLATE_SANDBOX ? "E2B_API_KEY" : "DAYTONA_API_KEY";
}

std::string SandboxBackend::ResolveApiKey(const Settings& settings) {
  return api_keys_.Get(settings.api_key, [&]() {
    if (!settings.api_key.empty()) return settings.api_key;
    auto key = GetEnv(ApiKeyEnv());
    if (!key || key->empty()) {
      throw ConfigurationError(std::string("API key is required for the ") + BackendKindName(kind_) +
                               " backend; set api_key in the config or the " + ApiKeyEnv() +
                               " environment variable");
    }
    return *key;
  });
}

std::string SandboxBackend::ResolveImageName(const Settings& settings) {
  auto key = std::make_tuple(settings.image_prefix, settings.image_version, settings.project_root.string());
  return image_names_.Get(key, [&]() {
    std::string version = settings.image_version;
    if (version.empty()) {
      std::error_code ec;
      fs::path manifest = fs::absolute(settings.project_root, ec) / kProjectManifest;
      if (!fs::exists(manifest, ec)) {
        throw ConfigurationError(manifest.string() + " not found; set a version in the config");
      }
      auto found = ReadManifestVersion(manifest);
      if (!found) {
        throw ConfigurationError("No [project] version in " + manifest.string() +
                                 "; set a version in the config");
      }
      version = *found;
    }
    spdlog::debug("Resolved image {}-v{}", settings.image_prefix, version);
    return settings.image_prefix + "-v" + version;
  });
}

std::unique_ptr<SandboxProvider> SandboxBackend::Connect(const Settings& settings) {
  return factory_(kind_, ProviderEndpoint{settings.api_url, ResolveApiKey(settings)});
}

HarnessSpec SandboxBackend::GetHarnessSpec(const ExecutionConfig& config) const {
  HarnessSpec ret;
  ret.shell = Shell::BASH4;
  ret.interpreter = Normalize(config).interpreter;
  ret.result_file = kRemoteResultFile;
  ret.channel = kind_ == BackendKind::TEMPLATE_SANDBOX ?
      ResultChannel::SHARED_FILE : ResultChannel::CAPTURED_STDOUT;
  return ret;
}

void SandboxBackend::PreCheck(const ExecutionConfig& config) {
  Settings settings = Normalize(config);
  ResolveApiKey(settings);

  std::error_code ec;
  fs::path root = fs::absolute(settings.project_root, ec);
  fs::path dockerfile = settings.dockerfile_path.empty() ? fs::path("Dockerfile") : fs::path(settings.dockerfile_path);
  if (dockerfile.is_relative()) dockerfile = root / dockerfile;
  if (!fs::exists(dockerfile, ec)) {
    throw ConfigurationError("Dockerfile not found at " + dockerfile.string() +
                             "; set dockerfile in the config or add one to the project root");
  }
  if (!fs::is_regular_file(dockerfile, ec)) {
    throw ConfigurationError("Dockerfile path is not a file: " + dockerfile.string());
  }

  std::string image = ResolveImageName(settings);
  auto provider = Connect(settings);
  if (provider->ImageExists(image)) {
    spdlog::info("Image {} already exists", image);
    return;
  }
  spdlog::info("Image {} does not exist, building", image);
  auto contents = ReadFileToString(dockerfile);
  if (!contents) throw ConfigurationError("Cannot read " + dockerfile.string());
  ImageBuildSpec spec;
  spec.name = image;
  spec.dockerfile = std::move(*contents);
  spec.context = PackBuildContext(root);
  spdlog::info("Packed build context of {}: {} entries, {} bytes", image,
               spec.context.entries, spec.context.archive.size());
  spec.cpu_count = settings.cpu_count;
  spec.memory_mb = settings.memory_mb;
  spec.disk_gb = settings.disk_gb;
  BuildLogSink sink = build_log_;
  if (!sink) {
    sink = [image](const std::string& line) { spdlog::info("[{} build] {}", image, line); };
  }
  provider->BuildImage(spec, sink);
  spdlog::info("Image {} built", image);
}

ExecutionOutcome SandboxBackend::Execute(
    const ExecutionConfig& config, const Payload& payload, long deadline_ms) {
  auto start = Clock::now();
  std::unique_ptr<SandboxProvider> provider;
  std::string image;
  ResultChannel channel = ResultChannel::SHARED_FILE;
  try {
    Settings settings = Normalize(config);
    provider = Connect(settings);
    image = ResolveImageName(settings);
    channel = GetHarnessSpec(config).channel;
  } catch (const RemexError& e) {
    return ExecutionOutcome::Failure(FailureKind::REMOTE_FAULT, e.what());
  }

  InstanceGuard guard(*provider);
  try {
    guard.Attach(provider->CreateInstance(image, deadline_ms));
    spdlog::debug("Created sandbox {} from {}", guard.instance(), image);
    long remaining = deadline_ms - ElapsedMs(start);
    if (remaining > 0) {
      provider->WaitForInstance(guard.instance(), remaining);
      remaining = deadline_ms - ElapsedMs(start);
    }
    if (remaining <= 0) {
      return ExecutionOutcome::Failure(FailureKind::TIMEOUT,
          fmt::format("Deadline of {}ms spent provisioning the sandbox", deadline_ms));
    }
    CommandResult res = provider->RunCommand(
        guard.instance(), TransportCommand(payload.harness.script), remaining);
    spdlog::debug("Sandbox {} command exited with {}", guard.instance(), res.exit_code);

    std::optional<std::string> data;
    std::string output = res.stdout_text;
    if (channel == ResultChannel::CAPTURED_STDOUT) {
      data = SplitCaptured(res.stdout_text, payload.harness.result_marker);
      if (data) output = res.stdout_text.substr(0, res.stdout_text.size() - data->size());
    } else if (res.exit_code == 0) {
      try {
        data = provider->ReadFile(guard.instance(), kRemoteResultFile);
      } catch (const ProviderError& e) {
        return ExecutionOutcome::Failure(FailureKind::CHANNEL_ERROR,
            std::string("Reading the result file failed: ") + e.what(), 0);
      }
    } else {
      // the failed program may still have left a failure envelope
      try {
        data = provider->ReadFile(guard.instance(), kRemoteResultFile);
      } catch (const ProviderError& e) {
        spdlog::debug("No result file after failure: {}", e.what());
      }
    }

    if (res.exit_code != 0) {
      std::string msg = fmt::format("Sandbox command exited with code {}\nstdout: {}",
                                    res.exit_code, Preview(output));
      if (!res.stderr_text.empty()) msg += "\nstderr: " + Preview(res.stderr_text);
      auto ret = ExecutionOutcome::Failure(FailureKind::NON_ZERO_EXIT, msg, res.exit_code);
      if (data) ret.data = std::move(*data);
      return ret;
    }
    if (!data || data->empty()) {
      return ExecutionOutcome::Failure(FailureKind::CHANNEL_ERROR,
          "Sandbox command exited 0 without writing a result\nstdout: " + Preview(output), 0);
    }
    return ExecutionOutcome::Success(std::move(*data), 0);
  } catch (const ProviderTimeout& e) {
    return ExecutionOutcome::Failure(FailureKind::TIMEOUT,
        fmt::format("Deadline of {}ms exceeded: {}", deadline_ms, e.what()));
  } catch (const ProviderError& e) {
    return ExecutionOutcome::Failure(FailureKind::REMOTE_FAULT, e.what());
  }
}
