#include <remex/dispatcher.h>

#include <spdlog/spdlog.h>
#include <remex/envelope.h>
#include <remex/harness.h>
#include "utils.h"

void ThrowUndecodable(const nlohmann::json& doc, const std::string& raw) {
  if (!doc.is_discarded()) {
    if (auto env = ParseFailureEnvelope(doc)) {
      throw RemoteApplicationError(env->error_type, env->error_message);
    }
  }
  throw ChannelError("Result matches neither the expected schema nor the failure envelope: " +
                     Preview(raw), 0);
}

void ThrowOutcome(const ExecutionOutcome& outcome) {
  switch (outcome.kind) {
    case FailureKind::TIMEOUT:
      throw TimeoutError(outcome.message);
    case FailureKind::NON_ZERO_EXIT:
      // the program failed but delivered its error through the channel
      if (auto env = ParseFailureEnvelope(outcome.data)) {
        throw RemoteApplicationError(env->error_type, env->error_message);
      }
      throw NonZeroExitError(outcome.message, outcome.exit_code);
    case FailureKind::CHANNEL_ERROR:
      throw ChannelError(outcome.message, outcome.exit_code);
    case FailureKind::REMOTE_FAULT:
      throw RemoteFaultError(outcome.message);
  }
  __builtin_unreachable();
}

Dispatcher::Dispatcher(BackendTable table, std::shared_ptr<const PayloadGenerator> generator) :
    table_(std::move(table)), generator_(std::move(generator)) {}

Backend& Dispatcher::BackendFor(const ExecutionConfig& config) {
  auto& backend = table_[(size_t)KindOf(config)];
  if (!backend) {
    throw ConfigurationError(std::string("No backend registered for ") + BackendKindName(KindOf(config)));
  }
  return *backend;
}

void Dispatcher::Activate(const ExecutionConfig& config) {
  Backend& backend = BackendFor(config);
  if (cache_.RunOnce(config, [&]() { backend.PreCheck(config); })) {
    spdlog::debug("Pre-check of {} config passed", BackendKindName(KindOf(config)));
  }
}

std::string Dispatcher::CallRaw(const ExecutionConfig& config, const WorkItem& work, long timeout_ms) {
  if (timeout_ms <= 0) {
    throw ConfigurationError(fmt::format("Deadline must be positive, got {}ms", timeout_ms));
  }
  if (InRemoteExecution()) {
    if (!work.in_process) {
      throw ConfigurationError("No in-process implementation of " + work.module + "." + work.function);
    }
    spdlog::debug("Inside remote execution; running {}.{} in-process", work.module, work.function);
    return work.in_process(work.argument).dump();
  }
  Activate(config);
  Backend& backend = BackendFor(config);
  Payload payload;
  payload.program = generator_->Generate(work);
  payload.harness = RenderHarness(backend.GetHarnessSpec(config), payload.program);
  spdlog::debug("Calling {}.{} on {} with a {}ms deadline", work.module, work.function,
                BackendKindName(KindOf(config)), timeout_ms);
  ExecutionOutcome outcome = backend.Execute(config, payload, timeout_ms);
  if (!outcome.ok) {
    spdlog::debug("{}.{} failed: {}", work.module, work.function, FailureKindName(outcome.kind));
    ThrowOutcome(outcome);
  }
  return std::move(outcome.data);
}
