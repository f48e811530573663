#include <remex/envelope.h>
#include <remex/outcome.h>

#include <nlohmann/json.hpp>

const char kEnvelopeMarkerKey[] = "__remote_execution_error__";

ExecutionOutcome ExecutionOutcome::Success(std::string data, int exit_code) {
  ExecutionOutcome ret;
  ret.ok = true;
  ret.data = std::move(data);
  ret.exit_code = exit_code;
  return ret;
}

ExecutionOutcome ExecutionOutcome::Failure(FailureKind kind, std::string message, int exit_code) {
  ExecutionOutcome ret;
  ret.ok = false;
  ret.kind = kind;
  ret.message = std::move(message);
  ret.exit_code = exit_code;
  return ret;
}

std::string EncodeFailureEnvelope(const FailureEnvelope& env) {
  nlohmann::json doc{
    {kEnvelopeMarkerKey, true},
    {"error_type", env.error_type},
    {"error_message", env.error_message},
  };
  return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<FailureEnvelope> ParseFailureEnvelope(const nlohmann::json& doc) {
  if (!doc.is_object()) return std::nullopt;
  auto marker = doc.find(kEnvelopeMarkerKey);
  if (marker == doc.end() || !marker->is_boolean() || !marker->get<bool>()) return std::nullopt;
  auto type = doc.find("error_type");
  auto message = doc.find("error_message");
  if (type == doc.end() || !type->is_string()) return std::nullopt;
  if (message == doc.end() || !message->is_string()) return std::nullopt;
  return FailureEnvelope{type->get<std::string>(), message->get<std::string>()};
}

std::optional<FailureEnvelope> ParseFailureEnvelope(const std::string& raw) {
  nlohmann::json doc = nlohmann::json::parse(raw, nullptr, false);
  if (doc.is_discarded()) return std::nullopt;
  return ParseFailureEnvelope(doc);
}
