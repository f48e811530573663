#ifndef INCLUDE_REMEX_ENVELOPE_H_
#define INCLUDE_REMEX_ENVELOPE_H_

#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>

// {"__remote_execution_error__": true, "error_type": ..., "error_message": ...}
extern const char kEnvelopeMarkerKey[];

struct FailureEnvelope {
  std::string error_type;
  std::string error_message;
};

std::string EncodeFailureEnvelope(const FailureEnvelope&);
// nullopt unless the document carries the marker and both string fields
std::optional<FailureEnvelope> ParseFailureEnvelope(const nlohmann::json&);
std::optional<FailureEnvelope> ParseFailureEnvelope(const std::string& raw);

#endif  // INCLUDE_REMEX_ENVELOPE_H_
