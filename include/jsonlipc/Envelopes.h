//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelopes.h
// Purpose: Application envelope model (result/error/progress/log, schema "envelope/v1")
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "jsonlipc/JSONValue.h"
#include "jsonlipc/errors/Errors.h"

namespace jsonlipc {

inline constexpr const char* EnvelopeSchema = "envelope/v1";

enum class EnvelopeKind {
    Result,
    Error,
    Progress,
    Log
};

enum class Status {
    Queued,
    Running,
    Succeeded,
    Failed,
    Cancelled,
    Retrying
};

// Severity of a LogMessage carried inside envelopes (distinct from the diagnostic LogLevel).
enum class MessageLevel {
    Info,
    Warn,
    Error,
    Debug
};

const char* ToString(EnvelopeKind kind);
const char* ToString(Status status);
const char* ToString(MessageLevel level);
std::optional<MessageLevel> MessageLevelFromString(const std::string& s);

//==========================================================================================================
// LogMessage
// Purpose: One entry of an envelope's "messages" list: { level, message, details? }.
//==========================================================================================================
struct LogMessage {
    MessageLevel level{MessageLevel::Info};
    std::string message;
    std::optional<JSONValue> details;

    JSONValue ToJSON() const;
};

LogMessage MakeLogMessage(MessageLevel level, std::string message, std::optional<JSONValue> details = std::nullopt);

//==========================================================================================================
// ProgressData
// Purpose: Progress payload { ratio, current, total, unit, stage?, message?, eta_ms? }.
//==========================================================================================================
struct ProgressData {
    double ratio{0.0};
    double current{0.0};
    double total{0.0};
    std::string unit;
    std::optional<std::string> stage;
    std::optional<std::string> message;
    std::optional<int64_t> etaMs;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// MakeProgressData
// Purpose: Builds ProgressData with ratio clamped to [0,1] (NaN becomes 0).
//==========================================================================================================
ProgressData MakeProgressData(double ratio, double current, double total, std::string unit,
                              std::optional<std::string> stage = std::nullopt,
                              std::optional<std::string> message = std::nullopt,
                              std::optional<int64_t> etaMs = std::nullopt);

// Current UTC time, ISO-8601 with microseconds and "+00:00" offset.
std::string UtcNow();

//==========================================================================================================
// MakeResultEnvelope
// Purpose: Result envelope { schema, kind:"result", request_id, ts, data, final, messages }.
// Args:
//   requestId: Owning request id.
//   data: Payload (null when absent).
//   final: false only for explicit partial results.
//   messages: Attached log messages.
//==========================================================================================================
JSONValue::Object MakeResultEnvelope(const std::string& requestId, JSONValue data, bool final = true,
                                     const std::vector<LogMessage>& messages = {});

//==========================================================================================================
// MakeErrorEnvelope
// Purpose: Terminal error envelope { schema, kind:"error", request_id, ts, error, final:true, status,
//          messages, details? }. details mirrors error.details when present.
//==========================================================================================================
JSONValue::Object MakeErrorEnvelope(const std::string& requestId, const errors::ErrorCode& error,
                                    Status status = Status::Failed,
                                    const std::vector<LogMessage>& messages = {});

JSONValue::Object MakeProgressEnvelope(const std::string& requestId, const ProgressData& progress,
                                       Status status = Status::Running,
                                       const std::vector<LogMessage>& messages = {});

//==========================================================================================================
// MakeLogEnvelope
// Purpose: Log envelope; session-scoped when requestId is empty.
//==========================================================================================================
JSONValue::Object MakeLogEnvelope(const std::vector<LogMessage>& messages,
                                  const std::optional<std::string>& requestId = std::nullopt);

//==========================================================================================================
// MakeLogErrorEnvelope
// Purpose: Non-terminal log envelope carrying one error-level message whose details is the ErrorCode.
//==========================================================================================================
JSONValue::Object MakeLogErrorEnvelope(const errors::ErrorCode& error,
                                       const std::optional<std::string>& requestId = std::nullopt);

// request_id of an envelope, when it has one.
std::optional<std::string> EnvelopeRequestId(const JSONValue::Object& envelope);

} // namespace jsonlipc
