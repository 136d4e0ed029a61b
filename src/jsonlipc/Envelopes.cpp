//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelopes.cpp
// Purpose: Envelope builders and enum string forms
//==========================================================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

#include "jsonlipc/Envelopes.h"

namespace jsonlipc {

const char* ToString(EnvelopeKind kind) {
    switch (kind) {
        case EnvelopeKind::Result: return "result";
        case EnvelopeKind::Error: return "error";
        case EnvelopeKind::Progress: return "progress";
        case EnvelopeKind::Log: return "log";
    }
    return "result";
}

const char* ToString(Status status) {
    switch (status) {
        case Status::Queued: return "queued";
        case Status::Running: return "running";
        case Status::Succeeded: return "succeeded";
        case Status::Failed: return "failed";
        case Status::Cancelled: return "cancelled";
        case Status::Retrying: return "retrying";
    }
    return "failed";
}

const char* ToString(MessageLevel level) {
    switch (level) {
        case MessageLevel::Info: return "info";
        case MessageLevel::Warn: return "warn";
        case MessageLevel::Error: return "error";
        case MessageLevel::Debug: return "debug";
    }
    return "info";
}

std::optional<MessageLevel> MessageLevelFromString(const std::string& s) {
    if (s == "info") return MessageLevel::Info;
    if (s == "warn") return MessageLevel::Warn;
    if (s == "error") return MessageLevel::Error;
    if (s == "debug") return MessageLevel::Debug;
    return std::nullopt;
}

JSONValue LogMessage::ToJSON() const {
    JSONValue::Object obj;
    SetMember(obj, "level", JSONValue(ToString(level)));
    SetMember(obj, "message", JSONValue(message));
    if (details.has_value()) {
        SetMember(obj, "details", *details);
    }
    return JSONValue{obj};
}

LogMessage MakeLogMessage(MessageLevel level, std::string message, std::optional<JSONValue> details) {
    LogMessage m;
    m.level = level;
    m.message = std::move(message);
    m.details = std::move(details);
    return m;
}

JSONValue ProgressData::ToJSON() const {
    JSONValue::Object obj;
    SetMember(obj, "ratio", JSONValue(ratio));
    SetMember(obj, "current", JSONValue(current));
    SetMember(obj, "total", JSONValue(total));
    SetMember(obj, "unit", JSONValue(unit));
    if (stage.has_value()) {
        SetMember(obj, "stage", JSONValue(*stage));
    }
    if (message.has_value()) {
        SetMember(obj, "message", JSONValue(*message));
    }
    if (etaMs.has_value()) {
        SetMember(obj, "eta_ms", JSONValue(*etaMs));
    }
    return JSONValue{obj};
}

ProgressData MakeProgressData(double ratio, double current, double total, std::string unit,
                              std::optional<std::string> stage, std::optional<std::string> message,
                              std::optional<int64_t> etaMs) {
    ProgressData p;
    if (std::isnan(ratio) || ratio < 0.0) {
        ratio = 0.0;
    } else if (ratio > 1.0) {
        ratio = 1.0;
    }
    p.ratio = ratio;
    p.current = current;
    p.total = total;
    p.unit = std::move(unit);
    p.stage = std::move(stage);
    p.message = std::move(message);
    p.etaMs = etaMs;
    return p;
}

std::string UtcNow() {
    const auto now = std::chrono::system_clock::now();
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(micros / 1000000);
    long frac = static_cast<long>(micros % 1000000);
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return std::string(buf);
}

namespace {

JSONValue::Object envelopeBase(EnvelopeKind kind) {
    JSONValue::Object env;
    SetMember(env, "schema", JSONValue(EnvelopeSchema));
    SetMember(env, "kind", JSONValue(ToString(kind)));
    SetMember(env, "ts", JSONValue(UtcNow()));
    return env;
}

JSONValue messagesValue(const std::vector<LogMessage>& messages) {
    JSONValue::Array arr;
    arr.reserve(messages.size());
    for (const auto& m : messages) {
        arr.push_back(std::make_shared<JSONValue>(m.ToJSON()));
    }
    return JSONValue{arr};
}

} // namespace

JSONValue::Object MakeResultEnvelope(const std::string& requestId, JSONValue data, bool final,
                                     const std::vector<LogMessage>& messages) {
    JSONValue::Object env = envelopeBase(EnvelopeKind::Result);
    SetMember(env, "request_id", JSONValue(requestId));
    SetMember(env, "data", std::move(data));
    SetMember(env, "final", JSONValue(final));
    SetMember(env, "messages", messagesValue(messages));
    return env;
}

JSONValue::Object MakeErrorEnvelope(const std::string& requestId, const errors::ErrorCode& error,
                                    Status status, const std::vector<LogMessage>& messages) {
    JSONValue::Object env = envelopeBase(EnvelopeKind::Error);
    SetMember(env, "request_id", JSONValue(requestId));
    SetMember(env, "error", errors::makeErrorValue(error));
    SetMember(env, "final", JSONValue(true));
    SetMember(env, "status", JSONValue(ToString(status)));
    SetMember(env, "messages", messagesValue(messages));
    if (error.details.has_value()) {
        SetMember(env, "details", *error.details);
    }
    return env;
}

JSONValue::Object MakeProgressEnvelope(const std::string& requestId, const ProgressData& progress,
                                       Status status, const std::vector<LogMessage>& messages) {
    JSONValue::Object env = envelopeBase(EnvelopeKind::Progress);
    SetMember(env, "request_id", JSONValue(requestId));
    SetMember(env, "progress", progress.ToJSON());
    SetMember(env, "status", JSONValue(ToString(status)));
    SetMember(env, "messages", messagesValue(messages));
    return env;
}

JSONValue::Object MakeLogEnvelope(const std::vector<LogMessage>& messages,
                                  const std::optional<std::string>& requestId) {
    JSONValue::Object env = envelopeBase(EnvelopeKind::Log);
    if (requestId.has_value() && !requestId->empty()) {
        SetMember(env, "request_id", JSONValue(*requestId));
    }
    SetMember(env, "messages", messagesValue(messages));
    return env;
}

JSONValue::Object MakeLogErrorEnvelope(const errors::ErrorCode& error,
                                       const std::optional<std::string>& requestId) {
    std::vector<LogMessage> messages;
    messages.push_back(MakeLogMessage(MessageLevel::Error, error.message, errors::makeErrorValue(error)));
    return MakeLogEnvelope(messages, requestId);
}

std::optional<std::string> EnvelopeRequestId(const JSONValue::Object& envelope) {
    return GetString(envelope, "request_id");
}

} // namespace jsonlipc
