//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Messages.h
// Purpose: Transport-level message types (request/response/notification) and outbound message builders
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "jsonlipc/JSONValue.h"
#include "jsonlipc/errors/Errors.h"

namespace jsonlipc {

namespace MessageTypes {
    inline constexpr const char* Request = "request";
    inline constexpr const char* Response = "response";
    inline constexpr const char* Notification = "notification";
}

namespace Methods {
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* Shutdown = "shutdown";
    inline constexpr const char* Default = "default";
    // Outbound notification methods
    inline constexpr const char* Ready = "ready";
    inline constexpr const char* Progress = "progress";
    inline constexpr const char* Log = "log";
    inline constexpr const char* Error = "error";
}

//==========================================================================================================
// InboundRequest
// Purpose: Validated request { id, method, params? }.
//==========================================================================================================
struct InboundRequest {
    std::string id;
    std::string method;
    std::optional<JSONValue::Object> params;
};

//==========================================================================================================
// InboundNotification
// Purpose: Validated notification { method, id?, params? }. Dispatched like a request; its results are
//          addressed to id when present, otherwise to the session id.
//==========================================================================================================
struct InboundNotification {
    std::string method;
    std::optional<std::string> id;
    std::optional<JSONValue::Object> params;
};

using InboundMessage = std::variant<InboundRequest, InboundNotification>;

// Wire form of an inbound request (used for synthetic requests and by tests).
JSONValue::Object ToJSON(const InboundRequest& request);

//------------------------------ Outbound builders ------------------------------
// { id, type:"response", data }
JSONValue::Object MakeResponseMessage(const std::string& id, JSONValue data);

// { id, type:"response", error } for request-scoped validation failures.
JSONValue::Object MakeErrorResponseMessage(const std::string& id, const errors::ErrorCode& error);

// { id, type:"notification", method, data? }
JSONValue::Object MakeNotificationMessage(const std::string& id, const std::string& method,
                                          std::optional<JSONValue> data = std::nullopt);

// { id:<session>, type:"notification", method:"error", error }
JSONValue::Object MakeSessionErrorMessage(const std::string& sessionId, const errors::ErrorCode& error);

} // namespace jsonlipc
