//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Messages.cpp
// Purpose: Outbound message builders
//==========================================================================================================

#include "jsonlipc/Messages.h"

namespace jsonlipc {

JSONValue::Object ToJSON(const InboundRequest& request) {
    JSONValue::Object obj;
    SetMember(obj, "type", JSONValue(MessageTypes::Request));
    SetMember(obj, "id", JSONValue(request.id));
    SetMember(obj, "method", JSONValue(request.method));
    if (request.params.has_value()) {
        SetMember(obj, "params", JSONValue(*request.params));
    }
    return obj;
}

JSONValue::Object MakeResponseMessage(const std::string& id, JSONValue data) {
    JSONValue::Object obj;
    SetMember(obj, "id", JSONValue(id));
    SetMember(obj, "type", JSONValue(MessageTypes::Response));
    SetMember(obj, "data", std::move(data));
    return obj;
}

JSONValue::Object MakeErrorResponseMessage(const std::string& id, const errors::ErrorCode& error) {
    JSONValue::Object obj;
    SetMember(obj, "id", JSONValue(id));
    SetMember(obj, "type", JSONValue(MessageTypes::Response));
    SetMember(obj, "error", errors::makeErrorValue(error));
    return obj;
}

JSONValue::Object MakeNotificationMessage(const std::string& id, const std::string& method,
                                          std::optional<JSONValue> data) {
    JSONValue::Object obj;
    SetMember(obj, "id", JSONValue(id));
    SetMember(obj, "type", JSONValue(MessageTypes::Notification));
    SetMember(obj, "method", JSONValue(method));
    if (data.has_value()) {
        SetMember(obj, "data", std::move(*data));
    }
    return obj;
}

JSONValue::Object MakeSessionErrorMessage(const std::string& sessionId, const errors::ErrorCode& error) {
    JSONValue::Object obj = MakeNotificationMessage(sessionId, Methods::Error);
    SetMember(obj, "error", errors::makeErrorValue(error));
    return obj;
}

} // namespace jsonlipc
