//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageRouter.h
// Purpose: Interface for inbound message routing (classification, validation and hand-off)
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "jsonlipc/JSONValue.h"
#include "jsonlipc/Messages.h"
#include "jsonlipc/errors/Errors.h"

namespace jsonlipc {

// Where a routing error must be reported.
enum class ErrorScope {
    Session,   // notification method "error" addressed to the session id
    Request    // response carrying "error" addressed to the offending request id
};

struct RouteError {
    ErrorScope scope{ErrorScope::Session};
    std::string requestId; // set for ErrorScope::Request
    errors::ErrorCode error;
};

struct RouterHandlers {
    std::function<void(InboundRequest&&)> requestHandler;
    std::function<void(InboundNotification&&)> notificationHandler;
    std::function<void(const RouteError&)> errorHandler;
};

class IMessageRouter {
public:
    virtual ~IMessageRouter() = default;

    enum class MessageKind {
        Request,
        Notification,
        Unknown,   // object with a missing or unrecognized "type"; ignored
        Invalid    // not an object
    };

    // Classify a parsed message without validating fields or invoking handlers.
    virtual MessageKind classify(const JSONValue& message) = 0;

    //========================================================================================================
    // route
    // Purpose: Validates a parsed message and hands it to the matching handler. Validation failures are
    //          reported through handlers.errorHandler and never reach the request/notification handlers.
    // Returns:
    //   true when the message was handed to a request or notification handler.
    //========================================================================================================
    virtual bool route(const JSONValue& message, RouterHandlers& handlers) = 0;

    //========================================================================================================
    // routeLine
    // Purpose: Parses one inbound line and routes it. Unparsable text is reported as a session-scoped
    //          decode failure.
    //========================================================================================================
    virtual bool routeLine(const std::string& line, RouterHandlers& handlers) = 0;
};

// Factory: returns the default router implementation. The taxonomy must outlive the router.
std::unique_ptr<IMessageRouter> MakeDefaultMessageRouter(const errors::ErrorTaxonomy& taxonomy);

} // namespace jsonlipc
