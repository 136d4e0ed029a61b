//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageRouter.cpp
// Purpose: Default implementation for inbound message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "jsonlipc/MessageRouter.h"

namespace jsonlipc {

namespace {

class MessageRouter : public IMessageRouter {
public:
    explicit MessageRouter(const errors::ErrorTaxonomy& taxonomy) : taxonomy_(taxonomy) {}

    MessageKind classify(const JSONValue& message) override {
        if (!message.IsObject()) {
            return MessageKind::Invalid;
        }
        auto type = GetString(std::get<JSONValue::Object>(message.value), "type");
        if (type == MessageTypes::Request) {
            return MessageKind::Request;
        }
        if (type == MessageTypes::Notification) {
            return MessageKind::Notification;
        }
        return MessageKind::Unknown;
    }

    bool route(const JSONValue& message, RouterHandlers& handlers) override {
        switch (classify(message)) {
            case MessageKind::Invalid:
                reportSession(handlers, "Message must be a JSON object");
                return false;
            case MessageKind::Unknown:
                LOG_DEBUG("Router: ignoring message with unrecognized type");
                return false;
            case MessageKind::Request:
                return routeRequest(std::get<JSONValue::Object>(message.value), handlers);
            case MessageKind::Notification:
                return routeNotification(std::get<JSONValue::Object>(message.value), handlers);
        }
        return false;
    }

    bool routeLine(const std::string& line, RouterHandlers& handlers) override {
        JSONValue message;
        try {
            message = ParseJSON(line);
        } catch (const JSONParseError& e) {
            LOG_WARN("Router: JSON decode error: {}", e.what());
            if (handlers.errorHandler) {
                RouteError err;
                err.scope = ErrorScope::Session;
                err.error.code = taxonomy_.CodeFor(errors::ErrorKind::DecodeFailure);
                err.error.message = std::string("JSON decode error: ") + e.what();
                handlers.errorHandler(err);
            }
            return false;
        }
        return route(message, handlers);
    }

private:
    void reportSession(RouterHandlers& handlers, const std::string& msg) {
        LOG_WARN("Router: invalid message: {}", msg);
        if (handlers.errorHandler) {
            RouteError err;
            err.scope = ErrorScope::Session;
            err.error.code = taxonomy_.CodeFor(errors::ErrorKind::ValidationFailure);
            err.error.message = msg;
            handlers.errorHandler(err);
        }
    }

    void reportRequest(RouterHandlers& handlers, const std::string& id, const std::string& msg) {
        LOG_WARN("Router: invalid request {}: {}", id, msg);
        if (handlers.errorHandler) {
            RouteError err;
            err.scope = ErrorScope::Request;
            err.requestId = id;
            err.error.code = taxonomy_.CodeFor(errors::ErrorKind::ValidationFailure);
            err.error.message = msg;
            handlers.errorHandler(err);
        }
    }

    // Returns false (and reports) when params is present but not an object.
    static bool extractParams(const JSONValue::Object& obj, std::optional<JSONValue::Object>& out) {
        const JSONValue* params = FindMember(obj, "params");
        if (params == nullptr) {
            return true;
        }
        if (!params->IsObject()) {
            return false;
        }
        out = std::get<JSONValue::Object>(params->value);
        return true;
    }

    bool routeRequest(const JSONValue::Object& obj, RouterHandlers& handlers) {
        auto id = GetString(obj, "id");
        if (!id.has_value() || id->empty()) {
            reportSession(handlers, "Request must have string 'id' field");
            return false;
        }
        // An empty method is still a string; dispatch reports it as not found.
        auto method = GetString(obj, "method");
        if (!method.has_value()) {
            reportRequest(handlers, *id, "Request must have string 'method' field");
            return false;
        }
        InboundRequest request;
        if (!extractParams(obj, request.params)) {
            reportRequest(handlers, *id, "Request 'params' must be an object");
            return false;
        }
        request.id = std::move(*id);
        request.method = std::move(*method);
        if (!handlers.requestHandler) {
            LOG_WARN("Router: no request handler for {}", request.method);
            return false;
        }
        handlers.requestHandler(std::move(request));
        return true;
    }

    bool routeNotification(const JSONValue::Object& obj, RouterHandlers& handlers) {
        auto method = GetString(obj, "method");
        if (!method.has_value()) {
            reportSession(handlers, "Notification must have string 'method' field");
            return false;
        }
        InboundNotification notification;
        if (const JSONValue* id = FindMember(obj, "id")) {
            if (!id->IsString()) {
                reportSession(handlers, "Notification 'id' must be a string");
                return false;
            }
            notification.id = std::get<std::string>(id->value);
        }
        if (!extractParams(obj, notification.params)) {
            reportSession(handlers, "Notification 'params' must be an object");
            return false;
        }
        notification.method = std::move(*method);
        if (!handlers.notificationHandler) {
            LOG_WARN("Router: no notification handler for {}", notification.method);
            return false;
        }
        handlers.notificationHandler(std::move(notification));
        return true;
    }

    const errors::ErrorTaxonomy& taxonomy_;
};

} // namespace

std::unique_ptr<IMessageRouter> MakeDefaultMessageRouter(const errors::ErrorTaxonomy& taxonomy) {
    return std::make_unique<MessageRouter>(taxonomy);
}

} // namespace jsonlipc
