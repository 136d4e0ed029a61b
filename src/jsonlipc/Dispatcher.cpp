//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Handler invocation, outcome-to-envelope conversion and built-in methods
//==========================================================================================================

#include <functional>
#include <type_traits>
#include <variant>

#include "logging/Logger.h"
#include "jsonlipc/Dispatcher.h"
#include "jsonlipc/Messages.h"

namespace jsonlipc {

HandlerOutcome Success() {
    return HandlerSuccess{JSONValue{}};
}

HandlerOutcome Success(JSONValue data) {
    return HandlerSuccess{std::move(data)};
}

HandlerOutcome Success(JSONValue::Object data) {
    return HandlerSuccess{JSONValue{std::move(data)}};
}

HandlerOutcome Failure(std::string code, std::string message, std::optional<JSONValue> details) {
    HandlerFailure f;
    f.error.code = std::move(code);
    f.error.message = std::move(message);
    f.error.details = std::move(details);
    return f;
}

////////////////////////////////////////// HandlerContext //////////////////////////////////////////

HandlerContext::HandlerContext(std::string method, std::string requestId, const JSONValue::Object& params,
                               IEnvelopeSink& sink)
    : method_(std::move(method)), requestId_(std::move(requestId)), params_(params), sink_(sink) {}

bool HandlerContext::SendProgress(double current, double total, const std::string& unit,
                                  std::optional<std::string> stage, std::optional<std::string> message,
                                  std::optional<int64_t> etaMs) {
    const double ratio = total > 0.0 ? current / total : 0.0;
    return SendProgress(MakeProgressData(ratio, current, total, unit, std::move(stage), std::move(message), etaMs));
}

bool HandlerContext::SendProgress(const ProgressData& progress) {
    return sink_.SendProgress(requestId_, MakeProgressEnvelope(requestId_, progress));
}

bool HandlerContext::SendLog(const std::vector<LogMessage>& messages, bool sessionLevel) {
    if (sessionLevel) {
        return sink_.SendLog(MakeLogEnvelope(messages));
    }
    return sink_.SendLog(MakeLogEnvelope(messages, requestId_));
}

bool HandlerContext::LogInfo(const std::string& message, std::optional<JSONValue> details) {
    return SendLog({MakeLogMessage(MessageLevel::Info, message, std::move(details))});
}

bool HandlerContext::LogWarn(const std::string& message, std::optional<JSONValue> details) {
    return SendLog({MakeLogMessage(MessageLevel::Warn, message, std::move(details))});
}

bool HandlerContext::LogError(const std::string& message, std::optional<JSONValue> details) {
    return SendLog({MakeLogMessage(MessageLevel::Error, message, std::move(details))});
}

bool HandlerContext::LogDebug(const std::string& message, std::optional<JSONValue> details) {
    return SendLog({MakeLogMessage(MessageLevel::Debug, message, std::move(details))});
}

bool HandlerContext::SendPartialResult(JSONValue data) {
    return sink_.SendResult(requestId_, MakeResultEnvelope(requestId_, std::move(data), false));
}

bool HandlerContext::RequestShutdown(const std::string& reason) {
    return sink_.RequestShutdown(reason);
}

////////////////////////////////////////// Dispatcher //////////////////////////////////////////

Dispatcher::Dispatcher(IEnvelopeSink& sink, const errors::ErrorTaxonomy& taxonomy)
    : sink_(sink), taxonomy_(taxonomy) {
    registerBuiltins();
}

void Dispatcher::registerBuiltins() {
    RegisterParamsHandler(Methods::Ping, [](const JSONValue::Object&) {
        JSONValue::Object out;
        SetMember(out, "response", JSONValue("pong"));
        return Success(std::move(out));
    });

    RegisterHandler(Methods::Shutdown, [](HandlerContext& ctx) {
        std::string reason = GetString(ctx.Params(), "reason").value_or("Shutdown requested via IPC");
        if (!ctx.RequestShutdown(reason)) {
            LOG_DEBUG("shutdown requested while already draining (reason={})", reason);
        }
        JSONValue::Object out;
        SetMember(out, "status", JSONValue("shutting down"));
        return Success(std::move(out));
    });
}

void Dispatcher::RegisterHandler(const std::string& method, ContextHandler handler) {
    FUNC_SCOPE();
    handlers_[method] = Handler{std::in_place_type<ContextHandler>, std::move(handler)};
}

void Dispatcher::RegisterParamsHandler(const std::string& method, ParamsHandler handler) {
    FUNC_SCOPE();
    handlers_[method] = Handler{std::in_place_type<ParamsHandler>, std::move(handler)};
}

bool Dispatcher::UnregisterHandler(const std::string& method) {
    return handlers_.erase(method) > 0;
}

bool Dispatcher::HasHandler(const std::string& method) const {
    return handlers_.find(method) != handlers_.end();
}

std::vector<std::string> Dispatcher::RegisteredMethods() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& kv : handlers_) {
        out.push_back(kv.first);
    }
    return out;
}

void Dispatcher::Dispatch(const std::string& method, const std::string& requestId, const JSONValue::Object& params) {
    FUNC_SCOPE();
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        it = handlers_.find(Methods::Default);
        if (it == handlers_.end()) {
            LOG_WARN("Dispatcher: method not found: {}", method);
            emitError(requestId, errors::ErrorCode{taxonomy_.CodeFor(errors::ErrorKind::MethodNotFound),
                                                   "Method not found: " + method, std::nullopt});
            return;
        }
        LOG_DEBUG("Dispatcher: routing {} to default handler", method);
    }

    // Copy so a handler may re-register or unregister itself while running.
    Handler handler = it->second;
    HandlerContext ctx(method, requestId, params, sink_);
    HandlerOutcome outcome;
    try {
        outcome = std::visit([&ctx](auto& h) -> HandlerOutcome {
            using H = std::decay_t<decltype(h)>;
            if constexpr (std::is_same_v<H, ContextHandler>) {
                return h(ctx);
            } else {
                return h(ctx.Params());
            }
        }, handler);
    } catch (const std::bad_function_call& e) {
        LOG_ERROR("Dispatcher: handler for {} is not callable: {}", method, e.what());
        outcome = HandlerFailure{errors::ErrorCode{taxonomy_.CodeFor(errors::ErrorKind::HandlerException),
                                                   "Handler for '" + method + "' is not callable", std::nullopt}};
    } catch (const std::exception& e) {
        errors::ErrorCode err = taxonomy_.FromException(e);
        LOG_WARN("Dispatcher: handler {} failed ({}): {}", method, err.code, err.message);
        outcome = HandlerFailure{std::move(err)};
    } catch (...) {
        LOG_ERROR("Dispatcher: handler {} threw a non-standard exception", method);
        outcome = HandlerFailure{errors::ErrorCode{taxonomy_.CodeFor(errors::ErrorKind::HandlerException),
                                                   "Handler '" + method + "' raised an unknown exception", std::nullopt}};
    }
    emit(requestId, std::move(outcome));
}

void Dispatcher::emit(const std::string& requestId, HandlerOutcome outcome) {
    if (auto* ok = std::get_if<HandlerSuccess>(&outcome)) {
        if (!sink_.SendResult(requestId, MakeResultEnvelope(requestId, std::move(ok->data), true))) {
            LOG_WARN("Dispatcher: result for {} was not delivered", requestId);
        }
        return;
    }
    auto& failure = std::get<HandlerFailure>(outcome);
    if (failure.error.code.empty()) {
        failure.error.code = taxonomy_.CodeFor(errors::ErrorKind::InternalFault);
    }
    emitError(requestId, failure.error, failure.status);
}

void Dispatcher::emitError(const std::string& requestId, const errors::ErrorCode& error, Status status) {
    if (!sink_.SendError(requestId, MakeErrorEnvelope(requestId, error, status))) {
        LOG_WARN("Dispatcher: error for {} was not delivered", requestId);
    }
}

} // namespace jsonlipc
