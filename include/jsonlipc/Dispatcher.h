//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Method registration, handler invocation contract and handler context
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "jsonlipc/Envelopes.h"
#include "jsonlipc/JSONValue.h"
#include "jsonlipc/errors/Errors.h"

namespace jsonlipc {

//==========================================================================================================
// HandlerOutcome
// Purpose: Terminal outcome of a handler - success with a payload, or a failure with a chosen code.
//==========================================================================================================
struct HandlerSuccess {
    JSONValue data;
};

struct HandlerFailure {
    errors::ErrorCode error;
    Status status{Status::Failed};
};

using HandlerOutcome = std::variant<HandlerSuccess, HandlerFailure>;

// Success with a null payload.
HandlerOutcome Success();
HandlerOutcome Success(JSONValue data);
HandlerOutcome Success(JSONValue::Object data);
HandlerOutcome Failure(std::string code, std::string message, std::optional<JSONValue> details = std::nullopt);

//==========================================================================================================
// IEnvelopeSink
// Purpose: Outbound side of dispatch. Implemented by the Worker, which stamps per-request seq and wraps
//          envelopes into transport messages.
//==========================================================================================================
class IEnvelopeSink {
public:
    virtual ~IEnvelopeSink() = default;

    // Result envelope (terminal when envelope.final is true).
    virtual bool SendResult(const std::string& requestId, JSONValue::Object envelope) = 0;
    // Error envelope (always terminal).
    virtual bool SendError(const std::string& requestId, JSONValue::Object envelope) = 0;
    virtual bool SendProgress(const std::string& requestId, JSONValue::Object envelope) = 0;
    // Log envelope; addressed to its request_id, or to the session when it has none.
    virtual bool SendLog(JSONValue::Object envelope) = 0;

    // Begins draining; returns false when already draining or terminated.
    virtual bool RequestShutdown(const std::string& reason) = 0;
    virtual const std::string& SessionId() const = 0;
};

//==========================================================================================================
// HandlerContext
// Purpose: What a context handler sees: the call (method, request id, params) plus streaming helpers
//          for its own request id.
//==========================================================================================================
class HandlerContext {
public:
    HandlerContext(std::string method, std::string requestId, const JSONValue::Object& params, IEnvelopeSink& sink);

    const std::string& Method() const { return method_; }
    const std::string& RequestId() const { return requestId_; }
    const JSONValue::Object& Params() const { return params_; }
    const std::string& SessionId() const { return sink_.SessionId(); }

    //==========================================================================================================
    // SendProgress
    // Purpose: Emits a Progress notification. ratio = current/total (0 when total is 0), clamped to [0,1].
    //==========================================================================================================
    bool SendProgress(double current, double total, const std::string& unit = "items",
                      std::optional<std::string> stage = std::nullopt,
                      std::optional<std::string> message = std::nullopt,
                      std::optional<int64_t> etaMs = std::nullopt);
    bool SendProgress(const ProgressData& progress);

    // Emits a Log notification for this request, or for the session when sessionLevel is true.
    bool SendLog(const std::vector<LogMessage>& messages, bool sessionLevel = false);

    bool LogInfo(const std::string& message, std::optional<JSONValue> details = std::nullopt);
    bool LogWarn(const std::string& message, std::optional<JSONValue> details = std::nullopt);
    bool LogError(const std::string& message, std::optional<JSONValue> details = std::nullopt);
    bool LogDebug(const std::string& message, std::optional<JSONValue> details = std::nullopt);

    // Emits a non-final Result; the handler's return value is still the terminal message.
    bool SendPartialResult(JSONValue data);

    bool RequestShutdown(const std::string& reason);

private:
    std::string method_;
    std::string requestId_;
    const JSONValue::Object& params_;
    IEnvelopeSink& sink_;
};

// Receives the full context.
using ContextHandler = std::function<HandlerOutcome(HandlerContext&)>;
// Receives only the params object.
using ParamsHandler = std::function<HandlerOutcome(const JSONValue::Object&)>;

//==========================================================================================================
// Dispatcher
// Purpose: Maps method names to handlers and converts every handler outcome (returned or thrown) into
//          exactly one terminal Result or Error envelope.
// Notes:
//   ping and shutdown are pre-registered and may be overridden or unregistered.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(IEnvelopeSink& sink, const errors::ErrorTaxonomy& taxonomy);

    // Registers (or replaces) a handler receiving the full context.
    void RegisterHandler(const std::string& method, ContextHandler handler);

    // Registers (or replaces) a handler receiving only params.
    void RegisterParamsHandler(const std::string& method, ParamsHandler handler);

    //==========================================================================================================
    // RegisterTypedHandler
    // Purpose: Registers a handler receiving a fixed parameter record. Params::FromJSON decodes the params
    //          object once per call and throws errors::InvalidParametersError on bad input.
    //==========================================================================================================
    template <typename Params>
    void RegisterTypedHandler(const std::string& method, std::function<HandlerOutcome(const Params&)> handler) {
        RegisterParamsHandler(method, [h = std::move(handler)](const JSONValue::Object& params) {
            return h(Params::FromJSON(params));
        });
    }

    // Returns true when a handler was removed.
    bool UnregisterHandler(const std::string& method);
    bool HasHandler(const std::string& method) const;
    std::vector<std::string> RegisteredMethods() const;

    //==========================================================================================================
    // Dispatch
    // Purpose: Invokes the handler for method and emits its terminal envelope for requestId.
    //          Never throws for handler failures.
    //==========================================================================================================
    void Dispatch(const std::string& method, const std::string& requestId, const JSONValue::Object& params);

private:
    using Handler = std::variant<ContextHandler, ParamsHandler>;

    void registerBuiltins();
    void emit(const std::string& requestId, HandlerOutcome outcome);
    void emitError(const std::string& requestId, const errors::ErrorCode& error, Status status = Status::Failed);

    IEnvelopeSink& sink_;
    const errors::ErrorTaxonomy& taxonomy_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace jsonlipc
