//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Worker.cpp
// Purpose: Worker main loop, drain sequence and envelope sink
//==========================================================================================================

#include <unistd.h>

#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "jsonlipc/Envelopes.h"
#include "jsonlipc/Messages.h"
#include "jsonlipc/Worker.h"
#include "jsonlipc/version.h"

namespace jsonlipc {

////////////////////////////////////////// WorkerOptions //////////////////////////////////////////

WorkerOptions WorkerOptions::FromEnvironment() {
    WorkerOptions o;
    const uint64_t pollMs = GetEnvUInt64OrDefault("JSONLIPC_POLL_INTERVAL_MS",
                                                  static_cast<uint64_t>(o.pollInterval.count()));
    if (pollMs > 0) {
        o.pollInterval = std::chrono::milliseconds(pollMs);
    }
    const uint64_t maxLine = GetEnvUInt64OrDefault("JSONLIPC_MAX_LINE_BYTES", o.maxLineBytes);
    if (maxLine > 0) {
        o.maxLineBytes = static_cast<std::size_t>(maxLine);
    }
    o.handleSignals = GetEnvBoolOrDefault("JSONLIPC_HANDLE_SIGNALS", o.handleSignals);
    return o;
}

WorkerOptions WorkerOptions::FromConfigString(const std::string& config, WorkerOptions base) {
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        try { out = static_cast<uint64_t>(std::stoull(s)); return true; } catch (const std::exception&) { return false; }
    };
    auto parseBool = [](const std::string& s, bool& out) -> bool {
        if (s == "1" || s == "true" || s == "TRUE") { out = true; return true; }
        if (s == "0" || s == "false" || s == "FALSE") { out = false; return true; }
        return false;
    };

    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("WorkerOptions: ignoring malformed token '{}'", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        bool ok = true;
        if (key == "poll_interval_ms") {
            uint64_t v = 0;
            ok = parseUint(val, v) && v > 0;
            if (ok) base.pollInterval = std::chrono::milliseconds(v);
        } else if (key == "max_line_bytes") {
            uint64_t v = 0;
            ok = parseUint(val, v) && v > 0;
            if (ok) base.maxLineBytes = static_cast<std::size_t>(v);
        } else if (key == "handle_signals") {
            bool v = true;
            ok = parseBool(val, v);
            if (ok) base.handleSignals = v;
        } else {
            LOG_WARN("WorkerOptions: unknown key '{}'", key);
            continue;
        }
        if (!ok) {
            LOG_WARN("WorkerOptions: invalid value '{}' for {}", val, key);
        }
    }
    return base;
}

WorkerOptions WorkerOptions::FromConfigString(const std::string& config) {
    return FromConfigString(config, WorkerOptions{});
}

////////////////////////////////////////// Worker //////////////////////////////////////////

Worker::Worker(std::unique_ptr<ILineTransport> transport, WorkerOptions options)
    : transport_(std::move(transport)),
      options_(options),
      router_(MakeDefaultMessageRouter(taxonomy_)),
      dispatcher_(*this, taxonomy_),
      coordinator_(session_, [this](InboundItem item) { transport_->Inject(std::move(item)); }) {
    if (!transport_) {
        throw std::invalid_argument("Worker requires a transport");
    }
    transport_->SetMaxLineBytes(options_.maxLineBytes);

    routerHandlers_.requestHandler = [this](InboundRequest&& request) {
        static const JSONValue::Object noParams;
        dispatcher_.Dispatch(request.method, request.id, request.params ? *request.params : noParams);
    };
    routerHandlers_.notificationHandler = [this](InboundNotification&& notification) {
        static const JSONValue::Object noParams;
        const std::string& target = (notification.id && !notification.id->empty()) ? *notification.id : session_.Id();
        dispatcher_.Dispatch(notification.method, target, notification.params ? *notification.params : noParams);
    };
    routerHandlers_.errorHandler = [this](const RouteError& err) {
        if (err.scope == ErrorScope::Request) {
            if (!transport_->Send(MakeErrorResponseMessage(err.requestId, err.error))) {
                LOG_WARN("Worker: validation error for {} was not delivered", err.requestId);
            }
        } else {
            sendSessionError(err.error);
        }
    };
}

Worker::~Worker() = default;

void Worker::RegisterHandler(const std::string& method, ContextHandler handler) {
    dispatcher_.RegisterHandler(method, std::move(handler));
}

void Worker::RegisterParamsHandler(const std::string& method, ParamsHandler handler) {
    dispatcher_.RegisterParamsHandler(method, std::move(handler));
}

bool Worker::UnregisterHandler(const std::string& method) {
    return dispatcher_.UnregisterHandler(method);
}

bool Worker::HasHandler(const std::string& method) const {
    return dispatcher_.HasHandler(method);
}

int Worker::Run() {
    FUNC_SCOPE();
    if (ran_) {
        LOG_ERROR("Worker {}: Run() called more than once", session_.Id());
        return 1;
    }
    ran_ = true;

    transport_->SetErrorHandler([](const std::string& error) {
        LOG_DEBUG("Worker: transport reported: {}", error);
    });
    transport_->Start().get();

    if (options_.handleSignals && !coordinator_.InstallSignalHandlers()) {
        LOG_WARN("Worker {}: running without signal handling", session_.Id());
    }

    LOG_INFO("Worker {} ready (pid={})", session_.Id(), static_cast<long>(::getpid()));
    if (!sendReady()) {
        coordinator_.BeginDrain("output stream closed");
    }

    while (coordinator_.GetState() == ShutdownCoordinator::State::Running) {
        coordinator_.PollSignals();
        if (coordinator_.GetState() != ShutdownCoordinator::State::Running) {
            break;
        }
        InboundItem item;
        if (!transport_->Receive(item, options_.pollInterval)) {
            continue;
        }
        processItem(item);
        if (transport_->OutputBroken()) {
            coordinator_.BeginDrain("output stream closed");
        }
    }
    return finish();
}

int Worker::finish() {
    transport_->StopAccepting();

    // Nothing queued behind the drain trigger is dispatched.
    InboundItem item;
    std::size_t discarded = 0;
    while (transport_->TryReceive(item)) {
        if (item.kind != InboundItem::Kind::EndOfStream) {
            ++discarded;
        }
    }
    if (discarded > 0) {
        LOG_INFO("Worker {}: discarded {} queued item(s) while draining", session_.Id(), discarded);
    }

    coordinator_.MarkTerminated();
    if (!sendShutdown()) {
        LOG_WARN("Worker {}: shutdown notification was not delivered", session_.Id());
    }
    coordinator_.RemoveSignalHandlers();
    transport_->Close().get();

    const int code = transport_->OutputBroken() ? 1 : 0;
    LOG_INFO("Worker {} stopped ({}), exit code {}", session_.Id(), coordinator_.Reason(), code);
    return code;
}

bool Worker::RequestShutdown(const std::string& reason) {
    return coordinator_.BeginDrain(reason);
}

void Worker::processItem(InboundItem& item) {
    std::optional<std::string> syntheticShutdown;
    if (item.kind == InboundItem::Kind::Synthetic && item.message && item.message->IsObject()) {
        const auto& obj = std::get<JSONValue::Object>(item.message->value);
        if (GetString(obj, "method") == Methods::Shutdown) {
            syntheticShutdown = "Shutdown requested";
            if (const JSONValue* params = FindMember(obj, "params"); params && params->IsObject()) {
                if (auto reason = GetString(std::get<JSONValue::Object>(params->value), "reason")) {
                    syntheticShutdown = *reason;
                }
            }
        }
    }

    try {
        switch (item.kind) {
            case InboundItem::Kind::Line:
                router_->routeLine(item.line, routerHandlers_);
                break;
            case InboundItem::Kind::Synthetic:
                if (item.message) {
                    router_->route(*item.message, routerHandlers_);
                }
                break;
            case InboundItem::Kind::Oversized:
                sendSessionError(errors::ErrorKind::MessageTooLarge,
                                 "Message of " + std::to_string(item.size) + " bytes exceeds the " +
                                 std::to_string(options_.maxLineBytes) + " byte limit");
                break;
            case InboundItem::Kind::EndOfStream:
                coordinator_.BeginDrain("end of input");
                break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker {}: internal error while processing input: {}", session_.Id(), e.what());
        sendSessionError(errors::ErrorKind::InternalFault, std::string("Internal error: ") + e.what());
    }

    if (syntheticShutdown) {
        coordinator_.ConfirmSyntheticShutdown(*syntheticShutdown);
    }
}

void Worker::sendSessionError(errors::ErrorKind kind, const std::string& message) {
    sendSessionError(errors::ErrorCode{taxonomy_.CodeFor(kind), message, std::nullopt});
}

void Worker::sendSessionError(const errors::ErrorCode& error) {
    if (!transport_->Send(MakeSessionErrorMessage(session_.Id(), error))) {
        LOG_WARN("Worker {}: session error '{}' was not delivered", session_.Id(), error.code);
    }
}

bool Worker::sendReady() {
    JSONValue::Object data;
    SetMember(data, "session_id", JSONValue(session_.Id()));
    SetMember(data, "pid", JSONValue(static_cast<int64_t>(::getpid())));
    SetMember(data, "version", JSONValue(getVersionString()));
    return transport_->Send(MakeNotificationMessage(session_.Id(), Methods::Ready, JSONValue{std::move(data)}));
}

bool Worker::sendShutdown() {
    JSONValue::Object data;
    SetMember(data, "reason", JSONValue(coordinator_.Reason()));
    return transport_->Send(MakeNotificationMessage(session_.Id(), Methods::Shutdown, JSONValue{std::move(data)}));
}

bool Worker::SendSessionLog(const std::vector<LogMessage>& messages) {
    return SendLog(MakeLogEnvelope(messages));
}

////////////////////////////////////////// IEnvelopeSink //////////////////////////////////////////

bool Worker::SendResult(const std::string& requestId, JSONValue::Object envelope) {
    session_.InjectSeq(envelope);
    const bool final = GetBool(envelope, "final").value_or(true);
    const bool sent = transport_->Send(MakeResponseMessage(requestId, JSONValue{std::move(envelope)}));
    if (final) {
        session_.ReleaseRequest(requestId);
    }
    return sent;
}

bool Worker::SendError(const std::string& requestId, JSONValue::Object envelope) {
    session_.InjectSeq(envelope);
    const bool sent = transport_->Send(MakeResponseMessage(requestId, JSONValue{std::move(envelope)}));
    session_.ReleaseRequest(requestId);
    return sent;
}

bool Worker::SendProgress(const std::string& requestId, JSONValue::Object envelope) {
    session_.InjectSeq(envelope);
    return transport_->Send(MakeNotificationMessage(requestId, Methods::Progress, JSONValue{std::move(envelope)}));
}

bool Worker::SendLog(JSONValue::Object envelope) {
    const std::string target = EnvelopeRequestId(envelope).value_or(session_.Id());
    session_.InjectSeq(envelope);
    return transport_->Send(MakeNotificationMessage(target, Methods::Log, JSONValue{std::move(envelope)}));
}

} // namespace jsonlipc
