//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Worker.h
// Purpose: JSONL worker engine - main loop tying transport, router, dispatcher and shutdown together
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "jsonlipc/Dispatcher.h"
#include "jsonlipc/MessageRouter.h"
#include "jsonlipc/Session.h"
#include "jsonlipc/ShutdownCoordinator.h"
#include "jsonlipc/Transport.h"
#include "jsonlipc/errors/Errors.h"

namespace jsonlipc {

//==========================================================================================================
// WorkerOptions
// Purpose: Worker tunables.
// Fields:
//   pollInterval: Main loop queue wait per iteration (JSONLIPC_POLL_INTERVAL_MS, poll_interval_ms).
//   maxLineBytes: Inbound line cap applied to the transport (JSONLIPC_MAX_LINE_BYTES, max_line_bytes).
//   handleSignals: Subscribe to SIGTERM/SIGINT (JSONLIPC_HANDLE_SIGNALS, handle_signals).
//==========================================================================================================
struct WorkerOptions {
    std::chrono::milliseconds pollInterval{100};
    std::size_t maxLineBytes{DefaultMaxLineBytes};
    bool handleSignals{true};

    // Defaults overridden by JSONLIPC_* environment variables.
    static WorkerOptions FromEnvironment();

    //==========================================================================================================
    // FromConfigString
    // Purpose: Applies "key=value;key=value" overrides on top of base. Unknown keys and malformed values
    //          are logged and ignored.
    //==========================================================================================================
    static WorkerOptions FromConfigString(const std::string& config, WorkerOptions base);
    static WorkerOptions FromConfigString(const std::string& config);
};

//==========================================================================================================
// Worker
// Purpose: One session over one transport. Run() emits "ready", processes inbound messages until a
//          shutdown trigger (shutdown request, signal, end of input), drains, emits "shutdown" and returns
//          the process exit code.
// Notes:
//   Handlers run synchronously on the thread calling Run(). Registration must happen before Run().
//==========================================================================================================
class Worker : private IEnvelopeSink {
public:
    explicit Worker(std::unique_ptr<ILineTransport> transport, WorkerOptions options = WorkerOptions{});
    ~Worker() override;

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    ////////////////////////////////////////// Registration //////////////////////////////////////////
    void RegisterHandler(const std::string& method, ContextHandler handler);
    void RegisterParamsHandler(const std::string& method, ParamsHandler handler);

    template <typename Params>
    void RegisterTypedHandler(const std::string& method, std::function<HandlerOutcome(const Params&)> handler) {
        dispatcher_.RegisterTypedHandler<Params>(method, std::move(handler));
    }

    bool UnregisterHandler(const std::string& method);
    bool HasHandler(const std::string& method) const;

    // Exception-to-code mappings and kind overrides for this worker.
    errors::ErrorTaxonomy& Errors() { return taxonomy_; }

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////
    //==========================================================================================================
    // Run
    // Purpose: Runs the session to completion on the calling thread.
    // Returns:
    //   0 after a graceful shutdown; 1 when the output stream broke or Run() was called twice.
    //==========================================================================================================
    int Run();

    // Starts a drain from another part of the embedding program (same effect as a shutdown request).
    bool RequestShutdown(const std::string& reason) override;

    const std::string& GetSessionId() const { return session_.Id(); }
    ShutdownCoordinator::State GetState() const { return coordinator_.GetState(); }
    const WorkerOptions& Options() const { return options_; }

    // Session-scoped Log envelope (no request id).
    bool SendSessionLog(const std::vector<LogMessage>& messages);

private:
    // IEnvelopeSink
    bool SendResult(const std::string& requestId, JSONValue::Object envelope) override;
    bool SendError(const std::string& requestId, JSONValue::Object envelope) override;
    bool SendProgress(const std::string& requestId, JSONValue::Object envelope) override;
    bool SendLog(JSONValue::Object envelope) override;
    const std::string& SessionId() const override { return session_.Id(); }

    void processItem(InboundItem& item);
    void sendSessionError(errors::ErrorKind kind, const std::string& message);
    void sendSessionError(const errors::ErrorCode& error);
    bool sendReady();
    bool sendShutdown();
    int finish();

    std::unique_ptr<ILineTransport> transport_;
    WorkerOptions options_;
    Session session_;
    errors::ErrorTaxonomy taxonomy_;
    std::unique_ptr<IMessageRouter> router_;
    Dispatcher dispatcher_;
    ShutdownCoordinator coordinator_;
    RouterHandlers routerHandlers_;
    bool ran_{false};
};

} // namespace jsonlipc
