//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ShutdownCoordinator.h
// Purpose: Running -> Draining -> Terminated state machine; turns termination signals into in-band
//          shutdown requests
//==========================================================================================================

#pragma once

#include <csignal>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "jsonlipc/JSONValue.h"
#include "jsonlipc/Session.h"
#include "jsonlipc/Transport.h"

namespace jsonlipc {

//==========================================================================================================
// ShutdownCoordinator
// Purpose: Owns the worker lifecycle state and the OS signal subscription.
// Notes:
//   Signals are received through a Boost.Asio signal_set whose completions only run inside PollSignals(),
//   i.e. on the main loop thread. A first signal injects a synthetic shutdown request addressed to the
//   session id; a second signal before the drain completes forces termination.
//==========================================================================================================
class ShutdownCoordinator {
public:
    enum class State {
        Running,
        Draining,
        Terminated
    };

    // Appends an item to the inbound path (behind everything already queued).
    using InjectFn = std::function<void(InboundItem)>;

    ShutdownCoordinator(Session& session, InjectFn inject);
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    //==========================================================================================================
    // InstallSignalHandlers
    // Purpose: Subscribes to the given signals. Must run before the ready notification is sent.
    // Returns:
    //   false when none of the signals could be registered.
    //==========================================================================================================
    bool InstallSignalHandlers(const std::vector<int>& signals = {SIGTERM, SIGINT});
    void RemoveSignalHandlers();

    // Runs pending signal completions on the calling thread. Returns the number handled.
    std::size_t PollSignals();

    // Signal reaction (also used directly by tests and embedders).
    void OnSignal(int signo);

    //==========================================================================================================
    // BeginDrain
    // Purpose: Running -> Draining and clears the session running flag.
    // Returns:
    //   false when not Running (the first reason is kept).
    //==========================================================================================================
    bool BeginDrain(const std::string& reason);

    //==========================================================================================================
    // ConfirmSyntheticShutdown
    // Purpose: Called after a synthetic shutdown request went through dispatch. If dispatch did not start the
    //          drain (handler missing, overridden or broken) the drain is forced.
    //==========================================================================================================
    void ConfirmSyntheticShutdown(const std::string& reason);

    void MarkTerminated();

    State GetState() const;
    std::string Reason() const;

    // True when queued input must be abandoned (second signal or forced drain).
    bool ForceRequested() const;

    // { "type":"request", "id":<sessionId>, "method":"shutdown", "params":{"reason":<reason>} }
    static JSONValue MakeSyntheticShutdownRequest(const std::string& sessionId, const std::string& reason);

    // "SIGTERM", "SIGINT", ... or "signal <n>".
    static std::string SignalName(int signo);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

const char* ToString(ShutdownCoordinator::State state);

} // namespace jsonlipc
