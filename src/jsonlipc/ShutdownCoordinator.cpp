//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ShutdownCoordinator.cpp
// Purpose: Shutdown state machine and Boost.Asio signal subscription
//==========================================================================================================

#include <atomic>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "jsonlipc/Messages.h"
#include "jsonlipc/ShutdownCoordinator.h"

namespace jsonlipc {
namespace net = boost::asio;

class ShutdownCoordinator::Impl {
public:
    Session& session;
    InjectFn inject;
    std::atomic<State> state{State::Running};
    std::atomic<bool> forceRequested{false};
    bool signalPending{false}; // a synthetic shutdown is queued but not yet dispatched
    mutable std::mutex reasonMutex;
    std::string reason;

    net::io_context ioc;
    std::unique_ptr<net::signal_set> signals;

    Impl(Session& s, InjectFn fn) : session(s), inject(std::move(fn)) {}

    void setReason(const std::string& r) {
        std::lock_guard<std::mutex> lk(reasonMutex);
        reason = r;
    }

    void arm(ShutdownCoordinator* owner) {
        if (!signals) {
            return;
        }
        signals->async_wait([this, owner](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            owner->OnSignal(signo);
            arm(owner);
        });
    }
};

ShutdownCoordinator::ShutdownCoordinator(Session& session, InjectFn inject)
    : pImpl(std::make_unique<Impl>(session, std::move(inject))) {}

ShutdownCoordinator::~ShutdownCoordinator() {
    RemoveSignalHandlers();
}

bool ShutdownCoordinator::InstallSignalHandlers(const std::vector<int>& signals) {
    FUNC_SCOPE();
    if (pImpl->signals) {
        return true;
    }
    pImpl->signals = std::make_unique<net::signal_set>(pImpl->ioc);
    std::size_t added = 0;
    for (int signo : signals) {
        boost::system::error_code ec;
        pImpl->signals->add(signo, ec);
        if (ec) {
            LOG_WARN("ShutdownCoordinator: cannot subscribe to {}: {}", SignalName(signo), ec.message());
            continue;
        }
        ++added;
    }
    if (added == 0) {
        pImpl->signals.reset();
        return false;
    }
    pImpl->arm(this);
    LOG_DEBUG("ShutdownCoordinator: subscribed to {} signal(s)", added);
    return true;
}

void ShutdownCoordinator::RemoveSignalHandlers() {
    if (!pImpl->signals) {
        return;
    }
    boost::system::error_code ec;
    pImpl->signals->cancel(ec);
    pImpl->signals->clear(ec);
    pImpl->signals.reset();
    // Flush the aborted wait so no completion outlives the subscription.
    pImpl->ioc.restart();
    pImpl->ioc.poll();
}

std::size_t ShutdownCoordinator::PollSignals() {
    if (!pImpl->signals) {
        return 0;
    }
    pImpl->ioc.restart();
    return pImpl->ioc.poll();
}

void ShutdownCoordinator::OnSignal(int signo) {
    const std::string name = SignalName(signo);
    switch (pImpl->state.load()) {
        case State::Running:
            if (!pImpl->signalPending) {
                LOG_INFO("ShutdownCoordinator: received {}; requesting shutdown", name);
                pImpl->signalPending = true;
                pImpl->inject(InboundItem::MakeSynthetic(
                    MakeSyntheticShutdownRequest(pImpl->session.Id(), "Received " + name)));
            } else {
                LOG_WARN("ShutdownCoordinator: received {} again before shutdown was dispatched; forcing", name);
                BeginDrain("Received " + name + " - forced shutdown");
                pImpl->forceRequested = true;
            }
            break;
        case State::Draining:
            LOG_WARN("ShutdownCoordinator: received {} while draining; forcing termination", name);
            pImpl->forceRequested = true;
            break;
        case State::Terminated:
            break;
    }
}

bool ShutdownCoordinator::BeginDrain(const std::string& reason) {
    State expected = State::Running;
    if (!pImpl->state.compare_exchange_strong(expected, State::Draining)) {
        return false;
    }
    pImpl->setReason(reason);
    pImpl->session.SetRunning(false);
    LOG_INFO("ShutdownCoordinator: draining ({})", reason);
    return true;
}

void ShutdownCoordinator::ConfirmSyntheticShutdown(const std::string& reason) {
    pImpl->signalPending = false;
    if (pImpl->state.load() == State::Running) {
        LOG_WARN("ShutdownCoordinator: shutdown handler did not stop the worker; forcing");
        BeginDrain(reason + " - forced shutdown");
    }
}

void ShutdownCoordinator::MarkTerminated() {
    if (pImpl->state.exchange(State::Terminated) != State::Terminated) {
        pImpl->session.SetRunning(false);
        LOG_INFO("ShutdownCoordinator: terminated ({})", Reason());
    }
}

ShutdownCoordinator::State ShutdownCoordinator::GetState() const {
    return pImpl->state.load();
}

std::string ShutdownCoordinator::Reason() const {
    std::lock_guard<std::mutex> lk(pImpl->reasonMutex);
    return pImpl->reason;
}

bool ShutdownCoordinator::ForceRequested() const {
    return pImpl->forceRequested.load();
}

JSONValue ShutdownCoordinator::MakeSyntheticShutdownRequest(const std::string& sessionId, const std::string& reason) {
    InboundRequest request;
    request.id = sessionId;
    request.method = Methods::Shutdown;
    JSONValue::Object params;
    SetMember(params, "reason", JSONValue(reason));
    request.params = std::move(params);
    return JSONValue{ToJSON(request)};
}

std::string ShutdownCoordinator::SignalName(int signo) {
    switch (signo) {
        case SIGTERM: return "SIGTERM";
        case SIGINT: return "SIGINT";
        case SIGHUP: return "SIGHUP";
        case SIGQUIT: return "SIGQUIT";
        default: return "signal " + std::to_string(signo);
    }
}

const char* ToString(ShutdownCoordinator::State state) {
    switch (state) {
        case ShutdownCoordinator::State::Running: return "running";
        case ShutdownCoordinator::State::Draining: return "draining";
        case ShutdownCoordinator::State::Terminated: return "terminated";
    }
    return "running";
}

} // namespace jsonlipc
