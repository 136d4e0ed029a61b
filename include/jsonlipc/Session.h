//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Per-process session state - session id, per-request envelope sequence counters, running flag
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "jsonlipc/JSONValue.h"

namespace jsonlipc {

class Session {
public:
    // Generates a fresh session id.
    Session();
    explicit Session(std::string sessionId);

    const std::string& Id() const { return id_; }

    bool IsRunning() const { return running_.load(); }
    void SetRunning(bool running) { running_.store(running); }

    //==========================================================================================================
    // NextRequestSeq
    // Purpose: Returns the next envelope sequence number for requestId (1, 2, 3, ...).
    //==========================================================================================================
    uint64_t NextRequestSeq(const std::string& requestId);

    //==========================================================================================================
    // InjectSeq
    // Purpose: Sets envelope["seq"] from the per-request counter when the envelope carries a request_id.
    // Returns:
    //   true when a seq was injected.
    //==========================================================================================================
    bool InjectSeq(JSONValue::Object& envelope);

    // Forgets the counter of a finished request. The session's own counter is never released.
    void ReleaseRequest(const std::string& requestId);

    std::size_t ActiveRequestCount() const;

    // "sess_" followed by the current wall-clock time in nanoseconds.
    static std::string GenerateSessionId();

private:
    std::string id_;
    std::atomic<bool> running_{true};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> requestSeq_;
};

} // namespace jsonlipc
