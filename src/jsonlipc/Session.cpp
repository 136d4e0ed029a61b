//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session id generation and per-request envelope sequencing
//==========================================================================================================

#include <chrono>

#include "jsonlipc/Envelopes.h"
#include "jsonlipc/Session.h"

namespace jsonlipc {

Session::Session() : id_(GenerateSessionId()) {}

Session::Session(std::string sessionId) : id_(std::move(sessionId)) {}

std::string Session::GenerateSessionId() {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "sess_" + std::to_string(ns);
}

uint64_t Session::NextRequestSeq(const std::string& requestId) {
    std::lock_guard<std::mutex> lk(mutex_);
    return ++requestSeq_[requestId];
}

bool Session::InjectSeq(JSONValue::Object& envelope) {
    auto rid = EnvelopeRequestId(envelope);
    if (!rid.has_value() || rid->empty()) {
        return false;
    }
    SetMember(envelope, "seq", JSONValue(static_cast<int64_t>(NextRequestSeq(*rid))));
    return true;
}

void Session::ReleaseRequest(const std::string& requestId) {
    if (requestId == id_) {
        return;
    }
    std::lock_guard<std::mutex> lk(mutex_);
    requestSeq_.erase(requestId);
}

std::size_t Session::ActiveRequestCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return requestSeq_.size();
}

} // namespace jsonlipc
