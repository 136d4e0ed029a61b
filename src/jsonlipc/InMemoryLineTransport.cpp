//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryLineTransport.cpp
// Purpose: In-memory line transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "logging/Logger.h"
#include "jsonlipc/InMemoryLineTransport.hpp"

namespace jsonlipc {

class InMemoryLineTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::atomic<bool> accepting{true};
    std::atomic<bool> outputBroken{false};
    std::atomic<std::size_t> maxLineBytes{DefaultMaxLineBytes};
    ILineTransport::ErrorHandler errorHandler;
    InboundQueue inbound;

    mutable std::mutex sentMutex;
    mutable std::condition_variable sentCv;
    std::vector<std::string> sent;
    uint64_t outboundSeq{0};
};

InMemoryLineTransport::InMemoryLineTransport() : pImpl(std::make_unique<Impl>()) {}

InMemoryLineTransport::~InMemoryLineTransport() = default;

void InMemoryLineTransport::PushLine(const std::string& line) {
    if (line.size() > pImpl->maxLineBytes) {
        LOG_WARN("InMemoryLineTransport: discarded inbound line of {} bytes", line.size());
        if (pImpl->errorHandler) {
            pImpl->errorHandler("InMemoryLineTransport: inbound line too large");
        }
        if (pImpl->accepting) {
            pImpl->inbound.Push(InboundItem::MakeOversized(line.size()));
        }
        return;
    }
    std::string normalized = NormalizeInboundLine(line);
    if (normalized.empty() || !pImpl->accepting) {
        return;
    }
    pImpl->inbound.Push(InboundItem::MakeLine(std::move(normalized)));
}

void InMemoryLineTransport::PushEndOfStream() {
    pImpl->inbound.Push(InboundItem::MakeEndOfStream());
}

std::vector<std::string> InMemoryLineTransport::SentLines() const {
    std::lock_guard<std::mutex> lk(pImpl->sentMutex);
    return pImpl->sent;
}

std::vector<JSONValue> InMemoryLineTransport::SentMessages() const {
    std::vector<JSONValue> out;
    for (const auto& line : SentLines()) {
        out.push_back(ParseJSON(line));
    }
    return out;
}

bool InMemoryLineTransport::WaitForSent(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(pImpl->sentMutex);
    return pImpl->sentCv.wait_for(lk, timeout, [this, count]() { return pImpl->sent.size() >= count; });
}

void InMemoryLineTransport::BreakOutput() {
    pImpl->outputBroken = true;
}

std::future<void> InMemoryLineTransport::Start() {
    FUNC_SCOPE();
    pImpl->connected = true;
    std::promise<void> p; p.set_value(); return p.get_future();
}

std::future<void> InMemoryLineTransport::Close() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->accepting = false;
    std::promise<void> p; p.set_value(); return p.get_future();
}

bool InMemoryLineTransport::IsConnected() const {
    return pImpl->connected && !pImpl->outputBroken;
}

void InMemoryLineTransport::StopAccepting() {
    pImpl->accepting = false;
}

bool InMemoryLineTransport::Receive(InboundItem& out, std::chrono::milliseconds timeout) {
    return pImpl->inbound.PopFor(out, timeout);
}

bool InMemoryLineTransport::TryReceive(InboundItem& out) {
    return pImpl->inbound.TryPop(out);
}

void InMemoryLineTransport::Inject(InboundItem item) {
    pImpl->inbound.Push(std::move(item));
}

bool InMemoryLineTransport::Send(JSONValue::Object message) {
    bool written = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->sentMutex);
        if (!pImpl->outputBroken) {
            StampOutbound(message, ++pImpl->outboundSeq);
            pImpl->sent.push_back(SerializeJSON(JSONValue(std::move(message))));
            written = true;
        }
    }
    if (!written) {
        if (pImpl->errorHandler) {
            pImpl->errorHandler("InMemoryLineTransport: output broken");
        }
        return false;
    }
    pImpl->sentCv.notify_all();
    return true;
}

uint64_t InMemoryLineTransport::LastSequence() const {
    std::lock_guard<std::mutex> lk(pImpl->sentMutex);
    return pImpl->outboundSeq;
}

bool InMemoryLineTransport::OutputBroken() const {
    return pImpl->outputBroken;
}

void InMemoryLineTransport::SetMaxLineBytes(std::size_t maxBytes) {
    pImpl->maxLineBytes = maxBytes > 0 ? maxBytes : DefaultMaxLineBytes;
}

void InMemoryLineTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace jsonlipc
