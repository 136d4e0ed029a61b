//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Shared line transport pieces - inbound items, inbound queue, line normalization, outbound stamping
//==========================================================================================================

#include <cctype>

#include "jsonlipc/Envelopes.h"
#include "jsonlipc/Transport.h"

namespace jsonlipc {

InboundItem InboundItem::MakeLine(std::string text) {
    InboundItem item;
    item.kind = Kind::Line;
    item.size = text.size();
    item.line = std::move(text);
    return item;
}

InboundItem InboundItem::MakeSynthetic(JSONValue message) {
    InboundItem item;
    item.kind = Kind::Synthetic;
    item.message = std::move(message);
    return item;
}

InboundItem InboundItem::MakeOversized(std::size_t bytes) {
    InboundItem item;
    item.kind = Kind::Oversized;
    item.size = bytes;
    return item;
}

InboundItem InboundItem::MakeEndOfStream() {
    InboundItem item;
    item.kind = Kind::EndOfStream;
    return item;
}

void InboundQueue::Push(InboundItem item) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
}

bool InboundQueue::PopFor(InboundItem& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    if (!cv_.wait_for(lk, timeout, [this]() { return !items_.empty(); })) {
        return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    return true;
}

bool InboundQueue::TryPop(InboundItem& out) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (items_.empty()) {
        return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    return true;
}

std::size_t InboundQueue::Size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.size();
}

std::string NormalizeInboundLine(const std::string& raw) {
    std::size_t b = 0;
    std::size_t e = raw.size();
    while (b < e && std::isspace(static_cast<unsigned char>(raw[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(raw[e - 1]))) --e;
    return raw.substr(b, e - b);
}

void StampOutbound(JSONValue::Object& message, uint64_t seq) {
    SetMemberIfAbsent(message, "ts", JSONValue(UtcNow()));
    SetMemberIfAbsent(message, "seq", JSONValue(static_cast<int64_t>(seq)));
    SetMemberIfAbsent(message, "schema", JSONValue(MessageSchema));
}

} // namespace jsonlipc
