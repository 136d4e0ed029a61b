//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Line transport interfaces - inbound line queue and the single outbound write choke point
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "jsonlipc/JSONValue.h"

namespace jsonlipc {

// Schema tag stamped on every outbound transport message.
inline constexpr const char* MessageSchema = "message/v1";

// Default cap for a single inbound line.
inline constexpr std::size_t DefaultMaxLineBytes = 16u * 1024u * 1024u;

//==========================================================================================================
// InboundItem
// Purpose: One unit handed from the reader thread (or the shutdown coordinator) to the main loop.
// Fields:
//   kind: Line (raw text, not yet parsed), Synthetic (already-built message injected in-process),
//         Oversized (a line over the size cap was discarded), EndOfStream (sentinel, nothing follows).
//   line: Trimmed line text for Line.
//   message: Message object for Synthetic.
//   size: Discarded byte count for Oversized.
//==========================================================================================================
struct InboundItem {
    enum class Kind {
        Line,
        Synthetic,
        Oversized,
        EndOfStream
    };

    Kind kind{Kind::Line};
    std::string line;
    std::optional<JSONValue> message;
    std::size_t size{0};

    static InboundItem MakeLine(std::string text);
    static InboundItem MakeSynthetic(JSONValue message);
    static InboundItem MakeOversized(std::size_t bytes);
    static InboundItem MakeEndOfStream();
};

//==========================================================================================================
// InboundQueue
// Purpose: Unbounded thread-safe FIFO between the reader thread and the main loop.
//==========================================================================================================
class InboundQueue {
public:
    void Push(InboundItem item);

    // Waits up to timeout for an item. Returns false on timeout.
    bool PopFor(InboundItem& out, std::chrono::milliseconds timeout);

    // Non-blocking pop.
    bool TryPop(InboundItem& out);

    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<InboundItem> items_;
};

//==========================================================================================================
// NormalizeInboundLine
// Purpose: Strips surrounding whitespace (including a trailing '\r') from a raw inbound line.
//==========================================================================================================
std::string NormalizeInboundLine(const std::string& raw);

//==========================================================================================================
// StampOutbound
// Purpose: Adds ts, seq and schema to an outbound message when absent.
// Args:
//   message: Outbound message object (modified in place).
//   seq: Session-wide sequence number to use when the message carries none.
//==========================================================================================================
void StampOutbound(JSONValue::Object& message, uint64_t seq);

//==========================================================================================================
// Line transport interface
// Purpose: Owns both byte streams of a worker. Inbound lines are produced on a dedicated reader thread;
//          outbound Send() runs on the caller's thread and is serialized internally.
//==========================================================================================================
class ILineTransport {
public:
    virtual ~ILineTransport() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the inbound reader.
    // Returns:
    //   A future that completes when the reader is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the reader and releases resources. Safe to call more than once.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Stops accepting inbound lines. Lines read afterwards are discarded; items already queued remain.
    //==========================================================================================================
    virtual void StopAccepting() = 0;

    /////////////////////////////////////////// Inbound ///////////////////////////////////////////
    //==========================================================================================================
    // Receive
    // Purpose: Waits up to timeout for the next inbound item.
    // Returns:
    //   true when an item was stored in out; false on timeout.
    //==========================================================================================================
    virtual bool Receive(InboundItem& out, std::chrono::milliseconds timeout) = 0;

    // Non-blocking variant of Receive.
    virtual bool TryReceive(InboundItem& out) = 0;

    //==========================================================================================================
    // Inject
    // Purpose: Appends an in-process item to the inbound queue, behind everything already received.
    //==========================================================================================================
    virtual void Inject(InboundItem item) = 0;

    /////////////////////////////////////////// Outbound ///////////////////////////////////////////
    //==========================================================================================================
    // Send
    // Purpose: Stamps (ts, seq, schema), serializes and writes one message as one line, flushed before
    //          returning. Concurrent callers are serialized; seq order equals write order.
    // Returns:
    //   false when the output stream is broken (the message is dropped).
    //==========================================================================================================
    virtual bool Send(JSONValue::Object message) = 0;

    // Last session-wide seq assigned (0 before the first Send).
    virtual uint64_t LastSequence() const = 0;

    // True once a write failed (EPIPE or any other unrecoverable error).
    virtual bool OutputBroken() const = 0;

    /////////////////////////////////////////// Settings ///////////////////////////////////////////
    virtual void SetMaxLineBytes(std::size_t maxBytes) = 0;

    //==========================================================================================================
    // Registers an error handler to receive transport errors (read/write failures, oversized input).
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ILineTransportFactory
// Purpose: Creates transports from a "key=value;key=value" configuration string.
//==========================================================================================================
class ILineTransportFactory {
public:
    virtual ~ILineTransportFactory() = default;
    virtual std::unique_ptr<ILineTransport> CreateTransport(const std::string& config) = 0;
};

} // namespace jsonlipc
