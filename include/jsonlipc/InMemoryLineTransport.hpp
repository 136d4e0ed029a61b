//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryLineTransport.hpp
// Purpose: In-memory line transport for tests and embedding
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "jsonlipc/Transport.h"

namespace jsonlipc {

//==========================================================================================================
// InMemoryLineTransport
// Purpose: In-process ILineTransport. The peer side (tests or an embedding host) pushes inbound lines
//          and reads back the serialized outbound lines exactly as they would appear on stdout.
//==========================================================================================================
class InMemoryLineTransport : public ILineTransport {
public:
    InMemoryLineTransport();
    ~InMemoryLineTransport() override;

    ////////////////////////////////////////// Peer side //////////////////////////////////////////
    //==========================================================================================================
    // PushLine
    // Purpose: Delivers one inbound line (without its newline), applying the same trimming, blank-line
    //          skipping and size cap as a byte-stream transport.
    //==========================================================================================================
    void PushLine(const std::string& line);

    // Signals end of input.
    void PushEndOfStream();

    // Serialized outbound lines (without the trailing newline), in write order.
    std::vector<std::string> SentLines() const;

    // Outbound lines parsed back into JSON objects.
    std::vector<JSONValue> SentMessages() const;

    //==========================================================================================================
    // WaitForSent
    // Purpose: Blocks until at least count lines were written or timeout elapses.
    // Returns:
    //   true when count was reached.
    //==========================================================================================================
    bool WaitForSent(std::size_t count, std::chrono::milliseconds timeout) const;

    // Makes every following Send fail as if the reader of the output stream went away.
    void BreakOutput();

    ////////////////////////////////////////// ILineTransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    void StopAccepting() override;

    bool Receive(InboundItem& out, std::chrono::milliseconds timeout) override;
    bool TryReceive(InboundItem& out) override;
    void Inject(InboundItem item) override;

    bool Send(JSONValue::Object message) override;
    uint64_t LastSequence() const override;
    bool OutputBroken() const override;

    void SetMaxLineBytes(std::size_t maxBytes) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace jsonlipc
