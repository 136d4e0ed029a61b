//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioLineTransport.hpp
// Purpose: Newline-delimited JSON transport over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "jsonlipc/Transport.h"

namespace jsonlipc {

class StdioLineTransport : public ILineTransport {
public:
    // Reads STDIN_FILENO, writes STDOUT_FILENO.
    StdioLineTransport();

    // Reads inputFd, writes outputFd. The descriptors are not closed by the transport.
    StdioLineTransport(int inputFd, int outputFd);
    ~StdioLineTransport() override;

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
    friend struct StdioLineTransportTestHooks;
};

//==========================================================================================================
// StdioLineTransportFactory
// Purpose: Creates StdioLineTransport instances from a configuration string.
// Config keys (separated by ';' or whitespace):
//   max_line_bytes=<n>   Inbound line size cap.
//   input_fd=<fd>        Read descriptor (default STDIN_FILENO).
//   output_fd=<fd>       Write descriptor (default STDOUT_FILENO).
//==========================================================================================================
class StdioLineTransportFactory : public ILineTransportFactory {
public:
    std::unique_ptr<ILineTransport> CreateTransport(const std::string& config) override;
};

// Test hooks for unit testing internal helpers without exposing them publicly.
struct StdioLineTransportTestHooks {
    // Splits complete lines out of buffer and queues them, leaving any partial tail in buffer.
    static void drainLines(StdioLineTransport& t, std::string& buffer);
    static std::size_t queuedItems(StdioLineTransport& t);
};

} // namespace jsonlipc
