//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioLineTransport.cpp
// Purpose: Newline-delimited JSON transport over file descriptors (reader thread + serialized writer)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "jsonlipc/StdioLineTransport.hpp"

namespace jsonlipc {

class StdioLineTransport::Impl {
public:
    int inputFd{STDIN_FILENO};
    int outputFd{STDOUT_FILENO};
    std::atomic<bool> running{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> accepting{true};
    std::atomic<bool> outputBroken{false};
    std::atomic<bool> readerExited{false};
    std::atomic<std::size_t> maxLineBytes{DefaultMaxLineBytes};
    ILineTransport::ErrorHandler errorHandler;
    InboundQueue inbound;
    std::thread readerThread;
    int wakeEventFd{-1};

    std::mutex writeMutex; // serializes seq assignment and the write itself
    uint64_t outboundSeq{0};

    // Oversized-line state (reader thread only)
    bool discarding{false};
    std::size_t discardedBytes{0};

    static constexpr std::size_t ReadChunk = 64 * 1024;
    static constexpr int WaitTimeoutMs = 100;

    Impl() {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioLineTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (readerThread.joinable()) {
            running = false;
            wake();
            readerThread.join();
        }
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioLineTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
            break;
        }
    }

    void queueOversized(std::size_t bytes) {
        LOG_WARN("StdioLineTransport: discarded inbound line of {} bytes (max={})", bytes, maxLineBytes.load());
        reportError("StdioLineTransport: inbound line too large");
        if (accepting) {
            inbound.Push(InboundItem::MakeOversized(bytes));
        }
    }

    void handleLine(const std::string& raw) {
        if (raw.size() > maxLineBytes) {
            queueOversized(raw.size());
            return;
        }
        std::string line = NormalizeInboundLine(raw);
        if (line.empty()) {
            return;
        }
        if (!accepting) {
            LOG_DEBUG("StdioLineTransport: not accepting; dropped {} byte line", line.size());
            return;
        }
        inbound.Push(InboundItem::MakeLine(std::move(line)));
    }

    // Emits every complete line in buffer; the partial tail stays. At end of input the tail is a line too.
    void drainLines(std::string& buffer, bool atEof) {
        std::size_t start = 0;
        for (;;) {
            std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            if (discarding) {
                discardedBytes += nl - start;
                discarding = false;
                queueOversized(discardedBytes);
                discardedBytes = 0;
            } else {
                handleLine(buffer.substr(start, nl - start));
            }
            start = nl + 1;
        }
        buffer.erase(0, start);

        if (buffer.size() > maxLineBytes) {
            discarding = true;
            discardedBytes += buffer.size();
            buffer.clear();
        }

        if (atEof) {
            if (discarding) {
                discarding = false;
                queueOversized(discardedBytes);
                discardedBytes = 0;
            } else if (!buffer.empty()) {
                handleLine(buffer);
            }
            buffer.clear();
        }
    }

    void readerLoop() {
        std::string buffer;
        std::vector<char> tmp(ReadChunk);
        bool ended = false;

        // Regular files cannot be registered with epoll; they never block, so read them directly.
        bool pollable = true;
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("StdioLineTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            pollable = false;
        } else {
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = inputFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, inputFd, &evIn) != 0) {
                LOG_DEBUG("StdioLineTransport: input fd not pollable (errno={}); using blocking reads", errno);
                pollable = false;
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }
        }

        while (running) {
            if (pollable) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, WaitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("StdioLineTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioLineTransport: epoll_wait failed");
                    ended = true;
                    break;
                }
                bool readable = false;
                for (int i = 0; i < rc; ++i) {
                    if (events[i].data.fd == inputFd) {
                        readable = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(wakeEventFd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    }
                }
                if (!running) {
                    break;
                }
                if (!readable) {
                    continue;
                }
            }

            ssize_t n = ::read(inputFd, tmp.data(), tmp.size());
            if (n > 0) {
                buffer.append(tmp.data(), static_cast<std::size_t>(n));
                drainLines(buffer, false);
            } else if (n == 0) {
                LOG_INFO("StdioLineTransport: end of input");
                ended = true;
                break;
            } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_ERROR("StdioLineTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioLineTransport: read error");
                ended = true;
                break;
            }
        }

        if (ep >= 0) {
            ::close(ep);
        }
        if (ended) {
            drainLines(buffer, true);
            inbound.Push(InboundItem::MakeEndOfStream());
        }
        readerExited.store(true);
    }

    bool writeAll(const std::string& data, std::string& failure) {
        const char* p = data.data();
        std::size_t left = data.size();
        while (left > 0) {
            ssize_t n = ::write(outputFd, p, left);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    pollfd pfd{outputFd, POLLOUT, 0};
                    (void)::poll(&pfd, 1, -1);
                    continue;
                }
                failure = std::string("StdioLineTransport: write failed (") + ::strerror(errno) + ")";
                return false;
            }
            p += n;
            left -= static_cast<std::size_t>(n);
        }
        return true;
    }
};

StdioLineTransport::StdioLineTransport() : pImpl(std::make_unique<Impl>()) {}

StdioLineTransport::StdioLineTransport(int inputFd, int outputFd) : pImpl(std::make_unique<Impl>()) {
    pImpl->inputFd = inputFd;
    pImpl->outputFd = outputFd;
}

StdioLineTransport::~StdioLineTransport() = default;

std::future<void> StdioLineTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->started.exchange(true)) {
        promise.set_value();
        return promise.get_future();
    }
    LOG_INFO("Starting StdioLineTransport (in={} out={} max_line_bytes={})",
             pImpl->inputFd, pImpl->outputFd, pImpl->maxLineBytes.load());

    // A vanished parent must surface as EPIPE on write, not terminate the process.
    struct sigaction sa{};
    sa.sa_handler = SIG_IGN;
    ::sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
        LOG_WARN("StdioLineTransport: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
    }

    pImpl->running = true;
    pImpl->readerThread = std::thread([this]() { pImpl->readerLoop(); });
    promise.set_value();
    return promise.get_future();
}

std::future<void> StdioLineTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->closed.exchange(true)) {
        promise.set_value();
        return promise.get_future();
    }
    LOG_INFO("Closing StdioLineTransport");
    pImpl->running = false;
    pImpl->accepting = false;
    pImpl->wake();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    promise.set_value();
    return promise.get_future();
}

bool StdioLineTransport::IsConnected() const {
    return pImpl->started && !pImpl->closed && !pImpl->outputBroken;
}

void StdioLineTransport::StopAccepting() {
    pImpl->accepting = false;
}

bool StdioLineTransport::Receive(InboundItem& out, std::chrono::milliseconds timeout) {
    return pImpl->inbound.PopFor(out, timeout);
}

bool StdioLineTransport::TryReceive(InboundItem& out) {
    return pImpl->inbound.TryPop(out);
}

void StdioLineTransport::Inject(InboundItem item) {
    pImpl->inbound.Push(std::move(item));
}

bool StdioLineTransport::Send(JSONValue::Object message) {
    std::string failure;
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        if (pImpl->outputBroken) {
            return false;
        }
        StampOutbound(message, ++pImpl->outboundSeq);
        std::string line = SerializeJSON(JSONValue(std::move(message)));
        line.push_back('\n');
        if (pImpl->writeAll(line, failure)) {
            return true;
        }
        pImpl->outputBroken = true;
    }
    LOG_ERROR("{}", failure);
    pImpl->reportError(failure);
    return false;
}

uint64_t StdioLineTransport::LastSequence() const {
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    return pImpl->outboundSeq;
}

bool StdioLineTransport::OutputBroken() const {
    return pImpl->outputBroken;
}

void StdioLineTransport::SetMaxLineBytes(std::size_t maxBytes) {
    pImpl->maxLineBytes = maxBytes > 0 ? maxBytes : DefaultMaxLineBytes;
}

void StdioLineTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

std::unique_ptr<ILineTransport> StdioLineTransportFactory::CreateTransport(const std::string& config) {
    auto parseSize = [](const std::string& s, std::size_t& out) -> bool {
        try { out = static_cast<std::size_t>(std::stoull(s)); return true; } catch (const std::exception&) { return false; }
    };
    auto parseFd = [](const std::string& s, int& out) -> bool {
        try { out = std::stoi(s); return out >= 0; } catch (const std::exception&) { return false; }
    };

    int inFd = STDIN_FILENO;
    int outFd = STDOUT_FILENO;
    std::size_t maxLine = DefaultMaxLineBytes;
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioLineTransportFactory: ignoring malformed token '{}'", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        if (key == "max_line_bytes") {
            std::size_t v; if (parseSize(val, v)) maxLine = v;
        } else if (key == "input_fd") {
            int v; if (parseFd(val, v)) inFd = v;
        } else if (key == "output_fd") {
            int v; if (parseFd(val, v)) outFd = v;
        } else {
            LOG_DEBUG("StdioLineTransportFactory: unknown key '{}'", key);
        }
    }
    auto t = std::make_unique<StdioLineTransport>(inFd, outFd);
    t->SetMaxLineBytes(maxLine);
    return t;
}

void StdioLineTransportTestHooks::drainLines(StdioLineTransport& t, std::string& buffer) {
    t.pImpl->drainLines(buffer, false);
}

std::size_t StdioLineTransportTestHooks::queuedItems(StdioLineTransport& t) {
    return t.pImpl->inbound.Size();
}

} // namespace jsonlipc
