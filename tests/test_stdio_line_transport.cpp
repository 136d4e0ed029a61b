//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_line_transport.cpp
// Purpose: StdioLineTransport over pipes: reader thread, end of input, stamped writes and broken output
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "jsonlipc/Messages.h"
#include "jsonlipc/StdioLineTransport.hpp"

using namespace jsonlipc;
using namespace std::chrono_literals;

namespace {

struct Pipe {
    int fds[2]{-1, -1};
    Pipe() {
        if (::pipe(fds) != 0) {
            fds[0] = fds[1] = -1;
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }
    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

bool writeString(int fd, const std::string& s) {
    return ::write(fd, s.data(), s.size()) == static_cast<ssize_t>(s.size());
}

std::string readAvailable(int fd) {
    std::string out;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        out.append(buf, static_cast<std::size_t>(n));
        if (out.back() == '\n') {
            break;
        }
    }
    return out;
}

} // namespace

TEST(StdioLineTransport, ReadsLinesThenEndOfInput) {
    Pipe in;
    Pipe out;
    ASSERT_GE(in.readEnd(), 0);
    ASSERT_GE(out.readEnd(), 0);

    StdioLineTransport t(in.readEnd(), out.writeEnd());
    t.Start().get();
    EXPECT_TRUE(t.IsConnected());

    ASSERT_TRUE(writeString(in.writeEnd(), "{\"type\":\"request\"}\n{\"tail\":true}"));
    in.closeWrite();

    InboundItem item;
    ASSERT_TRUE(t.Receive(item, 2000ms));
    EXPECT_EQ(item.kind, InboundItem::Kind::Line);
    EXPECT_EQ(item.line, "{\"type\":\"request\"}");

    // The unterminated tail is delivered once input ends.
    ASSERT_TRUE(t.Receive(item, 2000ms));
    EXPECT_EQ(item.kind, InboundItem::Kind::Line);
    EXPECT_EQ(item.line, "{\"tail\":true}");

    ASSERT_TRUE(t.Receive(item, 2000ms));
    EXPECT_EQ(item.kind, InboundItem::Kind::EndOfStream);

    t.Close().get();
    EXPECT_FALSE(t.IsConnected());
}

TEST(StdioLineTransport, SendWritesStampedSingleLine) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readEnd(), out.writeEnd());
    t.Start().get();

    JSONValue::Object data;
    SetMember(data, "text", JSONValue("line one\nline two"));
    ASSERT_TRUE(t.Send(MakeNotificationMessage("sess_1", Methods::Ready, JSONValue(data))));
    ASSERT_TRUE(t.Send(MakeNotificationMessage("sess_1", Methods::Log)));
    EXPECT_EQ(t.LastSequence(), 2u);

    std::string first = readAvailable(out.readEnd());
    ASSERT_FALSE(first.empty());
    const std::size_t nl = first.find('\n');
    ASSERT_NE(nl, std::string::npos);
    auto msg = ParseJSON(first.substr(0, nl));
    const auto& obj = std::get<JSONValue::Object>(msg.value);
    EXPECT_EQ(GetInteger(obj, "seq"), 1);
    EXPECT_EQ(GetString(obj, "schema"), std::optional<std::string>("message/v1"));
    EXPECT_TRUE(GetString(obj, "ts").has_value());
    EXPECT_EQ(GetString(obj, "method"), std::optional<std::string>("ready"));

    t.Close().get();
}

TEST(StdioLineTransport, BrokenOutputReportsOnce) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readEnd(), out.writeEnd());
    int errors = 0;
    t.SetErrorHandler([&](const std::string&) { ++errors; });
    t.Start().get();

    out.closeRead();
    EXPECT_FALSE(t.Send(MakeNotificationMessage("sess_1", Methods::Ready)));
    EXPECT_TRUE(t.OutputBroken());
    EXPECT_FALSE(t.IsConnected());
    EXPECT_FALSE(t.Send(MakeNotificationMessage("sess_1", Methods::Shutdown)));
    EXPECT_EQ(errors, 1);

    t.Close().get();
}

TEST(StdioLineTransport, CloseIsIdempotentAndStopsReader) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readEnd(), out.writeEnd());
    t.Start().get();
    t.Close().get();
    t.Close().get();

    // Input after close is not delivered.
    ASSERT_TRUE(writeString(in.writeEnd(), "{\"late\":1}\n"));
    InboundItem item;
    EXPECT_FALSE(t.Receive(item, 50ms));
}

TEST(StdioLineTransport, OversizedLineFromPipe) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readEnd(), out.writeEnd());
    t.SetMaxLineBytes(16);
    t.Start().get();

    ASSERT_TRUE(writeString(in.writeEnd(), std::string(40, 'z') + "\n{\"ok\":1}\n"));
    InboundItem item;
    ASSERT_TRUE(t.Receive(item, 2000ms));
    EXPECT_EQ(item.kind, InboundItem::Kind::Oversized);
    EXPECT_EQ(item.size, 40u);
    ASSERT_TRUE(t.Receive(item, 2000ms));
    EXPECT_EQ(item.line, "{\"ok\":1}");

    t.Close().get();
}
