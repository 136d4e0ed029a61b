//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_line_transport.cpp
// Purpose: InMemoryLineTransport queueing, stamping and concurrent writers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "jsonlipc/InMemoryLineTransport.hpp"
#include "jsonlipc/Messages.h"

using namespace jsonlipc;
using namespace std::chrono_literals;

TEST(InMemoryLineTransport, PushedLinesAreTrimmedAndQueued) {
    InMemoryLineTransport t;
    t.Start().get();
    t.PushLine("  {\"a\":1}\r\n");
    t.PushLine("   ");
    t.PushEndOfStream();

    InboundItem item;
    ASSERT_TRUE(t.Receive(item, 100ms));
    EXPECT_EQ(item.kind, InboundItem::Kind::Line);
    EXPECT_EQ(item.line, "{\"a\":1}");
    ASSERT_TRUE(t.Receive(item, 100ms));
    EXPECT_EQ(item.kind, InboundItem::Kind::EndOfStream);
    EXPECT_FALSE(t.TryReceive(item));
}

TEST(InMemoryLineTransport, OversizedLineBecomesMarker) {
    InMemoryLineTransport t;
    t.SetMaxLineBytes(4);
    t.PushLine("{\"toolong\":1}");
    InboundItem item;
    ASSERT_TRUE(t.TryReceive(item));
    EXPECT_EQ(item.kind, InboundItem::Kind::Oversized);
    EXPECT_EQ(item.size, 13u);
}

TEST(InMemoryLineTransport, SentMessagesAreStampedInOrder) {
    InMemoryLineTransport t;
    t.Start().get();
    ASSERT_TRUE(t.Send(MakeNotificationMessage("sess_1", Methods::Ready)));
    ASSERT_TRUE(t.Send(MakeResponseMessage("r1", JSONValue(static_cast<int64_t>(3)))));
    auto sent = t.SentMessages();
    ASSERT_EQ(sent.size(), 2u);
    for (std::size_t i = 0; i < sent.size(); ++i) {
        const auto& obj = std::get<JSONValue::Object>(sent[i].value);
        EXPECT_EQ(GetInteger(obj, "seq"), static_cast<int64_t>(i + 1));
        EXPECT_EQ(GetString(obj, "schema"), std::optional<std::string>("message/v1"));
    }
    EXPECT_EQ(t.LastSequence(), 2u);
}

TEST(InMemoryLineTransport, ConcurrentSendersNeverInterleave) {
    InMemoryLineTransport t;
    t.Start().get();
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int n = 0; n < kThreads; ++n) {
        threads.emplace_back([&t, n]() {
            for (int i = 0; i < kPerThread; ++i) {
                t.Send(MakeNotificationMessage("w" + std::to_string(n), Methods::Log));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    ASSERT_TRUE(t.WaitForSent(kThreads * kPerThread, 1000ms));
    auto sent = t.SentMessages();
    ASSERT_EQ(sent.size(), static_cast<std::size_t>(kThreads * kPerThread));
    int64_t prev = 0;
    for (const auto& m : sent) {
        auto seq = GetInteger(std::get<JSONValue::Object>(m.value), "seq");
        ASSERT_TRUE(seq.has_value());
        EXPECT_EQ(*seq, prev + 1);
        prev = *seq;
    }
}

TEST(InMemoryLineTransport, BrokenOutputRejectsSends) {
    InMemoryLineTransport t;
    std::string lastError;
    t.SetErrorHandler([&](const std::string& e) { lastError = e; });
    t.Start().get();
    t.BreakOutput();
    EXPECT_FALSE(t.Send(MakeNotificationMessage("sess_1", Methods::Ready)));
    EXPECT_TRUE(t.OutputBroken());
    EXPECT_FALSE(lastError.empty());
    EXPECT_TRUE(t.SentLines().empty());
}

TEST(InMemoryLineTransport, StopAcceptingDropsPushedLines) {
    InMemoryLineTransport t;
    t.StopAccepting();
    t.PushLine("{\"a\":1}");
    InboundItem item;
    EXPECT_FALSE(t.TryReceive(item));
}
