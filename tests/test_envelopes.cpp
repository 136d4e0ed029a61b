//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_envelopes.cpp
// Purpose: Envelope builders, progress clamping, timestamps and outbound message shapes
//==========================================================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <regex>
#include <string>

#include "jsonlipc/Envelopes.h"
#include "jsonlipc/Messages.h"
#include "jsonlipc/Transport.h"

using namespace jsonlipc;

namespace {
const JSONValue::Object& asObject(const JSONValue& v) {
    return std::get<JSONValue::Object>(v.value);
}
} // namespace

TEST(Envelopes, ResultEnvelopeShape) {
    JSONValue::Object data;
    SetMember(data, "sum", JSONValue(static_cast<int64_t>(5)));
    auto env = MakeResultEnvelope("r1", JSONValue(data));
    EXPECT_EQ(GetString(env, "schema"), std::optional<std::string>("envelope/v1"));
    EXPECT_EQ(GetString(env, "kind"), std::optional<std::string>("result"));
    EXPECT_EQ(GetString(env, "request_id"), std::optional<std::string>("r1"));
    EXPECT_EQ(GetBool(env, "final"), true);
    ASSERT_NE(FindMember(env, "data"), nullptr);
    EXPECT_EQ(*FindMember(env, "data"), JSONValue(data));
    ASSERT_NE(FindMember(env, "messages"), nullptr);
    EXPECT_TRUE(std::get<JSONValue::Array>(FindMember(env, "messages")->value).empty());
    EXPECT_EQ(FindMember(env, "seq"), nullptr);
}

TEST(Envelopes, PartialResultIsNotFinal) {
    auto env = MakeResultEnvelope("r1", JSONValue(static_cast<int64_t>(1)), false);
    EXPECT_EQ(GetBool(env, "final"), false);
}

TEST(Envelopes, ErrorEnvelopeIsAlwaysFinal) {
    errors::ErrorCode err{"valueError", "bad input", JSONValue("hint")};
    auto env = MakeErrorEnvelope("r2", err);
    EXPECT_EQ(GetString(env, "kind"), std::optional<std::string>("error"));
    EXPECT_EQ(GetBool(env, "final"), true);
    EXPECT_EQ(GetString(env, "status"), std::optional<std::string>("failed"));
    const JSONValue* e = FindMember(env, "error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(GetString(asObject(*e), "code"), std::optional<std::string>("valueError"));
    EXPECT_EQ(GetString(asObject(*e), "message"), std::optional<std::string>("bad input"));
    ASSERT_NE(FindMember(env, "details"), nullptr);
    EXPECT_EQ(*FindMember(env, "details"), JSONValue("hint"));
}

TEST(Envelopes, ErrorEnvelopeCustomStatus) {
    errors::ErrorCode err{"cancelled", "stopped", std::nullopt};
    auto env = MakeErrorEnvelope("r3", err, Status::Cancelled);
    EXPECT_EQ(GetString(env, "status"), std::optional<std::string>("cancelled"));
    EXPECT_EQ(FindMember(env, "details"), nullptr);
}

TEST(Envelopes, ProgressRatioIsClamped) {
    EXPECT_DOUBLE_EQ(MakeProgressData(1.7, 17, 10, "items").ratio, 1.0);
    EXPECT_DOUBLE_EQ(MakeProgressData(-0.2, 0, 10, "items").ratio, 0.0);
    EXPECT_DOUBLE_EQ(MakeProgressData(std::nan(""), 0, 0, "items").ratio, 0.0);
    EXPECT_DOUBLE_EQ(MakeProgressData(0.25, 1, 4, "items").ratio, 0.25);
}

TEST(Envelopes, ProgressEnvelopeOmitsUnsetFields) {
    auto env = MakeProgressEnvelope("r4", MakeProgressData(0.5, 1, 2, "steps", std::string("step_1")));
    EXPECT_EQ(GetString(env, "kind"), std::optional<std::string>("progress"));
    EXPECT_EQ(GetString(env, "status"), std::optional<std::string>("running"));
    const JSONValue* p = FindMember(env, "progress");
    ASSERT_NE(p, nullptr);
    const auto& progress = asObject(*p);
    EXPECT_DOUBLE_EQ(GetNumber(progress, "ratio").value(), 0.5);
    EXPECT_EQ(GetString(progress, "unit"), std::optional<std::string>("steps"));
    EXPECT_EQ(GetString(progress, "stage"), std::optional<std::string>("step_1"));
    EXPECT_EQ(FindMember(progress, "message"), nullptr);
    EXPECT_EQ(FindMember(progress, "eta_ms"), nullptr);
}

TEST(Envelopes, ProgressEtaIncludedWhenSet) {
    auto data = MakeProgressData(0.1, 1, 10, "items", std::nullopt, std::string("working"), 2500);
    const JSONValue json = data.ToJSON();
    const auto& obj = asObject(json);
    EXPECT_EQ(GetInteger(obj, "eta_ms"), 2500);
    EXPECT_EQ(GetString(obj, "message"), std::optional<std::string>("working"));
}

TEST(Envelopes, LogEnvelopeRequestIdOptional) {
    std::vector<LogMessage> msgs = {MakeLogMessage(MessageLevel::Warn, "careful")};
    auto sessionLevel = MakeLogEnvelope(msgs);
    EXPECT_EQ(GetString(sessionLevel, "kind"), std::optional<std::string>("log"));
    EXPECT_FALSE(EnvelopeRequestId(sessionLevel).has_value());

    auto scoped = MakeLogEnvelope(msgs, std::string("r5"));
    EXPECT_EQ(EnvelopeRequestId(scoped), std::optional<std::string>("r5"));
    const auto& arr = std::get<JSONValue::Array>(FindMember(scoped, "messages")->value);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(GetString(asObject(*arr[0]), "level"), std::optional<std::string>("warn"));
    EXPECT_EQ(GetString(asObject(*arr[0]), "message"), std::optional<std::string>("careful"));
}

TEST(Envelopes, LogErrorEnvelopeWrapsError) {
    errors::ErrorCode err{"diskFull", "no space", std::nullopt};
    auto env = MakeLogErrorEnvelope(err, std::string("r6"));
    const auto& arr = std::get<JSONValue::Array>(FindMember(env, "messages")->value);
    ASSERT_EQ(arr.size(), 1u);
    const auto& msg = asObject(*arr[0]);
    EXPECT_EQ(GetString(msg, "level"), std::optional<std::string>("error"));
    EXPECT_EQ(GetString(msg, "message"), std::optional<std::string>("no space"));
    const JSONValue* details = FindMember(msg, "details");
    ASSERT_NE(details, nullptr);
    EXPECT_EQ(GetString(asObject(*details), "code"), std::optional<std::string>("diskFull"));
}

TEST(Envelopes, MessageLevelNames) {
    EXPECT_STREQ(ToString(MessageLevel::Debug), "debug");
    EXPECT_EQ(MessageLevelFromString("error"), MessageLevel::Error);
    EXPECT_FALSE(MessageLevelFromString("fatal").has_value());
    EXPECT_STREQ(ToString(Status::Retrying), "retrying");
    EXPECT_STREQ(ToString(EnvelopeKind::Progress), "progress");
}

TEST(Envelopes, UtcTimestampFormat) {
    const std::string ts = UtcNow();
    std::regex pattern(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}\+00:00$)");
    EXPECT_TRUE(std::regex_match(ts, pattern)) << ts;
}

TEST(Envelopes, OutboundStampingKeepsExistingFields) {
    auto msg = MakeNotificationMessage("sess_1", Methods::Ready);
    SetMember(msg, "seq", JSONValue(static_cast<int64_t>(99)));
    StampOutbound(msg, 7);
    EXPECT_EQ(GetInteger(msg, "seq"), 99);
    EXPECT_EQ(GetString(msg, "schema"), std::optional<std::string>("message/v1"));
    EXPECT_TRUE(GetString(msg, "ts").has_value());
}

TEST(Envelopes, SessionErrorMessageShape) {
    errors::ErrorCode err{"invalidJSON", "JSON decode error", std::nullopt};
    auto msg = MakeSessionErrorMessage("sess_1", err);
    EXPECT_EQ(GetString(msg, "id"), std::optional<std::string>("sess_1"));
    EXPECT_EQ(GetString(msg, "type"), std::optional<std::string>("notification"));
    EXPECT_EQ(GetString(msg, "method"), std::optional<std::string>("error"));
    ASSERT_NE(FindMember(msg, "error"), nullptr);
    EXPECT_EQ(FindMember(msg, "data"), nullptr);
}

TEST(Envelopes, ErrorResponseMessageShape) {
    errors::ErrorCode err{"invalidMessage", "Request must have string 'method' field", std::nullopt};
    auto msg = MakeErrorResponseMessage("r7", err);
    EXPECT_EQ(GetString(msg, "type"), std::optional<std::string>("response"));
    EXPECT_EQ(GetString(msg, "id"), std::optional<std::string>("r7"));
    EXPECT_EQ(FindMember(msg, "data"), nullptr);
}
