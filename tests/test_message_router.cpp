//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for inbound message classification and validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "jsonlipc/MessageRouter.h"

using namespace jsonlipc;

namespace {

struct Capture {
    std::vector<InboundRequest> requests;
    std::vector<InboundNotification> notifications;
    std::vector<RouteError> errors;

    RouterHandlers handlers() {
        RouterHandlers h;
        h.requestHandler = [this](InboundRequest&& r) { requests.push_back(std::move(r)); };
        h.notificationHandler = [this](InboundNotification&& n) { notifications.push_back(std::move(n)); };
        h.errorHandler = [this](const RouteError& e) { errors.push_back(e); };
        return h;
    }
};

} // namespace

TEST(Router, ClassifyBasic) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    EXPECT_EQ(router->classify(ParseJSON("{\"type\":\"request\",\"id\":\"1\",\"method\":\"ping\"}")),
              IMessageRouter::MessageKind::Request);
    EXPECT_EQ(router->classify(ParseJSON("{\"type\":\"notification\",\"method\":\"hello\"}")),
              IMessageRouter::MessageKind::Notification);
    EXPECT_EQ(router->classify(ParseJSON("{\"type\":\"response\",\"id\":\"1\"}")),
              IMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify(ParseJSON("{\"id\":\"1\"}")), IMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify(ParseJSON("[1,2]")), IMessageRouter::MessageKind::Invalid);
}

TEST(Router, RouteValidRequest) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_TRUE(router->routeLine("{\"type\":\"request\",\"id\":\"r1\",\"method\":\"add\",\"params\":{\"a\":1}}",
                                  handlers));
    ASSERT_EQ(cap.requests.size(), 1u);
    EXPECT_EQ(cap.requests[0].id, "r1");
    EXPECT_EQ(cap.requests[0].method, "add");
    ASSERT_TRUE(cap.requests[0].params.has_value());
    EXPECT_EQ(GetInteger(*cap.requests[0].params, "a"), 1);
    EXPECT_TRUE(cap.errors.empty());
}

TEST(Router, RequestWithoutParams) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_TRUE(router->routeLine("{\"type\":\"request\",\"id\":\"r1\",\"method\":\"ping\"}", handlers));
    ASSERT_EQ(cap.requests.size(), 1u);
    EXPECT_FALSE(cap.requests[0].params.has_value());
}

TEST(Router, InvalidJsonIsSessionError) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("{not json", handlers));
    ASSERT_EQ(cap.errors.size(), 1u);
    EXPECT_EQ(cap.errors[0].scope, ErrorScope::Session);
    EXPECT_EQ(cap.errors[0].error.code, "invalidJSON");
    EXPECT_EQ(cap.errors[0].error.message.rfind("JSON decode error: ", 0), 0u);
}

TEST(Router, NonObjectIsSessionError) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("\"just a string\"", handlers));
    ASSERT_EQ(cap.errors.size(), 1u);
    EXPECT_EQ(cap.errors[0].scope, ErrorScope::Session);
    EXPECT_EQ(cap.errors[0].error.code, "invalidMessage");
    EXPECT_EQ(cap.errors[0].error.message, "Message must be a JSON object");
}

TEST(Router, RequestMissingIdIsSessionError) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("{\"type\":\"request\",\"method\":\"ping\"}", handlers));
    EXPECT_FALSE(router->routeLine("{\"type\":\"request\",\"id\":7,\"method\":\"ping\"}", handlers));
    ASSERT_EQ(cap.errors.size(), 2u);
    for (const auto& e : cap.errors) {
        EXPECT_EQ(e.scope, ErrorScope::Session);
        EXPECT_EQ(e.error.message, "Request must have string 'id' field");
    }
    EXPECT_TRUE(cap.requests.empty());
}

TEST(Router, RequestBadMethodIsRequestError) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("{\"type\":\"request\",\"id\":\"r9\",\"method\":42}", handlers));
    EXPECT_FALSE(router->routeLine("{\"type\":\"request\",\"id\":\"r10\"}", handlers));
    ASSERT_EQ(cap.errors.size(), 2u);
    EXPECT_EQ(cap.errors[0].scope, ErrorScope::Request);
    EXPECT_EQ(cap.errors[0].requestId, "r9");
    EXPECT_EQ(cap.errors[0].error.code, "invalidMessage");
    EXPECT_EQ(cap.errors[0].error.message, "Request must have string 'method' field");
    EXPECT_EQ(cap.errors[1].requestId, "r10");
}

TEST(Router, EmptyMethodIsRoutedForDispatch) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_TRUE(router->routeLine("{\"type\":\"request\",\"id\":\"r1\",\"method\":\"\"}", handlers));
    EXPECT_TRUE(router->routeLine("{\"type\":\"notification\",\"method\":\"\"}", handlers));
    EXPECT_TRUE(cap.errors.empty());
    ASSERT_EQ(cap.requests.size(), 1u);
    EXPECT_EQ(cap.requests[0].method, "");
    ASSERT_EQ(cap.notifications.size(), 1u);
    EXPECT_EQ(cap.notifications[0].method, "");
}

TEST(Router, RequestNonObjectParamsIsRequestError) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("{\"type\":\"request\",\"id\":\"r1\",\"method\":\"add\",\"params\":[1,2]}",
                                   handlers));
    ASSERT_EQ(cap.errors.size(), 1u);
    EXPECT_EQ(cap.errors[0].scope, ErrorScope::Request);
    EXPECT_EQ(cap.errors[0].error.message, "Request 'params' must be an object");
}

TEST(Router, NotificationRouting) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_TRUE(router->routeLine("{\"type\":\"notification\",\"method\":\"tick\"}", handlers));
    EXPECT_TRUE(router->routeLine("{\"type\":\"notification\",\"method\":\"tick\",\"id\":\"n1\",\"params\":{}}",
                                  handlers));
    ASSERT_EQ(cap.notifications.size(), 2u);
    EXPECT_FALSE(cap.notifications[0].id.has_value());
    EXPECT_EQ(cap.notifications[1].id, std::optional<std::string>("n1"));
    EXPECT_TRUE(cap.notifications[1].params.has_value());
}

TEST(Router, NotificationValidation) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("{\"type\":\"notification\"}", handlers));
    EXPECT_FALSE(router->routeLine("{\"type\":\"notification\",\"method\":\"tick\",\"id\":3}", handlers));
    EXPECT_FALSE(router->routeLine("{\"type\":\"notification\",\"method\":\"tick\",\"params\":\"x\"}", handlers));
    ASSERT_EQ(cap.errors.size(), 3u);
    EXPECT_EQ(cap.errors[0].error.message, "Notification must have string 'method' field");
    EXPECT_EQ(cap.errors[1].error.message, "Notification 'id' must be a string");
    EXPECT_EQ(cap.errors[2].error.message, "Notification 'params' must be an object");
    for (const auto& e : cap.errors) {
        EXPECT_EQ(e.scope, ErrorScope::Session);
    }
    EXPECT_TRUE(cap.notifications.empty());
}

TEST(Router, UnknownTypeIsIgnored) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    EXPECT_FALSE(router->routeLine("{\"type\":\"response\",\"id\":\"r1\",\"data\":{}}", handlers));
    EXPECT_FALSE(router->routeLine("{\"method\":\"ping\"}", handlers));
    EXPECT_TRUE(cap.errors.empty());
    EXPECT_TRUE(cap.requests.empty());
    EXPECT_TRUE(cap.notifications.empty());
}

TEST(Router, TaxonomyOverridesValidationCode) {
    errors::ErrorTaxonomy taxonomy;
    taxonomy.SetKindCode(errors::ErrorKind::ValidationFailure, "badShape");
    auto router = MakeDefaultMessageRouter(taxonomy);
    Capture cap;
    auto handlers = cap.handlers();
    router->routeLine("[]", handlers);
    ASSERT_EQ(cap.errors.size(), 1u);
    EXPECT_EQ(cap.errors[0].error.code, "badShape");
}

TEST(Router, MissingHandlersDoNotThrow) {
    errors::ErrorTaxonomy taxonomy;
    auto router = MakeDefaultMessageRouter(taxonomy);
    RouterHandlers empty;
    EXPECT_NO_THROW(router->routeLine("{bad", empty));
    EXPECT_FALSE(router->routeLine("{\"type\":\"request\",\"id\":\"r1\",\"method\":\"ping\"}", empty));
}
