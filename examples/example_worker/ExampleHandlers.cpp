//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/example_worker/ExampleHandlers.cpp
// Purpose: Demo handlers (arithmetic, echo, log, progress) registered by the example worker
//==========================================================================================================

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ExampleHandlers.h"

namespace jsonlipc::example {

namespace {

bool bothIntegers(const JSONValue& a, const JSONValue& b) {
    return std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value);
}

double asDouble(const JSONValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v.value)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(v.value);
}

// Reads an optional numeric operand; std::nullopt when present but not a number.
std::optional<JSONValue> operand(const JSONValue::Object& params, const char* key, int64_t fallback) {
    const JSONValue* v = FindMember(params, key);
    if (v == nullptr) {
        return JSONValue(fallback);
    }
    if (!v->IsNumber()) {
        return std::nullopt;
    }
    return *v;
}

} // namespace

AddParams AddParams::FromJSON(const JSONValue::Object& params) {
    const JSONValue* a = FindMember(params, "a");
    const JSONValue* b = FindMember(params, "b");
    if (a == nullptr || b == nullptr) {
        throw errors::InvalidParametersError("Missing required parameters 'a' and 'b'");
    }
    if (!a->IsNumber() || !b->IsNumber()) {
        throw errors::InvalidParametersError("Parameters 'a' and 'b' must be numbers");
    }
    return AddParams{*a, *b};
}

HandlerOutcome HandleAdd(const AddParams& p) {
    JSONValue::Object out;
    int64_t sum = 0;
    if (bothIntegers(p.a, p.b) &&
        !__builtin_add_overflow(std::get<int64_t>(p.a.value), std::get<int64_t>(p.b.value), &sum)) {
        SetMember(out, "sum", JSONValue(sum));
    } else {
        SetMember(out, "sum", JSONValue(asDouble(p.a) + asDouble(p.b)));
    }
    return Success(std::move(out));
}

HandlerOutcome HandleMultiply(const JSONValue::Object& params) {
    auto a = operand(params, "a", 1);
    auto b = operand(params, "b", 1);
    if (!a || !b) {
        return Failure(ErrorCodes::TypeError, "Parameters 'a' and 'b' must be numbers");
    }
    JSONValue::Object out;
    int64_t product = 0;
    if (bothIntegers(*a, *b) &&
        !__builtin_mul_overflow(std::get<int64_t>(a->value), std::get<int64_t>(b->value), &product)) {
        SetMember(out, "product", JSONValue(product));
    } else {
        SetMember(out, "product", JSONValue(asDouble(*a) * asDouble(*b)));
    }
    return Success(std::move(out));
}

HandlerOutcome HandleDivide(const JSONValue::Object& params) {
    auto a = operand(params, "a", 0);
    auto b = operand(params, "b", 1);
    if (!a || !b) {
        return Failure(ErrorCodes::TypeError, "Parameters 'a' and 'b' must be numbers");
    }
    if (asDouble(*b) == 0.0) {
        return Failure("zeroDivisionError", "Division by zero");
    }
    JSONValue::Object out;
    SetMember(out, "quotient", JSONValue(asDouble(*a) / asDouble(*b)));
    return Success(std::move(out));
}

HandlerOutcome HandleEcho(const JSONValue::Object& params) {
    JSONValue::Object out;
    SetMember(out, "echo", JSONValue(params));
    return Success(std::move(out));
}

HandlerOutcome HandleLog(HandlerContext& ctx) {
    ctx.SendLog({MakeLogMessage(MessageLevel::Info, "Session log message")}, true);

    JSONValue::Object warnDetail;
    SetMember(warnDetail, "detail", JSONValue("test warning"));
    JSONValue::Object errorDetail;
    SetMember(errorDetail, "detail", JSONValue("test error"));
    std::vector<LogMessage> messages = {
        MakeLogMessage(MessageLevel::Info, "Starting log test"),
        MakeLogMessage(MessageLevel::Warn, "This is a warning", JSONValue(warnDetail)),
        MakeLogMessage(MessageLevel::Error, "This is an error", JSONValue(errorDetail)),
    };
    ctx.SendLog(messages);

    JSONValue::Object out;
    SetMember(out, "status", JSONValue("logs_sent"));
    SetMember(out, "count", JSONValue(static_cast<int64_t>(messages.size())));
    return Success(std::move(out));
}

HandlerOutcome HandleProgress(HandlerContext& ctx) {
    const int64_t steps = GetInteger(ctx.Params(), "steps").value_or(5);
    const double delay = GetNumber(ctx.Params(), "delay").value_or(0.1);
    if (steps <= 0) {
        throw errors::InvalidParametersError("'steps' must be a positive integer");
    }
    for (int64_t i = 0; i <= steps; ++i) {
        ctx.SendProgress(static_cast<double>(i), static_cast<double>(steps), "steps",
                         "step_" + std::to_string(i),
                         "Processing step " + std::to_string(i) + " of " + std::to_string(steps));
        if (i < steps && delay > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
        }
    }
    JSONValue::Object out;
    SetMember(out, "status", JSONValue("progress_complete"));
    SetMember(out, "total_steps", JSONValue(steps));
    return Success(std::move(out));
}

HandlerOutcome HandleDefault(HandlerContext& ctx) {
    throw errors::MethodNotFoundError("Method not found: " + ctx.Method());
}

void RegisterExampleHandlers(Worker& worker) {
    worker.RegisterTypedHandler<AddParams>("add", HandleAdd);
    worker.RegisterParamsHandler("multiply", HandleMultiply);
    worker.RegisterParamsHandler("divide", HandleDivide);
    worker.RegisterParamsHandler("echo", HandleEcho);
    worker.RegisterHandler("log", HandleLog);
    worker.RegisterHandler("progress", HandleProgress);
    worker.RegisterParamsHandler("noop", [](const JSONValue::Object&) { return Success(); });
    worker.RegisterHandler("default", HandleDefault);
}

} // namespace jsonlipc::example
