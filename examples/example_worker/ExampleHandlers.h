//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/example_worker/ExampleHandlers.h
// Purpose: Demo handlers (arithmetic, echo, log, progress) registered by the example worker
//==========================================================================================================

#pragma once

#include "jsonlipc/Dispatcher.h"
#include "jsonlipc/Worker.h"

namespace jsonlipc::example {

// Parameter record for "add": both operands are required numbers.
struct AddParams {
    JSONValue a;
    JSONValue b;

    static AddParams FromJSON(const JSONValue::Object& params);
};

//==========================================================================================================
// Arithmetic handlers
// Notes:
//   Two integer operands produce an integer result unless it would overflow int64, in which case the
//   result is computed in double precision.
//==========================================================================================================
HandlerOutcome HandleAdd(const AddParams& p);
HandlerOutcome HandleMultiply(const JSONValue::Object& params);
HandlerOutcome HandleDivide(const JSONValue::Object& params);

HandlerOutcome HandleEcho(const JSONValue::Object& params);
HandlerOutcome HandleLog(HandlerContext& ctx);
HandlerOutcome HandleProgress(HandlerContext& ctx);
// Fallback for unregistered methods; always fails with methodNotFound.
HandlerOutcome HandleDefault(HandlerContext& ctx);

// Registers every demo handler above plus "noop" and "default".
void RegisterExampleHandlers(Worker& worker);

} // namespace jsonlipc::example
