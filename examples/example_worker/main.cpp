//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/example_worker/main.cpp
// Purpose: Demo worker speaking JSONL over stdin/stdout with a handful of arithmetic, echo, log and
//          progress handlers
//==========================================================================================================

#include <string>

#include "ExampleHandlers.h"
#include "logging/Logger.h"
#include "jsonlipc/StdioLineTransport.hpp"
#include "jsonlipc/Worker.h"

using namespace jsonlipc;

int main(int argc, char** argv) {
    Logger::configureFromEnvironment();

    WorkerOptions options = WorkerOptions::FromEnvironment();
    if (argc > 1) {
        options = WorkerOptions::FromConfigString(argv[1], options);
    }

    StdioLineTransportFactory factory;
    auto transport = factory.CreateTransport("max_line_bytes=" + std::to_string(options.maxLineBytes));

    Worker worker(std::move(transport), options);
    example::RegisterExampleHandlers(worker);

    return worker.Run();
}
