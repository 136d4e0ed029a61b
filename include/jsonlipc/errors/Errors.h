//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error codes, typed error structure, handler exception types and the exception-to-code taxonomy
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "jsonlipc/JSONValue.h"

namespace jsonlipc {

//==========================================================================================================
// ErrorCodes
// Purpose: Stable string codes carried in ErrorCode.code. Deployments may add their own.
//==========================================================================================================
namespace ErrorCodes {
    inline constexpr const char* InvalidMessage = "invalidMessage";
    inline constexpr const char* InvalidJSON = "invalidJSON";
    inline constexpr const char* MethodNotFound = "methodNotFound";
    inline constexpr const char* InvalidParameters = "invalidParameters";
    inline constexpr const char* HandlerError = "handlerError";
    inline constexpr const char* InternalError = "internalError";
    inline constexpr const char* MessageTooLarge = "messageTooLarge";

    // Exception-derived defaults
    inline constexpr const char* ValueError = "valueError";
    inline constexpr const char* TypeError = "typeError";
    inline constexpr const char* RangeError = "rangeError";
    inline constexpr const char* RuntimeError = "runtimeError";
}

namespace errors {

// Logical failure kinds resolved through ErrorTaxonomy::CodeFor.
enum class ErrorKind {
    ValidationFailure,
    DecodeFailure,
    MethodNotFound,
    InvalidParameters,
    HandlerException,
    MessageTooLarge,
    InternalFault
};

// Typed error representation carried on the wire as { code, message, details? }.
struct ErrorCode {
    std::string code;
    std::string message;
    std::optional<JSONValue> details;
};

// Create a JSONValue error object from a typed ErrorCode.
//
// Args:
//   err: The ErrorCode to serialize.
//
// Returns:
//   JSONValue of Object type with code/message and optional details.
inline JSONValue makeErrorValue(const ErrorCode& err) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(err.code);
    obj["message"] = std::make_shared<JSONValue>(err.message);
    if (err.details.has_value()) {
        obj["details"] = std::make_shared<JSONValue>(err.details.value());
    }
    return JSONValue{obj};
}

// Convert an error object (shape: { code, message, details? }) to ErrorCode.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<ErrorCode> errorCodeFromValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto code = GetString(obj, "code");
    auto message = GetString(obj, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    ErrorCode e;
    e.code = std::move(*code);
    e.message = std::move(*message);
    if (const JSONValue* d = FindMember(obj, "details")) {
        e.details = *d;
    }
    return e;
}

//==========================================================================================================
// CodedError
// Purpose: Exception a handler throws to choose its own error code (and optional details).
//==========================================================================================================
class CodedError : public std::runtime_error {
public:
    CodedError(std::string code, const std::string& message, std::optional<JSONValue> details = std::nullopt)
        : std::runtime_error(message), code_(std::move(code)), details_(std::move(details)) {}

    const std::string& code() const noexcept { return code_; }
    const std::optional<JSONValue>& details() const noexcept { return details_; }

private:
    std::string code_;
    std::optional<JSONValue> details_;
};

// Raised by handlers (and typed parameter decoding) for bad input; maps to invalidParameters.
class InvalidParametersError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised by default handlers that decline a method; maps to methodNotFound.
class MethodNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ErrorTaxonomy
// Purpose: Resolves failure kinds and handler exceptions to stable string codes.
// Notes:
//   Exception mappings are checked newest-first, so MapException() overrides the built-in defaults.
//   Anything unmatched resolves to internalError.
//==========================================================================================================
class ErrorTaxonomy {
public:
    ErrorTaxonomy();

    // Maps exceptions of type E (and subclasses) to code.
    template <typename E>
    void MapException(const std::string& code) {
        mappings_.insert(mappings_.begin(), Mapping{
            [](const std::exception& e) { return dynamic_cast<const E*>(&e) != nullptr; },
            code});
    }

    // Overrides the code emitted for a logical failure kind.
    void SetKindCode(ErrorKind kind, const std::string& code);

    std::string CodeFor(ErrorKind kind) const;

    // Code for an exception; CodedError carries its own code.
    std::string CodeForException(const std::exception& e) const;

    // Full ErrorCode for an exception: mapped code, what() as message, CodedError details.
    ErrorCode FromException(const std::exception& e) const;

private:
    struct Mapping {
        std::function<bool(const std::exception&)> matches;
        std::string code;
    };
    std::vector<Mapping> mappings_;
    std::map<ErrorKind, std::string> kindCodes_;
};

} // namespace errors
} // namespace jsonlipc
