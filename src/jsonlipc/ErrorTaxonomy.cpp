//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorTaxonomy.cpp
// Purpose: Default kind and exception mappings for ErrorTaxonomy
//==========================================================================================================

#include <typeinfo>
#include <variant>

#include "jsonlipc/errors/Errors.h"

namespace jsonlipc {
namespace errors {

ErrorTaxonomy::ErrorTaxonomy() {
    kindCodes_[ErrorKind::ValidationFailure] = ErrorCodes::InvalidMessage;
    kindCodes_[ErrorKind::DecodeFailure] = ErrorCodes::InvalidJSON;
    kindCodes_[ErrorKind::MethodNotFound] = ErrorCodes::MethodNotFound;
    kindCodes_[ErrorKind::InvalidParameters] = ErrorCodes::InvalidParameters;
    kindCodes_[ErrorKind::HandlerException] = ErrorCodes::HandlerError;
    kindCodes_[ErrorKind::MessageTooLarge] = ErrorCodes::MessageTooLarge;
    kindCodes_[ErrorKind::InternalFault] = ErrorCodes::InternalError;

    // Inserted general-first; lookup runs newest-first, so the most specific types win.
    MapException<std::runtime_error>(ErrorCodes::RuntimeError);
    MapException<std::out_of_range>(ErrorCodes::RangeError);
    MapException<std::invalid_argument>(ErrorCodes::ValueError);
    MapException<std::bad_cast>(ErrorCodes::TypeError);
    MapException<std::bad_variant_access>(ErrorCodes::TypeError);
    MapException<MethodNotFoundError>(ErrorCodes::MethodNotFound);
    MapException<InvalidParametersError>(ErrorCodes::InvalidParameters);
}

void ErrorTaxonomy::SetKindCode(ErrorKind kind, const std::string& code) {
    kindCodes_[kind] = code;
}

std::string ErrorTaxonomy::CodeFor(ErrorKind kind) const {
    auto it = kindCodes_.find(kind);
    if (it == kindCodes_.end() || it->second.empty()) {
        return ErrorCodes::InternalError;
    }
    return it->second;
}

std::string ErrorTaxonomy::CodeForException(const std::exception& e) const {
    if (const auto* coded = dynamic_cast<const CodedError*>(&e)) {
        if (!coded->code().empty()) {
            return coded->code();
        }
    }
    for (const auto& m : mappings_) {
        if (m.matches && m.matches(e)) {
            return m.code;
        }
    }
    return CodeFor(ErrorKind::InternalFault);
}

ErrorCode ErrorTaxonomy::FromException(const std::exception& e) const {
    ErrorCode err;
    err.code = CodeForException(e);
    err.message = e.what();
    if (const auto* coded = dynamic_cast<const CodedError*>(&e)) {
        err.details = coded->details();
    }
    return err;
}

} // namespace errors
} // namespace jsonlipc
