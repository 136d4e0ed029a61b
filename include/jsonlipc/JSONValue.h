//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON document model, strict parser and compact serializer used on the JSONL wire
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace jsonlipc {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: map<string, shared_ptr<JSONValue>> representing a JSON object. Keys serialize in sorted
//           order so encode(decode(encode(x))) is byte-for-byte stable.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
};

// Deep equality. Integers and doubles compare numerically; everything else requires the same type.
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed text. offset() is the byte position of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses exactly one JSON document (surrounding whitespace allowed).
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   The parsed JSONValue.
// Throws:
//   JSONParseError on any syntax error, trailing content, or nesting deeper than 512 levels.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact single-line serialization (no insignificant whitespace, no raw newlines).
//          Non-finite doubles serialize as null; integral doubles keep a trailing ".0".
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//------------------------------ Object helpers ------------------------------
// Returns the member or nullptr when absent.
const JSONValue* FindMember(const JSONValue::Object& obj, const std::string& key);

// Typed lookups: std::nullopt when the member is absent or of another type.
std::optional<std::string> GetString(const JSONValue::Object& obj, const std::string& key);
std::optional<double> GetNumber(const JSONValue::Object& obj, const std::string& key);
std::optional<int64_t> GetInteger(const JSONValue::Object& obj, const std::string& key);
std::optional<bool> GetBool(const JSONValue::Object& obj, const std::string& key);

// Inserts or replaces obj[key].
void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue v);

// Inserts obj[key] only when absent; returns true when inserted.
bool SetMemberIfAbsent(JSONValue::Object& obj, const std::string& key, JSONValue v);

} // namespace jsonlipc
