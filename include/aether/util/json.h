// AETHER - JSON Value
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Minimal JSON representation used for wallet records and transactions.
// Object keys are kept in a std::map, so serialization is canonical.

#ifndef AETHER_UTIL_JSON_H
#define AETHER_UTIL_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aether {
namespace util {

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    // Constructors
    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    // Type checking
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    const std::string& GetString(const std::string& defaultValue = emptyString_) const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(const JSONValue& value);
    void Push(JSONValue&& value);

    // Serialization
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Parse a complete document; throws std::runtime_error on malformed input
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);

    static const JSONValue& Null() { return nullValue_; }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;

    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

/// Quote and escape a string as a JSON string literal
std::string JSONQuote(const std::string& str);

} // namespace util
} // namespace aether

#endif // AETHER_UTIL_JSON_H
