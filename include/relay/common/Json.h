#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace common {

// Small DOM for decoding request bodies. Objects keep member order; lookups
// return the last duplicate, matching common JSON decoders.
class JsonValue {
public:
    enum class Type { kNull, kBool, kNumber, kString, kArray, kObject };

    using Array = std::vector<JsonValue>;
    using Object = std::vector<std::pair<std::string, JsonValue>>;

    JsonValue() = default;

    static JsonValue MakeBool(bool b);
    static JsonValue MakeNumber(double d);
    static JsonValue MakeString(std::string s);
    static JsonValue MakeArray(Array a);
    static JsonValue MakeObject(Object o);

    Type type() const { return type_; }
    bool isNull() const { return type_ == Type::kNull; }
    bool isString() const { return type_ == Type::kString; }
    bool isObject() const { return type_ == Type::kObject; }

    bool asBool() const { return bool_; }
    double asNumber() const { return number_; }
    const std::string& asString() const { return string_; }
    const Array& asArray() const { return array_; }
    const Object& asObject() const { return object_; }

    // nullptr when not an object or the member is absent.
    const JsonValue* find(const std::string& key) const;

private:
    Type type_{Type::kNull};
    bool bool_{false};
    double number_{0.0};
    std::string string_;
    Array array_;
    Object object_;
};

// Parse a complete JSON document (surrounding whitespace allowed).
// On failure returns nullopt and stores the byte offset of the error.
std::optional<JsonValue> ParseJson(const std::string& text, size_t* errorOffset = nullptr);

// Escape for embedding inside a JSON string literal (quotes not added).
std::string JsonEscape(const std::string& s);

} // namespace common
} // namespace relay
