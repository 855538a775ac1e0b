#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sketchbook {

class JsonValue;

// Objects keep their keys sorted, so stringify() output is stable.
using JsonObject = std::map<std::string, std::shared_ptr<JsonValue>, std::less<>>;
using JsonArray = std::vector<std::shared_ptr<JsonValue>>;

// A JSON document node. Numbers are stored as double.
class JsonValue {
public:
    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool flag) : data(flag) {}
    JsonValue(int number) : data(static_cast<double>(number)) {}
    JsonValue(float number) : data(static_cast<double>(number)) {}
    JsonValue(double number) : data(number) {}
    JsonValue(const char* text) : data(std::string(text)) {}
    JsonValue(std::string text) : data(std::move(text)) {}
    JsonValue(JsonArray items) : data(std::move(items)) {}
    JsonValue(JsonObject members) : data(std::move(members)) {}

    [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool isNumber() const noexcept { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool isArray() const noexcept { return std::holds_alternative<JsonArray>(data); }
    [[nodiscard]] bool isObject() const noexcept { return std::holds_alternative<JsonObject>(data); }

    // Throw std::bad_variant_access on a type mismatch.
    [[nodiscard]] bool asBool() const { return std::get<bool>(data); }
    [[nodiscard]] double asNumber() const { return std::get<double>(data); }
    [[nodiscard]] float asFloat() const { return static_cast<float>(asNumber()); }
    [[nodiscard]] int asInt() const { return static_cast<int>(asNumber()); }
    [[nodiscard]] const std::string& asString() const { return std::get<std::string>(data); }
    [[nodiscard]] const JsonArray& asArray() const { return std::get<JsonArray>(data); }
    [[nodiscard]] JsonArray& asArray() { return std::get<JsonArray>(data); }
    [[nodiscard]] const JsonObject& asObject() const { return std::get<JsonObject>(data); }
    [[nodiscard]] JsonObject& asObject() { return std::get<JsonObject>(data); }

    [[nodiscard]] bool has(std::string_view key) const;

    // Reading a missing key or index yields a null value. The mutable overloads
    // turn this value into an object or array and create the slot.
    [[nodiscard]] const JsonValue& operator[](std::string_view key) const;
    [[nodiscard]] JsonValue& operator[](std::string_view key);
    [[nodiscard]] const JsonValue& operator[](std::size_t index) const;
    [[nodiscard]] JsonValue& operator[](std::size_t index);

    // Element count of arrays and objects, 0 for everything else.
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] const char* typeName() const noexcept;

    [[nodiscard]] std::string stringify(int indent = 2) const;

    // Strict RFC 8259 parser. Throws std::runtime_error with the byte offset on malformed input.
    static std::shared_ptr<JsonValue> parse(std::string_view text);

private:
    std::variant<std::monostate, bool, double, std::string, JsonArray, JsonObject> data;
};

inline std::shared_ptr<JsonValue> json(JsonValue value)
{
    return std::make_shared<JsonValue>(std::move(value));
}

namespace serialization {

std::shared_ptr<JsonValue> serializeVec3(const glm::vec3& v);
std::shared_ptr<JsonValue> serializeVec4(const glm::vec4& v);

// Return false and leave out untouched unless v is an array of exactly N numbers.
bool deserializeVec3(const JsonValue& v, glm::vec3& out);
bool deserializeVec4(const JsonValue& v, glm::vec4& out);

} // namespace serialization

} // namespace sketchbook
