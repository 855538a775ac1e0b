#include "sketchbook/engine/Serialization.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace sketchbook {

namespace {

const JsonValue kNull{};
constexpr int kMaxNesting = 256;

bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

void appendUtf8(std::string& out, std::uint32_t code)
{
    if (code < 0x80) {
        out += static_cast<char>(code);
        return;
    }
    // Lead byte marker and continuation byte count by code point range.
    const int continuation = code < 0x800 ? 1 : (code < 0x10000 ? 2 : 3);
    static constexpr unsigned char kLead[] = {0x00, 0xC0, 0xE0, 0xF0};
    out += static_cast<char>(kLead[continuation] | (code >> (6 * continuation)));
    for (int shift = 6 * (continuation - 1); shift >= 0; shift -= 6) {
        out += static_cast<char>(0x80 | ((code >> shift) & 0x3F));
    }
}

// Recursive descent over a string_view. Every failure reports the byte offset.
class JsonReader {
public:
    explicit JsonReader(std::string_view source)
        : text(source)
    {
    }

    std::shared_ptr<JsonValue> document()
    {
        auto root = value(0);
        skipSpace();
        if (offset != text.size()) {
            fail("unexpected trailing characters");
        }
        return root;
    }

private:
    [[noreturn]] void fail(const std::string& what) const
    {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(offset) + ": " + what);
    }

    char current() const noexcept { return offset < text.size() ? text[offset] : '\0'; }

    bool consume(char expected) noexcept
    {
        if (current() != expected || offset >= text.size()) {
            return false;
        }
        ++offset;
        return true;
    }

    void require(char expected)
    {
        if (!consume(expected)) {
            fail(std::string("expected '") + expected + "'");
        }
    }

    void skipSpace() noexcept
    {
        while (offset < text.size() && (text[offset] == ' ' || text[offset] == '\t' || text[offset] == '\n' || text[offset] == '\r')) {
            ++offset;
        }
    }

    void keyword(std::string_view word)
    {
        if (text.compare(offset, word.size(), word) != 0) {
            fail("invalid literal");
        }
        offset += word.size();
    }

    std::shared_ptr<JsonValue> value(int depth)
    {
        if (depth > kMaxNesting) {
            fail("nesting too deep");
        }
        skipSpace();
        const char c = current();
        if (c == '{') {
            return object(depth);
        }
        if (c == '[') {
            return array(depth);
        }
        if (c == '"') {
            return json(string());
        }
        if (c == 't') {
            keyword("true");
            return json(true);
        }
        if (c == 'f') {
            keyword("false");
            return json(false);
        }
        if (c == 'n') {
            keyword("null");
            return json(nullptr);
        }
        if (c == '-' || isDigit(c)) {
            return json(number());
        }
        if (offset >= text.size()) {
            fail("unexpected end of input");
        }
        fail(std::string("unexpected character '") + c + "'");
    }

    std::shared_ptr<JsonValue> object(int depth)
    {
        require('{');
        JsonObject members;
        skipSpace();
        if (!consume('}')) {
            do {
                skipSpace();
                if (current() != '"') {
                    fail("expected object key");
                }
                std::string key = string();
                skipSpace();
                require(':');
                members[std::move(key)] = value(depth + 1);
                skipSpace();
            } while (consume(','));
            require('}');
        }
        return json(std::move(members));
    }

    std::shared_ptr<JsonValue> array(int depth)
    {
        require('[');
        JsonArray items;
        skipSpace();
        if (!consume(']')) {
            do {
                items.push_back(value(depth + 1));
                skipSpace();
            } while (consume(','));
            require(']');
        }
        return json(std::move(items));
    }

    std::uint32_t hexQuad()
    {
        if (text.size() - offset < 4) {
            fail("truncated unicode escape");
        }
        std::uint32_t code = 0;
        for (int digit = 0; digit < 4; ++digit) {
            const char c = text[offset++];
            std::uint32_t nibble = 0;
            if (isDigit(c)) {
                nibble = static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                nibble = static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                nibble = static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                fail("invalid unicode escape");
            }
            code = (code << 4) | nibble;
        }
        return code;
    }

    std::uint32_t codePoint()
    {
        const std::uint32_t high = hexQuad();
        if (high >= 0xDC00 && high <= 0xDFFF) {
            fail("unpaired surrogate");
        }
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        if (text.compare(offset, 2, "\\u") != 0) {
            fail("unpaired surrogate");
        }
        offset += 2;
        const std::uint32_t low = hexQuad();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("invalid low surrogate");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    std::string string()
    {
        require('"');
        std::string out;
        for (;;) {
            if (offset >= text.size()) {
                fail("unterminated string");
            }
            const char c = text[offset++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (offset >= text.size()) {
                fail("unterminated escape");
            }
            const char escape = text[offset++];
            switch (escape) {
            case '"':
            case '\\':
            case '/':
                out += escape;
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'u':
                appendUtf8(out, codePoint());
                break;
            default:
                fail(std::string("invalid escape '\\") + escape + "'");
            }
        }
    }

    void digits(const char* what)
    {
        if (!isDigit(current())) {
            fail(what);
        }
        while (isDigit(current())) {
            ++offset;
        }
    }

    double number()
    {
        const std::size_t start = offset;
        consume('-');
        if (!consume('0')) {
            digits("invalid number");
        }
        if (consume('.')) {
            digits("expected digit after decimal point");
        }
        if (consume('e') || consume('E')) {
            if (!consume('+')) {
                consume('-');
            }
            digits("expected digit in exponent");
        }

        // Grammar already checked; the classic locale keeps '.' as the decimal point.
        std::istringstream stream{std::string(text.substr(start, offset - start))};
        stream.imbue(std::locale::classic());
        double result = 0.0;
        stream >> result;
        if (stream.fail() || !std::isfinite(result)) {
            offset = start;
            fail("number out of range");
        }
        return result;
    }

    std::string_view text;
    std::size_t offset{0};
};

// Pretty printer writing the whole tree into one stream.
class JsonWriter {
public:
    explicit JsonWriter(int indentStep)
        : step(indentStep)
    {
        out.imbue(std::locale::classic());
        out << std::setprecision(10);
    }

    void write(const JsonValue& node, int depth)
    {
        if (node.isNull()) {
            out << "null";
        } else if (node.isBool()) {
            out << (node.asBool() ? "true" : "false");
        } else if (node.isNumber()) {
            out << node.asNumber();
        } else if (node.isString()) {
            quoted(node.asString());
        } else if (node.isArray()) {
            const JsonArray& items = node.asArray();
            open('[', items.empty());
            for (std::size_t i = 0; i < items.size(); ++i) {
                indent(depth + 1);
                child(items[i].get(), depth + 1);
                separator(i + 1 < items.size());
            }
            close(']', depth, items.empty());
        } else {
            const JsonObject& members = node.asObject();
            open('{', members.empty());
            std::size_t written = 0;
            for (const auto& member : members) {
                indent(depth + 1);
                quoted(member.first);
                out << ": ";
                child(member.second.get(), depth + 1);
                separator(++written < members.size());
            }
            close('}', depth, members.empty());
        }
    }

    std::string text() const { return out.str(); }

private:
    void child(const JsonValue* node, int depth)
    {
        write(node != nullptr ? *node : kNull, depth);
    }

    void open(char bracket, bool empty)
    {
        out << bracket;
        if (!empty) {
            out << '\n';
        }
    }

    void close(char bracket, int depth, bool empty)
    {
        if (!empty) {
            indent(depth);
        }
        out << bracket;
    }

    void separator(bool more)
    {
        out << (more ? ",\n" : "\n");
    }

    void indent(int depth)
    {
        out << std::string(static_cast<std::size_t>(depth * step), ' ');
    }

    void quoted(const std::string& value)
    {
        out << '"';
        for (const char c : value) {
            switch (c) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            case '\b':
                out << "\\b";
                break;
            case '\f':
                out << "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    out << "\\u00" << kHex[(c >> 4) & 0xF] << kHex[c & 0xF];
                } else {
                    out << c;
                }
            }
        }
        out << '"';
    }

    std::ostringstream out;
    int step;
};

} // namespace

bool JsonValue::has(std::string_view key) const
{
    return isObject() && asObject().find(key) != asObject().end();
}

const JsonValue& JsonValue::operator[](std::string_view key) const
{
    if (!isObject()) {
        return kNull;
    }
    const auto found = asObject().find(key);
    return found != asObject().end() && found->second ? *found->second : kNull;
}

JsonValue& JsonValue::operator[](std::string_view key)
{
    if (!isObject()) {
        data = JsonObject{};
    }
    auto& slot = asObject()[std::string(key)];
    if (!slot) {
        slot = std::make_shared<JsonValue>();
    }
    return *slot;
}

const JsonValue& JsonValue::operator[](std::size_t index) const
{
    if (!isArray() || index >= asArray().size() || !asArray()[index]) {
        return kNull;
    }
    return *asArray()[index];
}

JsonValue& JsonValue::operator[](std::size_t index)
{
    if (!isArray()) {
        data = JsonArray{};
    }
    JsonArray& items = asArray();
    while (items.size() <= index) {
        items.push_back(std::make_shared<JsonValue>());
    }
    if (!items[index]) {
        items[index] = std::make_shared<JsonValue>();
    }
    return *items[index];
}

std::size_t JsonValue::size() const noexcept
{
    if (const auto* items = std::get_if<JsonArray>(&data)) {
        return items->size();
    }
    if (const auto* members = std::get_if<JsonObject>(&data)) {
        return members->size();
    }
    return 0;
}

const char* JsonValue::typeName() const noexcept
{
    static constexpr const char* kNames[] = {"null", "boolean", "number", "string", "array", "object"};
    return kNames[data.index()];
}

std::string JsonValue::stringify(int indent) const
{
    JsonWriter writer(indent);
    writer.write(*this, 0);
    return writer.text();
}

std::shared_ptr<JsonValue> JsonValue::parse(std::string_view text)
{
    return JsonReader(text).document();
}

namespace serialization {

namespace {
template <typename Vec>
std::shared_ptr<JsonValue> serializeVector(const Vec& v)
{
    JsonArray items;
    for (int i = 0; i < Vec::length(); ++i) {
        items.push_back(json(v[i]));
    }
    return json(std::move(items));
}

template <typename Vec>
bool deserializeVector(const JsonValue& v, Vec& out)
{
    if (!v.isArray() || v.size() != static_cast<std::size_t>(Vec::length())) {
        return false;
    }
    Vec result{};
    for (int i = 0; i < Vec::length(); ++i) {
        const JsonValue& component = v[static_cast<std::size_t>(i)];
        if (!component.isNumber()) {
            return false;
        }
        result[i] = component.asFloat();
    }
    out = result;
    return true;
}
} // namespace

std::shared_ptr<JsonValue> serializeVec3(const glm::vec3& v)
{
    return serializeVector(v);
}

std::shared_ptr<JsonValue> serializeVec4(const glm::vec4& v)
{
    return serializeVector(v);
}

bool deserializeVec3(const JsonValue& v, glm::vec3& out)
{
    return deserializeVector(v, out);
}

bool deserializeVec4(const JsonValue& v, glm::vec4& out)
{
    return deserializeVector(v, out);
}

} // namespace serialization

} // namespace sketchbook
