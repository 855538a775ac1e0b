#include "sketchbook/cones/ConesSettings.hpp"

#include "sketchbook/core/filesystem/FileSystem.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace sketchbook::cones {

namespace {

[[noreturn]] void invalid(const std::string& key, const std::string& what)
{
    throw std::runtime_error("Invalid setting '" + key + "': " + what);
}

const JsonValue* section(const JsonValue& root, const std::string& name)
{
    if (!root.has(name)) {
        return nullptr;
    }
    const auto& value = root[name];
    if (!value.isObject()) {
        invalid(name, std::string("expected object, got ") + value.typeName());
    }
    return &value;
}

void readFloat(const JsonValue& object, const std::string& prefix, const std::string& key, float& out,
               float minValue = std::numeric_limits<float>::lowest())
{
    if (!object.has(key)) {
        return;
    }
    const auto& value = object[key];
    const std::string name = prefix + key;
    if (!value.isNumber()) {
        invalid(name, std::string("expected number, got ") + value.typeName());
    }
    const double number = value.asNumber();
    if (number < static_cast<double>(minValue) || number > static_cast<double>(std::numeric_limits<float>::max())) {
        invalid(name, "value " + std::to_string(number) + " out of range");
    }
    out = static_cast<float>(number);
}

template <typename Integer>
void readInteger(const JsonValue& object, const std::string& prefix, const std::string& key, Integer& out,
                 long long minValue, long long maxValue)
{
    if (!object.has(key)) {
        return;
    }
    const auto& value = object[key];
    const std::string name = prefix + key;
    if (!value.isNumber() || std::floor(value.asNumber()) != value.asNumber()) {
        invalid(name, std::string("expected integer, got ") + value.typeName());
    }
    const double number = value.asNumber();
    if (number < static_cast<double>(minValue) || number > static_cast<double>(maxValue)) {
        invalid(name, "value " + std::to_string(static_cast<long long>(number)) + " out of range ["
                      + std::to_string(minValue) + ", " + std::to_string(maxValue) + "]");
    }
    out = static_cast<Integer>(number);
}

void readString(const JsonValue& object, const std::string& prefix, const std::string& key, std::string& out)
{
    if (!object.has(key)) {
        return;
    }
    const auto& value = object[key];
    if (!value.isString()) {
        invalid(prefix + key, std::string("expected string, got ") + value.typeName());
    }
    out = value.asString();
}

void readVec3(const JsonValue& object, const std::string& prefix, const std::string& key, glm::vec3& out)
{
    if (object.has(key) && !serialization::deserializeVec3(object[key], out)) {
        invalid(prefix + key, "expected an array of 3 numbers");
    }
}

void readVec4(const JsonValue& object, const std::string& prefix, const std::string& key, glm::vec4& out)
{
    if (object.has(key) && !serialization::deserializeVec4(object[key], out)) {
        invalid(prefix + key, "expected an array of 4 numbers");
    }
}

void requirePositive(float value, const std::string& key)
{
    if (!(value > 0.0f)) {
        invalid(key, "must be positive");
    }
}

} // namespace

ConesSettings settingsFromJson(const JsonValue& root)
{
    if (!root.isObject()) {
        invalid("<root>", std::string("expected object, got ") + root.typeName());
    }

    ConesSettings settings{};

    if (const auto* display = section(root, "display")) {
        readString(*display, "display.", "title", settings.display.title);
        readInteger(*display, "display.", "width", settings.display.width, 1, 16384);
        readInteger(*display, "display.", "height", settings.display.height, 1, 16384);
        readVec4(*display, "display.", "clearColor", settings.display.clearColor);
        readInteger(*display, "display.", "frameLimit", settings.display.frameLimit, 0, 1000);
    }

    if (const auto* camera = section(root, "camera")) {
        readFloat(*camera, "camera.", "fov", settings.camera.fov, 1.0f);
        readFloat(*camera, "camera.", "near", settings.camera.nearPlane);
        readFloat(*camera, "camera.", "far", settings.camera.farPlane);
        readFloat(*camera, "camera.", "radius", settings.camera.radius, 0.0f);
        readFloat(*camera, "camera.", "height", settings.camera.height);
        readFloat(*camera, "camera.", "frequency", settings.camera.frequency);
        if (settings.camera.fov >= 180.0f) {
            invalid("camera.fov", "must be below 180 degrees");
        }
        requirePositive(settings.camera.nearPlane, "camera.near");
        if (!(settings.camera.farPlane > settings.camera.nearPlane)) {
            invalid("camera.far", "must be greater than camera.near");
        }
    }

    if (const auto* grid = section(root, "grid")) {
        readInteger(*grid, "grid.", "count", settings.grid.count, 0, 2001);
        readFloat(*grid, "grid.", "spacing", settings.grid.spacing);
        requirePositive(settings.grid.spacing, "grid.spacing");
    }

    if (const auto* shape = section(root, "shape")) {
        std::string kindName = toString(settings.shape.kind);
        readString(*shape, "shape.", "kind", kindName);
        const auto kind = parseMeshKind(kindName);
        if (!kind) {
            invalid("shape.kind", "unknown shape '" + kindName + "' (expected cone, cylinder or sphere)");
        }
        settings.shape.kind = *kind;
        readFloat(*shape, "shape.", "radius", settings.shape.dimensions.radius);
        readFloat(*shape, "shape.", "height", settings.shape.dimensions.height);
        readInteger(*shape, "shape.", "sectors", settings.shape.dimensions.sectors, 3, 256);
        readVec4(*shape, "shape.", "albedo", settings.shape.albedo);
        readFloat(*shape, "shape.", "roughness", settings.shape.roughness, 0.0f);
        readFloat(*shape, "shape.", "metallic", settings.shape.metallic, 0.0f);
        requirePositive(settings.shape.dimensions.radius, "shape.radius");
        requirePositive(settings.shape.dimensions.height, "shape.height");
        if (settings.shape.roughness > 1.0f) {
            invalid("shape.roughness", "must be within [0, 1]");
        }
        if (settings.shape.metallic > 1.0f) {
            invalid("shape.metallic", "must be within [0, 1]");
        }
    }

    if (const auto* light = section(root, "light")) {
        readVec3(*light, "light.", "color", settings.light.color);
        readVec3(*light, "light.", "mirroredColor", settings.light.mirroredColor);
        readFloat(*light, "light.", "intensity", settings.light.intensity, 0.0f);
        readFloat(*light, "light.", "range", settings.light.range);
        readFloat(*light, "light.", "radius", settings.light.radius, 0.0f);
        readFloat(*light, "light.", "height", settings.light.height);
        readFloat(*light, "light.", "frequency", settings.light.frequency);
        requirePositive(settings.light.range, "light.range");
    }

    if (root.has("mirroredLight")) {
        const auto& value = root["mirroredLight"];
        if (!value.isBool()) {
            invalid("mirroredLight", std::string("expected boolean, got ") + value.typeName());
        }
        settings.mirroredLight = value.asBool();
    }

    if (const auto* log = section(root, "log")) {
        std::string levelName = toString(settings.log.level);
        readString(*log, "log.", "level", levelName);
        const auto level = parseLogLevel(levelName);
        if (!level) {
            invalid("log.level", "unknown level '" + levelName + "'");
        }
        settings.log.level = *level;
        readString(*log, "log.", "file", settings.log.file);
    }

    return settings;
}

std::shared_ptr<JsonValue> settingsToJson(const ConesSettings& settings)
{
    auto root = json(JsonObject{});
    auto& r = *root;

    r["display"]["title"] = settings.display.title;
    r["display"]["width"] = static_cast<double>(settings.display.width);
    r["display"]["height"] = static_cast<double>(settings.display.height);
    r["display"].asObject()["clearColor"] = serialization::serializeVec4(settings.display.clearColor);
    r["display"]["frameLimit"] = settings.display.frameLimit;

    r["camera"]["fov"] = settings.camera.fov;
    r["camera"]["near"] = settings.camera.nearPlane;
    r["camera"]["far"] = settings.camera.farPlane;
    r["camera"]["radius"] = settings.camera.radius;
    r["camera"]["height"] = settings.camera.height;
    r["camera"]["frequency"] = settings.camera.frequency;

    r["grid"]["count"] = settings.grid.count;
    r["grid"]["spacing"] = settings.grid.spacing;

    r["shape"]["kind"] = toString(settings.shape.kind);
    r["shape"]["radius"] = settings.shape.dimensions.radius;
    r["shape"]["height"] = settings.shape.dimensions.height;
    r["shape"]["sectors"] = static_cast<double>(settings.shape.dimensions.sectors);
    r["shape"].asObject()["albedo"] = serialization::serializeVec4(settings.shape.albedo);
    r["shape"]["roughness"] = settings.shape.roughness;
    r["shape"]["metallic"] = settings.shape.metallic;

    r["light"].asObject()["color"] = serialization::serializeVec3(settings.light.color);
    r["light"].asObject()["mirroredColor"] = serialization::serializeVec3(settings.light.mirroredColor);
    r["light"]["intensity"] = settings.light.intensity;
    r["light"]["range"] = settings.light.range;
    r["light"]["radius"] = settings.light.radius;
    r["light"]["height"] = settings.light.height;
    r["light"]["frequency"] = settings.light.frequency;

    r["mirroredLight"] = settings.mirroredLight;

    r["log"]["level"] = toString(settings.log.level);
    r["log"]["file"] = settings.log.file;

    return root;
}

ConesSettings loadSettings(const std::filesystem::path& path)
{
    if (!core::fs::exists(path)) {
        SKETCHBOOK_LOG_WARN("Config " + path.string() + " not found, using defaults");
        return ConesSettings{};
    }

    std::error_code ec;
    const auto text = core::fs::readText(path, &ec);
    if (!text) {
        throw std::runtime_error("Failed to read config " + path.string() + ": " + ec.message());
    }

    try {
        const auto root = JsonValue::parse(*text);
        return settingsFromJson(*root);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path.string() + ": " + e.what());
    }
}

} // namespace sketchbook::cones
