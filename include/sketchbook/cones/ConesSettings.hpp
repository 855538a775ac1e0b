#pragma once

#include "sketchbook/core/ecs/Components.hpp"
#include "sketchbook/core/primitives/PrimitiveGenerator.hpp"
#include "sketchbook/engine/Logger.hpp"
#include "sketchbook/engine/Motion.hpp"
#include "sketchbook/engine/Serialization.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace sketchbook::cones {

struct DisplaySettings {
    std::string title{"Cones"};
    std::uint32_t width{1280};
    std::uint32_t height{720};
    glm::vec4 clearColor{0.34f, 0.36f, 0.52f, 1.0f};
    int frameLimit{60}; // frames per second, 0 = uncapped
};

// Camera circles the origin at the given height and always faces it.
struct CameraSettings {
    float fov{60.0f};
    float nearPlane{0.1f};
    float farPlane{500.0f};
    float radius{8.0f};
    float height{5.0f};
    float frequency{1.0f};
};

struct ShapeSettings {
    MeshKind kind{MeshKind::Cone};
    ShapeDimensions dimensions{};
    glm::vec4 albedo{1.0f, 1.0f, 1.0f, 0.5f};
    float roughness{0.0f};
    float metallic{0.0f};
};

struct LightSettings {
    glm::vec3 color{1.0f, 0.0f, 0.0f};
    glm::vec3 mirroredColor{0.0f, 1.0f, 0.0f};
    float intensity{10.0f};
    float range{250.0f};
    float radius{100.0f};
    float height{3.0f};
    float frequency{10.0f};
};

struct LogSettings {
    LogLevel level{LogLevel::Info};
    std::string file;
};

struct ConesSettings {
    DisplaySettings display{};
    CameraSettings camera{};
    GridLayout grid{};
    ShapeSettings shape{};
    LightSettings light{};
    bool mirroredLight{false};
    LogSettings log{};
};

// Every key is optional. Throws std::runtime_error naming the key on a wrong type or out-of-range value.
[[nodiscard]] ConesSettings settingsFromJson(const JsonValue& root);
[[nodiscard]] std::shared_ptr<JsonValue> settingsToJson(const ConesSettings& settings);

// A missing file yields defaults with a warning; unreadable or malformed files throw.
[[nodiscard]] ConesSettings loadSettings(const std::filesystem::path& path);

} // namespace sketchbook::cones
