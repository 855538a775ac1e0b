#pragma once

#ifndef GLM_FORCE_RADIANS
#define GLM_FORCE_RADIANS
#endif
#ifndef GLM_FORCE_DEPTH_ZERO_TO_ONE
#define GLM_FORCE_DEPTH_ZERO_TO_ONE
#endif
#include <glm/glm.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "sketchbook/engine/Motion.hpp"

namespace sketchbook {

enum class MeshKind : int {
    Cone,
    Cylinder,
    Sphere,
};

[[nodiscard]] const char* toString(MeshKind kind) noexcept;
[[nodiscard]] std::optional<MeshKind> parseMeshKind(std::string_view text) noexcept;

struct Transform {
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};
    glm::vec3 scale{1.0f};

    [[nodiscard]] glm::mat4 matrix() const;
};

struct RenderComponent {
    MeshKind mesh{MeshKind::Cone};
    glm::vec4 baseColor{1.0f, 1.0f, 1.0f, 1.0f};
    float metallic{0.0f};
    float roughness{0.6f};
    float specular{0.5f};
    glm::vec3 emissive{0.0f};
    float emissiveIntensity{0.0f};
    float opacity{1.0f};
    bool visible{true};
};

struct NameComponent {
    std::string value;
};

struct LightComponent {
    std::string name;
    glm::vec3 position{0.0f, 3.0f, 0.0f};
    glm::vec3 color{1.0f};
    float intensity{1.0f};
    float range{18.0f};
    bool enabled{true};
};

// Entities carrying this are moved along the path by the motion system.
struct MotionComponent {
    OrbitPath path{};
};

} // namespace sketchbook
