#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace sketchbook::core {

constexpr std::uint32_t kMaxSceneLights = 4;

// Per-frame data shared by every draw (set 0, binding 0).
struct alignas(16) CameraBufferObject {
    glm::mat4 view;
    glm::mat4 proj;
    glm::vec4 cameraPosition;
    glm::vec4 lightPositions[kMaxSceneLights];   // xyz position, w range
    glm::vec4 lightColors[kMaxSceneLights];      // rgb color, w intensity
    glm::vec4 lightParams;                       // x light count
    glm::vec4 ambientColor;                      // rgb ambient, w exposure
};

// Per-draw data, 112 bytes so it fits the guaranteed 128-byte push constant budget.
struct alignas(16) ObjectPushConstants {
    glm::mat4 model;
    glm::vec4 baseColor;
    glm::vec4 materialParams; // metallic, roughness, specular, opacity
    glm::vec4 emissiveParams; // rgb emissive, w intensity
};

static_assert(sizeof(ObjectPushConstants) <= 128, "push constants exceed the minimum guaranteed size");

} // namespace sketchbook::core
