#pragma once

#ifndef GLM_FORCE_RADIANS
#define GLM_FORCE_RADIANS
#endif
#ifndef GLM_FORCE_DEPTH_ZERO_TO_ONE
#define GLM_FORCE_DEPTH_ZERO_TO_ONE
#endif
#include <glm/glm.hpp>

namespace sketchbook {

// Perspective camera with a fixed world up of +Y. Orientation is kept as a unit
// facing direction; yaw and pitch are derived from it.
class Camera {
public:
    struct Lens {
        float fieldOfView{glm::radians(60.0f)}; // vertical, radians
        float nearClip{0.1f};
        float farClip{100.0f};
    };

    void setPosition(const glm::vec3& newPosition) noexcept { position = newPosition; }
    [[nodiscard]] const glm::vec3& getPosition() const noexcept { return position; }

    // Turns toward target. A target at the camera position leaves the orientation unchanged.
    void lookAt(const glm::vec3& target) noexcept;
    // Yaw is measured from +X toward +Z; pitch is clamped to +-89 degrees.
    void setYawPitch(float yaw, float pitch) noexcept;
    [[nodiscard]] float getYaw() const noexcept;
    [[nodiscard]] float getPitch() const noexcept;

    void setPerspective(float fovDegrees, float nearPlane, float farPlane) noexcept;
    [[nodiscard]] const Lens& lens() const noexcept { return cameraLens; }
    [[nodiscard]] float getFieldOfView() const noexcept { return cameraLens.fieldOfView; }
    [[nodiscard]] float getNearClip() const noexcept { return cameraLens.nearClip; }
    [[nodiscard]] float getFarClip() const noexcept { return cameraLens.farClip; }

    [[nodiscard]] const glm::vec3& forwardVector() const noexcept { return facing; }
    [[nodiscard]] glm::vec3 rightVector() const noexcept;
    [[nodiscard]] glm::vec3 upVector() const noexcept;

    [[nodiscard]] glm::mat4 viewMatrix() const;
    // Vulkan clip space: Y down, depth 0..1.
    [[nodiscard]] glm::mat4 projectionMatrix(float aspectRatio) const;

private:
    glm::vec3 position{0.0f, 0.0f, 5.0f};
    glm::vec3 facing{0.0f, 0.0f, -1.0f};
    Lens cameraLens{};
};

} // namespace sketchbook
