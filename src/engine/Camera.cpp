#include "sketchbook/engine/Camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace sketchbook {

namespace {
const glm::vec3 kWorldUp{0.0f, 1.0f, 0.0f};
constexpr float kPitchLimitDegrees = 89.0f;

glm::vec3 directionFromAngles(float yaw, float pitch) noexcept
{
    const float limit = glm::radians(kPitchLimitDegrees);
    pitch = std::clamp(pitch, -limit, limit);
    const float horizontal = std::cos(pitch);
    return glm::vec3{horizontal * std::cos(yaw), std::sin(pitch), horizontal * std::sin(yaw)};
}
} // namespace

void Camera::lookAt(const glm::vec3& target) noexcept
{
    const glm::vec3 offset = target - position;
    const float distance = glm::length(offset);
    if (!(distance > 1e-6f)) {
        return;
    }
    const glm::vec3 direction = offset / distance;
    const float yaw = std::atan2(direction.z, direction.x);
    const float pitch = std::asin(std::clamp(direction.y, -1.0f, 1.0f));
    facing = directionFromAngles(yaw, pitch);
}

void Camera::setYawPitch(float yaw, float pitch) noexcept
{
    facing = directionFromAngles(yaw, pitch);
}

float Camera::getYaw() const noexcept
{
    return std::atan2(facing.z, facing.x);
}

float Camera::getPitch() const noexcept
{
    return std::asin(std::clamp(facing.y, -1.0f, 1.0f));
}

void Camera::setPerspective(float fovDegrees, float nearPlane, float farPlane) noexcept
{
    cameraLens.fieldOfView = glm::radians(fovDegrees);
    cameraLens.nearClip = nearPlane;
    cameraLens.farClip = farPlane;
}

glm::vec3 Camera::rightVector() const noexcept
{
    return glm::normalize(glm::cross(facing, kWorldUp));
}

glm::vec3 Camera::upVector() const noexcept
{
    return glm::cross(rightVector(), facing);
}

glm::mat4 Camera::viewMatrix() const
{
    return glm::lookAt(position, position + facing, kWorldUp);
}

glm::mat4 Camera::projectionMatrix(float aspectRatio) const
{
    glm::mat4 projection = glm::perspective(cameraLens.fieldOfView, aspectRatio, cameraLens.nearClip, cameraLens.farClip);
    projection[1][1] = -projection[1][1];
    return projection;
}

} // namespace sketchbook
