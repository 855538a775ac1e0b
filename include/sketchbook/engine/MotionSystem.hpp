#pragma once

#include "sketchbook/engine/Motion.hpp"

#include <glm/glm.hpp>

#include <optional>

namespace sketchbook {

class Scene;

struct CameraRig {
    OrbitPath path{};
    glm::vec3 target{0.0f};
};

// Moves animated entities to the pose their path gives for the elapsed time.
class MotionSystem {
public:
    void setCameraRig(const CameraRig& rig) noexcept { cameraRigState = rig; }
    void clearCameraRig() noexcept { cameraRigState.reset(); }
    [[nodiscard]] const std::optional<CameraRig>& cameraRig() const noexcept { return cameraRigState; }

    // Pure function of elapsedSeconds; calling it twice with the same time is a no-op.
    void update(Scene& scene, float elapsedSeconds);

private:
    std::optional<CameraRig> cameraRigState;
};

} // namespace sketchbook
