#include "sketchbook/engine/MotionSystem.hpp"

#include "sketchbook/engine/GameEngine.hpp"

namespace sketchbook {

void MotionSystem::update(Scene& scene, float elapsedSeconds)
{
    auto& registry = scene.registry();

    // MotionComponent first so the common case (a static shape) is rejected on one lookup.
    registry.view<MotionComponent, Transform>([elapsedSeconds](core::ecs::Entity, MotionComponent& motion, Transform& transform) {
        transform.position = motion.path.evaluate(elapsedSeconds);
    });

    registry.view<MotionComponent, LightComponent>([elapsedSeconds](core::ecs::Entity, MotionComponent& motion, LightComponent& light) {
        light.position = motion.path.evaluate(elapsedSeconds);
    });

    if (cameraRigState) {
        auto& camera = scene.camera();
        camera.setPosition(cameraRigState->path.evaluate(elapsedSeconds));
        camera.lookAt(cameraRigState->target);
    }
}

} // namespace sketchbook
