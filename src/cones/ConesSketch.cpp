#include "sketchbook/cones/ConesSketch.hpp"

#include "sketchbook/engine/Logger.hpp"

#include <glm/gtc/constants.hpp>

#include <string>

namespace sketchbook::cones {

OrbitPath lightPath(const LightSettings& light)
{
    // (r cos wt, h, -r sin wt)
    return OrbitPath::circle(glm::vec3{0.0f, light.height, 0.0f}, light.radius, light.frequency);
}

OrbitPath mirroredLightPath(const LightSettings& light)
{
    // (-r sin wt, h, r cos wt): the primary orbit with x and z swapped.
    OrbitPath path{};
    path.center = glm::vec3{0.0f, light.height, 0.0f};
    path.x = Oscillator{-light.radius, light.frequency, 0.0f};
    path.z = Oscillator{light.radius, light.frequency, glm::half_pi<float>()};
    return path;
}

CameraRig cameraRig(const CameraSettings& camera)
{
    // (-r sin wt, h, r cos wt), starting on +Z and facing the origin.
    CameraRig rig{};
    rig.path.center = glm::vec3{0.0f, camera.height, 0.0f};
    rig.path.x = Oscillator{-camera.radius, camera.frequency, 0.0f};
    rig.path.z = Oscillator{camera.radius, camera.frequency, glm::half_pi<float>()};
    rig.target = glm::vec3{0.0f};
    return rig;
}

std::size_t populateGrid(Scene& scene, const GridLayout& grid, const ShapeSettings& shape)
{
    grid.validate();

    std::size_t created = 0;
    for (int row = 0; row < grid.count; ++row) {
        for (int col = 0; col < grid.count; ++col) {
            auto& object = scene.createObject("Shape_" + std::to_string(row) + "_" + std::to_string(col), shape.kind);
            object.transform().position = grid.position(row, col);

            auto& render = object.render();
            render.baseColor = shape.albedo;
            render.roughness = shape.roughness;
            render.metallic = shape.metallic;
            render.opacity = shape.albedo.a;
            ++created;
        }
    }
    return created;
}

SketchStats ConesSketch::build(GameEngine& engine)
{
    auto& scene = engine.scene();

    SKETCHBOOK_LOG_INFO("Load mesh");
    lastStats = SketchStats{};
    lastStats.meshKind = settings.shape.kind;

    SKETCHBOOK_LOG_INFO("Create shapes");
    lastStats.shapes = populateGrid(scene, settings.grid, settings.shape);

    SKETCHBOOK_LOG_INFO("Create lights");
    LightCreateInfo red{};
    red.name = "RedLight";
    red.color = settings.light.color;
    red.intensity = settings.light.intensity;
    red.range = settings.light.range;
    auto& redLight = scene.createLight(red);
    redLight.setPath(lightPath(settings.light));

    if (settings.mirroredLight) {
        LightCreateInfo green = red;
        green.name = "GreenLight";
        green.color = settings.light.mirroredColor;
        auto& greenLight = scene.createLight(green);
        greenLight.setPath(mirroredLightPath(settings.light));
    }
    lastStats.lights = scene.lightCount();

    SKETCHBOOK_LOG_INFO("Put camera");
    scene.camera().setPerspective(settings.camera.fov, settings.camera.nearPlane, settings.camera.farPlane);
    engine.motion().setCameraRig(cameraRig(settings.camera));

    // Pose everything for the current clock so the first frame is not at the defaults.
    engine.update(0.0f);

    SKETCHBOOK_LOG_DEBUG("Built " + std::to_string(lastStats.shapes) + " " + toString(lastStats.meshKind)
                         + " shapes and " + std::to_string(lastStats.lights) + " light(s)");
    return lastStats;
}

} // namespace sketchbook::cones
