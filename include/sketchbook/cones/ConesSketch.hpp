#pragma once

#include "sketchbook/cones/ConesSettings.hpp"
#include "sketchbook/engine/GameEngine.hpp"
#include "sketchbook/engine/MotionSystem.hpp"

#include <cstddef>
#include <utility>

namespace sketchbook::cones {

struct SketchStats {
    std::size_t shapes{0};
    std::size_t lights{0};
    MeshKind meshKind{MeshKind::Cone};
};

// Orbits, expressed with +Y up and the grid in the XZ plane.
[[nodiscard]] OrbitPath lightPath(const LightSettings& light);
[[nodiscard]] OrbitPath mirroredLightPath(const LightSettings& light);
[[nodiscard]] CameraRig cameraRig(const CameraSettings& camera);

// Fills the grid with shapes. Returns the number of entities created.
std::size_t populateGrid(Scene& scene, const GridLayout& grid, const ShapeSettings& shape);

// Builds the whole Cones scene into an empty engine and poses it for t = 0.
class ConesSketch {
public:
    explicit ConesSketch(ConesSettings sketchSettings) : settings(std::move(sketchSettings)) {}

    SketchStats build(GameEngine& engine);

    [[nodiscard]] const ConesSettings& config() const noexcept { return settings; }
    [[nodiscard]] const SketchStats& stats() const noexcept { return lastStats; }

private:
    ConesSettings settings;
    SketchStats lastStats{};
};

} // namespace sketchbook::cones
