#pragma once

#include "sketchbook/core/ecs/Components.hpp"
#include "sketchbook/core/primitives/MeshData.hpp"

#include <cstdint>

namespace sketchbook {

/**
 * @brief Size parameters shared by the procedural shapes.
 *
 * Cones and cylinders use all three fields; spheres use radius and
 * sectors, with half as many stacks as sectors.
 */
struct ShapeDimensions {
    float radius{1.0f};
    float height{2.0f};
    std::uint32_t sectors{7};
};

/**
 * @brief Static class for generating procedural geometric primitives.
 *
 * All primitives are centered at the origin and aligned with +Y.
 */
class PrimitiveGenerator {
public:
    PrimitiveGenerator() = delete;

    /**
     * @brief Generate the mesh for a shape kind.
     * @param kind Which primitive to build.
     * @param dimensions Radius, height and radial resolution.
     * @return MeshData for the requested primitive.
     * @throws std::invalid_argument if radius or height is not positive.
     */
    [[nodiscard]] static MeshData createShape(MeshKind kind, const ShapeDimensions& dimensions);

    /**
     * @brief Generate a UV sphere centered at origin.
     * @param radius Sphere radius (default 0.5 for unit diameter).
     * @param sectors Number of longitudinal divisions (default 32).
     * @param stacks Number of latitudinal divisions (default 16).
     * @return MeshData containing vertices and indices for the sphere.
     */
    [[nodiscard]] static MeshData createSphere(float radius = 0.5f,
                                                std::uint32_t sectors = 32,
                                                std::uint32_t stacks = 16);

    /**
     * @brief Generate a capped cylinder aligned along the Y-axis, centered at origin.
     * @param radius Cylinder radius (default 0.5).
     * @param height Cylinder height (default 1.0).
     * @param sectors Number of radial divisions (default 32).
     * @return MeshData containing vertices and indices for the cylinder.
     */
    [[nodiscard]] static MeshData createCylinder(float radius = 0.5f,
                                                  float height = 1.0f,
                                                  std::uint32_t sectors = 32);

    /**
     * @brief Generate a cone aligned along the Y-axis, apex at +height/2, base at -height/2.
     *
     * Side normals are smooth around the base ring; each sector has its own apex
     * vertex so the tip does not average into a single vertical normal.
     *
     * @param radius Base radius (default 0.5).
     * @param height Cone height (default 1.0).
     * @param sectors Number of radial divisions, clamped to at least 3 (default 32).
     * @return MeshData with 3 * sectors + 3 vertices and 2 * sectors triangles.
     */
    [[nodiscard]] static MeshData createCone(float radius = 0.5f,
                                              float height = 1.0f,
                                              std::uint32_t sectors = 32);
};

} // namespace sketchbook
