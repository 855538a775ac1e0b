#include "sketchbook/core/primitives/PrimitiveGenerator.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace sketchbook {
namespace {

constexpr std::uint32_t kMinSectors = 3;

// Accumulates vertices and triangles, tracking the bounding box as it goes.
// Triangles wind counter-clockwise when seen from outside the shape.
class MeshBuilder {
public:
    explicit MeshBuilder(std::uint32_t sectorCount)
        : sectors(std::max(sectorCount, kMinSectors))
        , step(glm::two_pi<float>() / static_cast<float>(sectors))
    {
    }

    [[nodiscard]] std::uint32_t sectorCount() const noexcept { return sectors; }
    [[nodiscard]] float angle(float sector) const noexcept { return sector * step; }
    [[nodiscard]] std::uint32_t next() const noexcept { return static_cast<std::uint32_t>(mesh.vertices.size()); }

    std::uint32_t vertex(const glm::vec3& position, const glm::vec3& normal, const glm::vec2& uv)
    {
        if (mesh.vertices.empty()) {
            mesh.boundsMin = position;
            mesh.boundsMax = position;
        } else {
            mesh.boundsMin = glm::min(mesh.boundsMin, position);
            mesh.boundsMax = glm::max(mesh.boundsMax, position);
        }
        mesh.vertices.push_back(MeshVertex{position, glm::normalize(normal), uv});
        return next() - 1;
    }

    void triangle(std::uint32_t a, std::uint32_t b, std::uint32_t c)
    {
        mesh.indices.insert(mesh.indices.end(), {a, b, c});
    }

    // Band between two rings of sectors + 1 vertices each, lower ring first.
    void band(std::uint32_t lower, std::uint32_t upper)
    {
        for (std::uint32_t j = 0; j < sectors; ++j) {
            triangle(lower + j, upper + j, upper + j + 1);
            triangle(lower + j, upper + j + 1, lower + j + 1);
        }
    }

    // Flat disc at height y. The ring repeats its first vertex so texture seams stay sharp.
    void disc(float radius, float y, bool facingUp)
    {
        const glm::vec3 normal{0.0f, facingUp ? 1.0f : -1.0f, 0.0f};
        const float flip = facingUp ? 0.5f : -0.5f;

        const std::uint32_t center = vertex({0.0f, y, 0.0f}, normal, {0.5f, 0.5f});
        for (std::uint32_t j = 0; j <= sectors; ++j) {
            const float c = std::cos(angle(static_cast<float>(j)));
            const float s = std::sin(angle(static_cast<float>(j)));
            vertex({radius * c, y, radius * s}, normal, {0.5f + 0.5f * c, 0.5f + flip * s});
        }
        for (std::uint32_t j = 1; j <= sectors; ++j) {
            if (facingUp) {
                triangle(center, center + j + 1, center + j);
            } else {
                triangle(center, center + j, center + j + 1);
            }
        }
    }

    MeshData finish() { return std::move(mesh); }

private:
    std::uint32_t sectors;
    float step;
    MeshData mesh{};
};

void requirePositive(float value, const char* what)
{
    if (!(value > 0.0f)) {
        throw std::invalid_argument(std::string("Shape ") + what + " must be positive");
    }
}

} // namespace

MeshData PrimitiveGenerator::createShape(MeshKind kind, const ShapeDimensions& dimensions)
{
    requirePositive(dimensions.radius, "radius");
    if (kind == MeshKind::Sphere) {
        return createSphere(dimensions.radius, dimensions.sectors, std::max(dimensions.sectors / 2, 2u));
    }

    requirePositive(dimensions.height, "height");
    if (kind == MeshKind::Cylinder) {
        return createCylinder(dimensions.radius, dimensions.height, dimensions.sectors);
    }
    if (kind == MeshKind::Cone) {
        return createCone(dimensions.radius, dimensions.height, dimensions.sectors);
    }
    throw std::invalid_argument("Unknown mesh kind " + std::to_string(static_cast<int>(kind)));
}

MeshData PrimitiveGenerator::createSphere(float radius, std::uint32_t sectors, std::uint32_t stacks)
{
    MeshBuilder builder(sectors);
    const std::uint32_t ringSize = builder.sectorCount() + 1;
    stacks = std::max(stacks, 2u);

    // Rings from the north pole down; each pole is a ring of coincident vertices.
    for (std::uint32_t i = 0; i <= stacks; ++i) {
        const float latitude = glm::half_pi<float>() - glm::pi<float>() * static_cast<float>(i) / static_cast<float>(stacks);
        for (std::uint32_t j = 0; j < ringSize; ++j) {
            const float longitude = builder.angle(static_cast<float>(j));
            const glm::vec3 direction{std::cos(latitude) * std::cos(longitude), std::sin(latitude),
                                      std::cos(latitude) * std::sin(longitude)};
            const glm::vec2 uv{static_cast<float>(j) / static_cast<float>(builder.sectorCount()),
                               static_cast<float>(i) / static_cast<float>(stacks)};
            builder.vertex(radius * direction, direction, uv);
        }
    }

    // The first and last bands would produce degenerate triangles at the poles; skip those halves.
    for (std::uint32_t i = 0; i < stacks; ++i) {
        const std::uint32_t top = i * ringSize;
        const std::uint32_t bottom = top + ringSize;
        for (std::uint32_t j = 0; j < builder.sectorCount(); ++j) {
            if (i > 0) {
                builder.triangle(top + j, top + j + 1, bottom + j);
            }
            if (i + 1 < stacks) {
                builder.triangle(top + j + 1, bottom + j + 1, bottom + j);
            }
        }
    }
    return builder.finish();
}

MeshData PrimitiveGenerator::createCylinder(float radius, float height, std::uint32_t sectors)
{
    MeshBuilder builder(sectors);
    const float halfHeight = 0.5f * height;

    const std::uint32_t lower = builder.next();
    for (const float v : {0.0f, 1.0f}) {
        const float y = v > 0.0f ? halfHeight : -halfHeight;
        for (std::uint32_t j = 0; j <= builder.sectorCount(); ++j) {
            const float theta = builder.angle(static_cast<float>(j));
            const glm::vec3 outward{std::cos(theta), 0.0f, std::sin(theta)};
            builder.vertex(glm::vec3{radius * outward.x, y, radius * outward.z}, outward,
                           {static_cast<float>(j) / static_cast<float>(builder.sectorCount()), v});
        }
    }
    builder.band(lower, lower + builder.sectorCount() + 1);

    builder.disc(radius, halfHeight, true);
    builder.disc(radius, -halfHeight, false);
    return builder.finish();
}

MeshData PrimitiveGenerator::createCone(float radius, float height, std::uint32_t sectors)
{
    MeshBuilder builder(sectors);
    const std::uint32_t count = builder.sectorCount();
    const float halfHeight = 0.5f * height;

    // Side normals tilt up by the cone's half-angle.
    const float tilt = std::atan2(radius, height);
    const auto slopeNormal = [tilt](float theta) {
        return glm::vec3{std::cos(tilt) * std::cos(theta), std::sin(tilt), std::cos(tilt) * std::sin(theta)};
    };

    const std::uint32_t tips = builder.next();
    for (std::uint32_t j = 0; j < count; ++j) {
        const float middle = static_cast<float>(j) + 0.5f;
        builder.vertex({0.0f, halfHeight, 0.0f}, slopeNormal(builder.angle(middle)),
                       {middle / static_cast<float>(count), 1.0f});
    }

    const std::uint32_t rim = builder.next();
    for (std::uint32_t j = 0; j <= count; ++j) {
        const float theta = builder.angle(static_cast<float>(j));
        builder.vertex({radius * std::cos(theta), -halfHeight, radius * std::sin(theta)}, slopeNormal(theta),
                       {static_cast<float>(j) / static_cast<float>(count), 0.0f});
    }

    for (std::uint32_t j = 0; j < count; ++j) {
        builder.triangle(tips + j, rim + j + 1, rim + j);
    }

    builder.disc(radius, -halfHeight, false);
    return builder.finish();
}

} // namespace sketchbook
