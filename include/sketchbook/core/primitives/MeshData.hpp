#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace sketchbook {

struct MeshVertex {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    glm::vec2 uv{0.0f};
};

struct MeshData {
    std::vector<MeshVertex> vertices;
    std::vector<std::uint32_t> indices;
    glm::vec3 boundsMin{0.0f};
    glm::vec3 boundsMax{0.0f};

    [[nodiscard]] std::size_t triangleCount() const noexcept { return indices.size() / 3; }
};

} // namespace sketchbook
