#include "sketchbook/core/ecs/Components.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <cctype>
#include <cstddef>
#include <iterator>

namespace sketchbook {

namespace {
constexpr const char* kMeshKindNames[] = {"cone", "cylinder", "sphere"};
constexpr MeshKind kMeshKinds[] = {MeshKind::Cone, MeshKind::Cylinder, MeshKind::Sphere};
} // namespace

const char* toString(MeshKind kind) noexcept
{
    const auto index = static_cast<std::size_t>(kind);
    return index < std::size(kMeshKindNames) ? kMeshKindNames[index] : "unknown";
}

std::optional<MeshKind> parseMeshKind(std::string_view text) noexcept
{
    for (std::size_t i = 0; i < std::size(kMeshKinds); ++i) {
        const std::string_view name = kMeshKindNames[i];
        if (name.size() != text.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t c = 0; c < name.size() && same; ++c) {
            same = std::tolower(static_cast<unsigned char>(text[c])) == name[c];
        }
        if (same) {
            return kMeshKinds[i];
        }
    }
    return std::nullopt;
}

// Scale, then rotate about X, Y and Z in that order, then translate.
glm::mat4 Transform::matrix() const
{
    glm::mat4 model = glm::translate(glm::mat4(1.0f), position);
    model = glm::rotate(model, rotation.z, glm::vec3{0.0f, 0.0f, 1.0f});
    model = glm::rotate(model, rotation.y, glm::vec3{0.0f, 1.0f, 0.0f});
    model = glm::rotate(model, rotation.x, glm::vec3{1.0f, 0.0f, 0.0f});
    return glm::scale(model, scale);
}

} // namespace sketchbook
