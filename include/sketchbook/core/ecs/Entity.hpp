#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace sketchbook::core::ecs {

using EntityId = std::uint32_t;

struct Entity {
    EntityId id{0};

    [[nodiscard]] constexpr bool valid() const noexcept { return id != 0; }
    explicit constexpr operator bool() const noexcept { return valid(); }

    friend constexpr bool operator==(Entity lhs, Entity rhs) noexcept { return lhs.id == rhs.id; }
    friend constexpr bool operator!=(Entity lhs, Entity rhs) noexcept { return !(lhs == rhs); }
    friend constexpr bool operator<(Entity lhs, Entity rhs) noexcept { return lhs.id < rhs.id; }
};

// Id 0 is reserved; registries hand out ids starting at 1.
constexpr Entity kInvalidEntity{0};

} // namespace sketchbook::core::ecs

template <>
struct std::hash<sketchbook::core::ecs::Entity> {
    std::size_t operator()(sketchbook::core::ecs::Entity entity) const noexcept
    {
        return std::hash<sketchbook::core::ecs::EntityId>{}(entity.id);
    }
};
