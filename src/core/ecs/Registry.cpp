#include "sketchbook/core/ecs/Registry.hpp"

#include <algorithm>

namespace sketchbook::core::ecs {

Entity Registry::createEntity()
{
    const Entity entity{nextId++};
    ordered.push_back(entity.id);
    alive.insert(entity.id);
    return entity;
}

void Registry::destroyEntity(Entity entity)
{
    if (!entity || alive.erase(entity.id) == 0) {
        return;
    }
    for (auto& entry : stores) {
        entry.second->erase(entity.id);
    }
    ordered.erase(std::find(ordered.begin(), ordered.end(), entity.id));
}

void Registry::clear()
{
    for (auto& entry : stores) {
        entry.second->reset();
    }
    ordered.clear();
    alive.clear();
    nextId = 1;
}

bool Registry::contains(Entity entity) const noexcept
{
    return entity && alive.count(entity.id) != 0;
}

} // namespace sketchbook::core::ecs
