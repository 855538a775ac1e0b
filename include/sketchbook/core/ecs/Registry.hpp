#pragma once

#include "sketchbook/core/ecs/Entity.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <stdexcept>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sketchbook::core::ecs {

// Entity and component storage for one scene. Each component type lives in a
// packed array indexed through a per-type id lookup; views walk entities in
// creation order, which is also the order shapes are drawn in.
//
// Not synchronized: a scene is built and updated on the thread that renders it.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    Entity createEntity();
    // Drops the entity and all its components. Unknown or already destroyed entities are ignored.
    void destroyEntity(Entity entity);
    void clear();

    [[nodiscard]] bool contains(Entity entity) const noexcept;
    [[nodiscard]] const std::vector<EntityId>& entities() const noexcept { return ordered; }
    [[nodiscard]] std::size_t size() const noexcept { return ordered.size(); }

    // Attaches a component, replacing one of the same type already present.
    template <typename Component, typename... Args>
    Component& emplace(Entity entity, Args&&... args)
    {
        if (!contains(entity)) {
            throw std::runtime_error("Cannot attach component to a dead entity");
        }
        return storage<Component>().put(entity.id, Component{std::forward<Args>(args)...});
    }

    template <typename Component>
    [[nodiscard]] bool has(Entity entity) const noexcept
    {
        return tryGet<Component>(entity) != nullptr;
    }

    template <typename Component>
    Component* tryGet(Entity entity) noexcept
    {
        auto* pool = existingStorage<Component>();
        return pool != nullptr ? pool->find(entity.id) : nullptr;
    }

    template <typename Component>
    const Component* tryGet(Entity entity) const noexcept
    {
        const auto* pool = existingStorage<Component>();
        return pool != nullptr ? pool->find(entity.id) : nullptr;
    }

    template <typename Component>
    Component& get(Entity entity)
    {
        if (auto* component = tryGet<Component>(entity)) {
            return *component;
        }
        throw std::runtime_error(std::string("Entity has no ") + typeid(Component).name() + " component");
    }

    template <typename Component>
    const Component& get(Entity entity) const
    {
        if (const auto* component = tryGet<Component>(entity)) {
            return *component;
        }
        throw std::runtime_error(std::string("Entity has no ") + typeid(Component).name() + " component");
    }

    template <typename Component, typename... Args>
    Component& getOrEmplace(Entity entity, Args&&... args)
    {
        if (auto* component = tryGet<Component>(entity)) {
            return *component;
        }
        return emplace<Component>(entity, std::forward<Args>(args)...);
    }

    template <typename Component>
    void remove(Entity entity)
    {
        if (auto* pool = existingStorage<Component>()) {
            pool->erase(entity.id);
        }
    }

    template <typename Component>
    [[nodiscard]] std::size_t count() const noexcept
    {
        const auto* pool = existingStorage<Component>();
        return pool != nullptr ? pool->values.size() : 0;
    }

    // Calls func(entity, components&...) for every entity carrying all of Components.
    template <typename... Components, typename Func>
    void view(Func&& func)
    {
        for (const EntityId id : ordered) {
            const Entity entity{id};
            if ((has<Components>(entity) && ...)) {
                func(entity, *tryGet<Components>(entity)...);
            }
        }
    }

    template <typename... Components, typename Func>
    void view(Func&& func) const
    {
        for (const EntityId id : ordered) {
            const Entity entity{id};
            if ((has<Components>(entity) && ...)) {
                func(entity, *tryGet<Components>(entity)...);
            }
        }
    }

private:
    struct StorageBase {
        virtual ~StorageBase() = default;
        virtual void erase(EntityId id) = 0;
        virtual void reset() = 0;
    };

    // Packed component values. Erasing moves the last value into the hole.
    template <typename Component>
    struct Storage final : StorageBase {
        std::vector<Component> values;
        std::vector<EntityId> owners;
        std::unordered_map<EntityId, std::size_t> slots;

        Component& put(EntityId id, Component&& value)
        {
            const auto slot = slots.find(id);
            if (slot != slots.end()) {
                values[slot->second] = std::move(value);
                return values[slot->second];
            }
            slots.emplace(id, values.size());
            owners.push_back(id);
            values.push_back(std::move(value));
            return values.back();
        }

        Component* find(EntityId id) noexcept
        {
            const auto slot = slots.find(id);
            return slot == slots.end() ? nullptr : &values[slot->second];
        }

        const Component* find(EntityId id) const noexcept
        {
            const auto slot = slots.find(id);
            return slot == slots.end() ? nullptr : &values[slot->second];
        }

        void erase(EntityId id) override
        {
            const auto slot = slots.find(id);
            if (slot == slots.end()) {
                return;
            }
            const std::size_t hole = slot->second;
            const std::size_t last = values.size() - 1;
            if (hole != last) {
                values[hole] = std::move(values[last]);
                owners[hole] = owners[last];
                slots[owners[hole]] = hole;
            }
            values.pop_back();
            owners.pop_back();
            slots.erase(id);
        }

        void reset() override
        {
            values.clear();
            owners.clear();
            slots.clear();
        }
    };

    template <typename Component>
    Storage<Component>& storage()
    {
        auto& slot = stores[std::type_index(typeid(Component))];
        if (!slot) {
            slot = std::make_unique<Storage<Component>>();
        }
        return static_cast<Storage<Component>&>(*slot);
    }

    template <typename Component>
    Storage<Component>* existingStorage() noexcept
    {
        const auto found = stores.find(std::type_index(typeid(Component)));
        return found == stores.end() ? nullptr : static_cast<Storage<Component>*>(found->second.get());
    }

    template <typename Component>
    const Storage<Component>* existingStorage() const noexcept
    {
        const auto found = stores.find(std::type_index(typeid(Component)));
        return found == stores.end() ? nullptr : static_cast<const Storage<Component>*>(found->second.get());
    }

private:
    EntityId nextId{1};
    std::vector<EntityId> ordered;
    std::unordered_set<EntityId> alive;
    std::unordered_map<std::type_index, std::unique_ptr<StorageBase>> stores;
};

} // namespace sketchbook::core::ecs
