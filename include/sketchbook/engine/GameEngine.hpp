#pragma once

#include "sketchbook/core/ecs/Components.hpp"
#include "sketchbook/core/ecs/Registry.hpp"
#include "sketchbook/engine/Camera.hpp"
#include "sketchbook/engine/IGameEngine.hpp"
#include "sketchbook/engine/MotionSystem.hpp"

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace sketchbook {

class Scene;

// Non-owning reference to one entity of a scene. Components are looked up on
// every access, so handles stay valid while the registry storage moves.
class SceneHandle {
public:
    SceneHandle(Scene& owner, core::ecs::Entity entity) noexcept
        : ownerScene(&owner)
        , handle(entity)
    {
    }

    [[nodiscard]] core::ecs::Entity entity() const noexcept { return handle; }

    // Attaches an orbit; the motion system then owns the entity's position.
    void setPath(const OrbitPath& path);
    [[nodiscard]] const OrbitPath* path() const;

protected:
    template <typename Component>
    Component& component()
    {
        return registry().get<Component>(handle);
    }

    template <typename Component>
    const Component& component() const
    {
        return registry().get<Component>(handle);
    }

private:
    core::ecs::Registry& registry() const noexcept;

    Scene* ownerScene;
    core::ecs::Entity handle;
};

class Light : public SceneHandle {
public:
    using SceneHandle::SceneHandle;

    [[nodiscard]] const std::string& name() const { return component<LightComponent>().name; }
    [[nodiscard]] const glm::vec3& position() const { return component<LightComponent>().position; }
    [[nodiscard]] const glm::vec3& color() const { return component<LightComponent>().color; }
    [[nodiscard]] float intensity() const { return component<LightComponent>().intensity; }
    [[nodiscard]] float range() const { return component<LightComponent>().range; }
    [[nodiscard]] bool isEnabled() const { return component<LightComponent>().enabled; }
};

struct LightCreateInfo {
    std::string name;
    glm::vec3 position{0.0f, 3.0f, 0.0f};
    glm::vec3 color{1.0f};
    float intensity{2.0f}; // negative values are clamped to 0
    float range{18.0f};
    bool enabled{true};
};

class GameObject : public SceneHandle {
public:
    using SceneHandle::SceneHandle;

    [[nodiscard]] const std::string& name() const { return component<NameComponent>().value; }
    [[nodiscard]] MeshKind mesh() const { return component<RenderComponent>().mesh; }

    [[nodiscard]] Transform& transform() { return component<Transform>(); }
    [[nodiscard]] const Transform& transform() const { return component<Transform>(); }

    [[nodiscard]] RenderComponent& render() { return component<RenderComponent>(); }
    [[nodiscard]] const RenderComponent& render() const { return component<RenderComponent>(); }
};

// Shapes, lights and the camera of one sketch. Unnamed shapes and lights get
// "Object_<n>" and "Light_<n>" from a counter they share.
class Scene {
public:
    Scene() = default;
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    GameObject& createObject(const std::string& name, MeshKind meshKind);
    Light& createLight(const std::string& name);
    Light& createLight(const LightCreateInfo& info);
    void clear();

    [[nodiscard]] std::deque<GameObject>& objects() noexcept { return gameObjects; }
    [[nodiscard]] const std::deque<GameObject>& objects() const noexcept { return gameObjects; }
    [[nodiscard]] std::size_t objectCount() const noexcept { return gameObjects.size(); }

    [[nodiscard]] std::deque<Light>& lights() noexcept { return sceneLights; }
    [[nodiscard]] const std::deque<Light>& lights() const noexcept { return sceneLights; }
    [[nodiscard]] std::size_t lightCount() const noexcept { return sceneLights.size(); }

    [[nodiscard]] Camera& camera() noexcept { return sceneCamera; }
    [[nodiscard]] const Camera& camera() const noexcept { return sceneCamera; }

    [[nodiscard]] core::ecs::Registry& registry() noexcept { return ecsRegistry; }
    [[nodiscard]] const core::ecs::Registry& registry() const noexcept { return ecsRegistry; }

private:
    std::string nameOrDefault(const std::string& requested, const char* prefix);

    core::ecs::Registry ecsRegistry{};
    std::deque<GameObject> gameObjects;
    std::deque<Light> sceneLights;
    Camera sceneCamera{};
    std::uint64_t unnamedCount{0};
};

class GameEngine : public IGameEngine {
public:
    Scene& scene() noexcept override { return activeScene; }
    const Scene& scene() const noexcept override { return activeScene; }

    MotionSystem& motion() noexcept override { return motionSystem; }
    const MotionSystem& motion() const noexcept override { return motionSystem; }

    GameObject& createObject(const std::string& name, MeshKind meshKind) override { return activeScene.createObject(name, meshKind); }

    // Advances the clock (unless paused) and re-poses everything with a path.
    // Negative and non-finite deltas count as zero.
    void update(float deltaSeconds) override;
    [[nodiscard]] float elapsed() const noexcept override { return elapsedSeconds; }
    void resetClock() noexcept { elapsedSeconds = 0.0f; }

    void setPaused(bool value) noexcept override { pausedState = value; }
    [[nodiscard]] bool paused() const noexcept override { return pausedState; }

private:
    Scene activeScene{};
    MotionSystem motionSystem{};
    float elapsedSeconds{0.0f};
    bool pausedState{false};
};

} // namespace sketchbook
