#include "sketchbook/engine/GameEngine.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sketchbook {

core::ecs::Registry& SceneHandle::registry() const noexcept
{
    return ownerScene->registry();
}

void SceneHandle::setPath(const OrbitPath& path)
{
    registry().getOrEmplace<MotionComponent>(handle).path = path;
}

const OrbitPath* SceneHandle::path() const
{
    const auto* motion = registry().tryGet<MotionComponent>(handle);
    return motion != nullptr ? &motion->path : nullptr;
}

std::string Scene::nameOrDefault(const std::string& requested, const char* prefix)
{
    return requested.empty() ? prefix + std::to_string(unnamedCount++) : requested;
}

GameObject& Scene::createObject(const std::string& name, MeshKind meshKind)
{
    const core::ecs::Entity entity = ecsRegistry.createEntity();
    ecsRegistry.emplace<NameComponent>(entity, NameComponent{nameOrDefault(name, "Object_")});
    ecsRegistry.emplace<Transform>(entity);

    RenderComponent render{};
    render.mesh = meshKind;
    ecsRegistry.emplace<RenderComponent>(entity, render);

    return gameObjects.emplace_back(*this, entity);
}

Light& Scene::createLight(const std::string& name)
{
    LightCreateInfo info{};
    info.name = name;
    return createLight(info);
}

Light& Scene::createLight(const LightCreateInfo& info)
{
    const core::ecs::Entity entity = ecsRegistry.createEntity();

    LightComponent light{};
    light.name = nameOrDefault(info.name, "Light_");
    light.position = info.position;
    light.color = info.color;
    light.intensity = std::max(info.intensity, 0.0f);
    light.range = info.range;
    light.enabled = info.enabled;
    ecsRegistry.emplace<LightComponent>(entity, std::move(light));

    return sceneLights.emplace_back(*this, entity);
}

void Scene::clear()
{
    gameObjects.clear();
    sceneLights.clear();
    ecsRegistry.clear();
    sceneCamera = Camera{};
    unnamedCount = 0;
}

void GameEngine::update(float deltaSeconds)
{
    const float step = std::isfinite(deltaSeconds) ? std::max(deltaSeconds, 0.0f) : 0.0f;
    if (!pausedState) {
        elapsedSeconds += step;
    }
    motionSystem.update(activeScene, elapsedSeconds);
}

} // namespace sketchbook
