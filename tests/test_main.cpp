#include <gtest/gtest.h>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "sketchbook/core/ecs/Registry.hpp"
#include "sketchbook/engine/GameEngine.hpp"

namespace {

using sketchbook::core::ecs::Entity;
using sketchbook::core::ecs::Registry;

struct Health {
    int value{0};
};

TEST(GameEngineTests, StartsWithEmptyScene)
{
    sketchbook::GameEngine engine;

    EXPECT_TRUE(engine.scene().objects().empty());
    EXPECT_TRUE(engine.scene().lights().empty());
    EXPECT_FLOAT_EQ(engine.elapsed(), 0.0f);
    EXPECT_FALSE(engine.paused());
}

TEST(GameEngineTests, UpdateAdvancesClockAndIgnoresNegativeDelta)
{
    sketchbook::GameEngine engine;
    engine.update(0.25f);
    engine.update(-1.0f);
    engine.update(std::numeric_limits<float>::quiet_NaN());
    EXPECT_FLOAT_EQ(engine.elapsed(), 0.25f);
}

TEST(GameEngineTests, PausedEngineKeepsTime)
{
    sketchbook::GameEngine engine;
    engine.update(0.5f);
    engine.setPaused(true);
    engine.update(1.0f);
    EXPECT_FLOAT_EQ(engine.elapsed(), 0.5f);

    engine.setPaused(false);
    engine.update(1.0f);
    EXPECT_FLOAT_EQ(engine.elapsed(), 1.5f);
}

TEST(SceneTests, CreateObjectAssignsDefaults)
{
    sketchbook::Scene scene;
    auto& object = scene.createObject("", sketchbook::MeshKind::Cone);

    ASSERT_EQ(scene.objects().size(), 1u);
    EXPECT_EQ(object.mesh(), sketchbook::MeshKind::Cone);
    EXPECT_EQ(object.name(), "Object_0");
    EXPECT_EQ(object.transform().position, glm::vec3(0.0f));
    EXPECT_EQ(object.transform().scale, glm::vec3(1.0f));
    EXPECT_TRUE(object.render().visible);
}

TEST(SceneTests, NamedObjectsKeepTheirNames)
{
    sketchbook::Scene scene;
    auto& first = scene.createObject("Shape_0_0", sketchbook::MeshKind::Sphere);
    auto& second = scene.createObject("", sketchbook::MeshKind::Cylinder);

    EXPECT_EQ(first.name(), "Shape_0_0");
    EXPECT_EQ(second.name(), "Object_0");
    EXPECT_EQ(scene.objectCount(), 2u);
    EXPECT_EQ(scene.registry().count<sketchbook::RenderComponent>(), 2u);
}

TEST(SceneTests, CreateLightCopiesInfoAndClampsIntensity)
{
    sketchbook::Scene scene;
    sketchbook::LightCreateInfo info{};
    info.name = "Key";
    info.position = glm::vec3{1.0f, 2.0f, 3.0f};
    info.color = glm::vec3{1.0f, 0.0f, 0.0f};
    info.intensity = -4.0f;
    info.range = 30.0f;
    auto& light = scene.createLight(info);

    EXPECT_EQ(light.name(), "Key");
    EXPECT_EQ(light.position(), info.position);
    EXPECT_EQ(light.color(), info.color);
    EXPECT_FLOAT_EQ(light.intensity(), 0.0f);
    EXPECT_FLOAT_EQ(light.range(), 30.0f);
    EXPECT_TRUE(light.isEnabled());
    EXPECT_EQ(light.path(), nullptr);
}

TEST(SceneTests, ClearRemovesEverything)
{
    sketchbook::Scene scene;
    scene.createObject("a", sketchbook::MeshKind::Cone);
    scene.createLight("l");
    scene.clear();

    EXPECT_EQ(scene.objectCount(), 0u);
    EXPECT_EQ(scene.lightCount(), 0u);
    EXPECT_EQ(scene.registry().size(), 0u);
}

TEST(CameraTests, LookAtFacesTarget)
{
    sketchbook::Camera camera;
    camera.setPosition(glm::vec3{0.0f, 5.0f, 8.0f});
    camera.lookAt(glm::vec3{0.0f});

    const glm::vec3 expected = glm::normalize(glm::vec3{0.0f, -5.0f, -8.0f});
    const glm::vec3 forward = camera.forwardVector();
    EXPECT_NEAR(forward.x, expected.x, 1e-5f);
    EXPECT_NEAR(forward.y, expected.y, 1e-5f);
    EXPECT_NEAR(forward.z, expected.z, 1e-5f);

    // The origin projects to the center of the view.
    const glm::vec4 viewSpace = camera.viewMatrix() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    EXPECT_NEAR(viewSpace.x, 0.0f, 1e-4f);
    EXPECT_NEAR(viewSpace.y, 0.0f, 1e-4f);
    EXPECT_LT(viewSpace.z, 0.0f);
}

TEST(CameraTests, LookAtClampsPitch)
{
    sketchbook::Camera camera;
    camera.setPosition(glm::vec3{0.0f, 10.0f, 0.0f});
    camera.lookAt(glm::vec3{0.0f, 0.0f, 0.0001f});

    EXPECT_GE(camera.getPitch(), glm::radians(-89.0f) - 1e-5f);
    EXPECT_TRUE(std::isfinite(camera.viewMatrix()[0][0]));
}

TEST(CameraTests, LookAtOwnPositionIsIgnored)
{
    sketchbook::Camera camera;
    camera.setYawPitch(0.5f, 0.25f);
    camera.lookAt(camera.getPosition());

    EXPECT_NEAR(camera.getYaw(), 0.5f, 1e-5f);
    EXPECT_NEAR(camera.getPitch(), 0.25f, 1e-5f);
}

TEST(CameraTests, PerspectiveStoresClipPlanes)
{
    sketchbook::Camera camera;
    camera.setPerspective(60.0f, 0.1f, 500.0f);

    EXPECT_NEAR(camera.getFieldOfView(), glm::radians(60.0f), 1e-6f);
    EXPECT_FLOAT_EQ(camera.getNearClip(), 0.1f);
    EXPECT_FLOAT_EQ(camera.getFarClip(), 500.0f);

    const glm::mat4 projection = camera.projectionMatrix(16.0f / 9.0f);
    EXPECT_LT(projection[1][1], 0.0f) << "Vulkan clip space has Y pointing down";
}

TEST(CameraTests, BasisIsOrthonormal)
{
    sketchbook::Camera camera;
    camera.setYawPitch(glm::radians(30.0f), glm::radians(-20.0f));

    EXPECT_NEAR(glm::dot(camera.forwardVector(), camera.rightVector()), 0.0f, 1e-5f);
    EXPECT_NEAR(glm::dot(camera.forwardVector(), camera.upVector()), 0.0f, 1e-5f);
    EXPECT_NEAR(glm::length(camera.upVector()), 1.0f, 1e-5f);
}

TEST(RegistryTests, EntitiesStartAtOneAndAreNotReused)
{
    Registry registry;
    const Entity a = registry.createEntity();
    const Entity b = registry.createEntity();
    EXPECT_TRUE(a.valid());
    EXPECT_EQ(a.id, 1u);
    EXPECT_NE(a, b);

    registry.destroyEntity(a);
    EXPECT_FALSE(registry.contains(a));
    EXPECT_TRUE(registry.contains(b));

    const Entity c = registry.createEntity();
    EXPECT_NE(c, a);
}

TEST(RegistryTests, ComponentsAttachAndDetach)
{
    Registry registry;
    const Entity entity = registry.createEntity();

    registry.emplace<Health>(entity, Health{5});
    ASSERT_TRUE(registry.has<Health>(entity));
    EXPECT_EQ(registry.get<Health>(entity).value, 5);

    registry.emplace<Health>(entity, Health{7});
    EXPECT_EQ(registry.get<Health>(entity).value, 7);
    EXPECT_EQ(registry.count<Health>(), 1u);

    registry.remove<Health>(entity);
    EXPECT_FALSE(registry.has<Health>(entity));
    EXPECT_EQ(registry.tryGet<Health>(entity), nullptr);
    EXPECT_THROW(registry.get<Health>(entity), std::runtime_error);
}

TEST(RegistryTests, EmplaceOnDeadEntityThrows)
{
    Registry registry;
    const Entity entity = registry.createEntity();
    registry.destroyEntity(entity);

    EXPECT_THROW(registry.emplace<Health>(entity, Health{1}), std::runtime_error);
}

TEST(RegistryTests, ViewVisitsMatchingEntitiesInCreationOrder)
{
    Registry registry;
    std::vector<Entity> created;
    for (int i = 0; i < 5; ++i) {
        const Entity entity = registry.createEntity();
        registry.emplace<Health>(entity, Health{i});
        if (i % 2 == 0) {
            registry.emplace<sketchbook::Transform>(entity);
        }
        created.push_back(entity);
    }

    std::vector<int> visited;
    registry.view<sketchbook::Transform, Health>([&](Entity, sketchbook::Transform&, Health& health) {
        visited.push_back(health.value);
    });
    EXPECT_EQ(visited, (std::vector<int>{0, 2, 4}));

    registry.destroyEntity(created[2]);
    visited.clear();
    registry.view<Health>([&](Entity, Health& health) { visited.push_back(health.value); });
    EXPECT_EQ(visited, (std::vector<int>{0, 1, 3, 4}));
}

TEST(MotionSystemTests, MovesObjectsAlongTheirPath)
{
    sketchbook::GameEngine engine;
    auto& object = engine.createObject("mover", sketchbook::MeshKind::Sphere);
    object.setPath(sketchbook::OrbitPath::circle(glm::vec3{0.0f, 1.0f, 0.0f}, 2.0f, 1.0f));

    engine.update(glm::half_pi<float>());
    const glm::vec3 position = object.transform().position;
    EXPECT_NEAR(position.x, 0.0f, 1e-5f);
    EXPECT_NEAR(position.y, 1.0f, 1e-5f);
    EXPECT_NEAR(position.z, -2.0f, 1e-5f);
}

TEST(MotionSystemTests, CameraRigPlacesAndAimsCamera)
{
    sketchbook::GameEngine engine;
    sketchbook::CameraRig rig{};
    rig.path.center = glm::vec3{0.0f, 5.0f, 0.0f};
    rig.path.z = sketchbook::Oscillator{8.0f, 1.0f, glm::half_pi<float>()};
    engine.motion().setCameraRig(rig);
    ASSERT_TRUE(engine.motion().cameraRig().has_value());

    engine.update(0.0f);
    const auto& camera = engine.scene().camera();
    EXPECT_NEAR(camera.getPosition().z, 8.0f, 1e-5f);
    EXPECT_LT(camera.forwardVector().z, 0.0f);

    engine.motion().clearCameraRig();
    engine.update(1.0f);
    EXPECT_NEAR(camera.getPosition().z, 8.0f, 1e-5f);
}

} // namespace
