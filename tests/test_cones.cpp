#include <gtest/gtest.h>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "sketchbook/cones/ConesSketch.hpp"
#include "sketchbook/engine/Logger.hpp"

namespace {

void expectVecNear(const glm::vec3& actual, const glm::vec3& expected, float tolerance = 1e-4f)
{
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

TEST(GridLayoutTests, DefaultGridIsCentered)
{
    const sketchbook::GridLayout grid{};
    EXPECT_EQ(grid.count, 201);
    EXPECT_EQ(grid.offset(), 100);
    EXPECT_EQ(grid.cellCount(), 201u * 201u);

    expectVecNear(grid.position(100, 100), glm::vec3{0.0f});
    expectVecNear(grid.position(0, 0), glm::vec3{-250.0f, 0.0f, -250.0f});
    expectVecNear(grid.position(200, 0), glm::vec3{250.0f, 0.0f, -250.0f});
}

TEST(GridLayoutTests, EveryCellIsUniqueAndMatchesFormula)
{
    const sketchbook::GridLayout grid{};
    const auto positions = grid.positions();
    ASSERT_EQ(positions.size(), grid.cellCount());

    std::set<std::tuple<float, float, float>> seen;
    std::size_t index = 0;
    for (int row = 0; row < grid.count; ++row) {
        for (int col = 0; col < grid.count; ++col, ++index) {
            const glm::vec3 expected{
                static_cast<float>(row - grid.offset()) * grid.spacing,
                0.0f,
                static_cast<float>(col - grid.offset()) * grid.spacing};
            ASSERT_EQ(positions[index], expected) << "row " << row << " col " << col;
            seen.emplace(expected.x, expected.y, expected.z);
        }
    }
    EXPECT_EQ(seen.size(), grid.cellCount());
}

TEST(GridLayoutTests, EvenCountUsesIntegerOffset)
{
    sketchbook::GridLayout grid{};
    grid.count = 4;
    grid.spacing = 1.0f;
    EXPECT_EQ(grid.offset(), 2);
    expectVecNear(grid.position(0, 3), glm::vec3{-2.0f, 0.0f, 1.0f});
}

TEST(GridLayoutTests, EmptyAndInvalidGrids)
{
    sketchbook::GridLayout grid{};
    grid.count = 0;
    EXPECT_EQ(grid.cellCount(), 0u);
    EXPECT_TRUE(grid.positions().empty());

    grid.count = -3;
    EXPECT_EQ(grid.cellCount(), 0u);

    grid.count = 3;
    grid.spacing = 0.0f;
    EXPECT_THROW(grid.validate(), std::invalid_argument);
    grid.spacing = -1.0f;
    EXPECT_THROW(grid.validate(), std::invalid_argument);
}

TEST(OscillatorTests, ValueRepeatsAfterOnePeriod)
{
    const sketchbook::Oscillator oscillator{100.0f, 10.0f, glm::half_pi<float>()};
    EXPECT_NEAR(oscillator.period(), glm::two_pi<float>() / 10.0f, 1e-6f);

    for (float t : {0.0f, 0.1f, 0.37f, 1.0f, 2.5f}) {
        EXPECT_NEAR(oscillator.value(t + oscillator.period()), oscillator.value(t), 1e-2f) << "t = " << t;
    }
}

TEST(OscillatorTests, ZeroFrequencyIsConstant)
{
    const sketchbook::Oscillator oscillator{2.0f, 0.0f, glm::half_pi<float>()};
    EXPECT_TRUE(std::isinf(oscillator.period()));
    EXPECT_NEAR(oscillator.value(0.0f), 2.0f, 1e-6f);
    EXPECT_NEAR(oscillator.value(123.0f), 2.0f, 1e-6f);
}

TEST(OscillatorTests, CircleStartsOnPositiveX)
{
    const auto path = sketchbook::OrbitPath::circle(glm::vec3{0.0f, 3.0f, 0.0f}, 100.0f, 10.0f);
    expectVecNear(path.evaluate(0.0f), glm::vec3{100.0f, 3.0f, 0.0f});

    const float quarter = glm::half_pi<float>() / 10.0f;
    expectVecNear(path.evaluate(quarter), glm::vec3{0.0f, 3.0f, -100.0f}, 1e-3f);
    EXPECT_NEAR(glm::length(path.evaluate(0.7f) - path.center), 100.0f, 1e-3f);
}

TEST(ConesPathTests, InitialPosesMatchTheSketch)
{
    const sketchbook::cones::ConesSettings settings{};

    expectVecNear(sketchbook::cones::lightPath(settings.light).evaluate(0.0f), glm::vec3{100.0f, 3.0f, 0.0f});
    expectVecNear(sketchbook::cones::mirroredLightPath(settings.light).evaluate(0.0f), glm::vec3{0.0f, 3.0f, 100.0f});

    const auto rig = sketchbook::cones::cameraRig(settings.camera);
    expectVecNear(rig.path.evaluate(0.0f), glm::vec3{0.0f, 5.0f, 8.0f});
    expectVecNear(rig.target, glm::vec3{0.0f});
}

TEST(ConesPathTests, PathsFollowTheirFormulas)
{
    const sketchbook::cones::ConesSettings settings{};
    const auto light = sketchbook::cones::lightPath(settings.light);
    const auto mirrored = sketchbook::cones::mirroredLightPath(settings.light);
    const auto camera = sketchbook::cones::cameraRig(settings.camera).path;

    for (float t : {0.05f, 0.3f, 1.7f}) {
        expectVecNear(light.evaluate(t), glm::vec3{100.0f * std::cos(10.0f * t), 3.0f, -100.0f * std::sin(10.0f * t)}, 1e-2f);
        expectVecNear(mirrored.evaluate(t), glm::vec3{-100.0f * std::sin(10.0f * t), 3.0f, 100.0f * std::cos(10.0f * t)}, 1e-2f);
        expectVecNear(camera.evaluate(t), glm::vec3{-8.0f * std::sin(t), 5.0f, 8.0f * std::cos(t)}, 1e-4f);
    }
}

TEST(ConesSketchTests, PopulateGridCreatesNamedShapes)
{
    sketchbook::Scene scene;
    sketchbook::GridLayout grid{};
    grid.count = 3;
    grid.spacing = 2.0f;
    sketchbook::cones::ShapeSettings shape{};

    EXPECT_EQ(sketchbook::cones::populateGrid(scene, grid, shape), 9u);
    ASSERT_EQ(scene.objectCount(), 9u);

    const auto& first = scene.objects().front();
    EXPECT_EQ(first.name(), "Shape_0_0");
    EXPECT_EQ(first.mesh(), sketchbook::MeshKind::Cone);
    expectVecNear(first.transform().position, glm::vec3{-2.0f, 0.0f, -2.0f});
    EXPECT_EQ(first.render().baseColor, glm::vec4(1.0f, 1.0f, 1.0f, 0.5f));
    EXPECT_FLOAT_EQ(first.render().opacity, 0.5f);
    EXPECT_FLOAT_EQ(first.render().roughness, 0.0f);
    EXPECT_FLOAT_EQ(first.render().metallic, 0.0f);

    EXPECT_EQ(scene.objects()[5].name(), "Shape_1_2");
}

TEST(ConesSketchTests, PopulateGridRejectsBadSpacing)
{
    sketchbook::Scene scene;
    sketchbook::GridLayout grid{};
    grid.spacing = 0.0f;
    EXPECT_THROW(sketchbook::cones::populateGrid(scene, grid, {}), std::invalid_argument);
    EXPECT_EQ(scene.objectCount(), 0u);
}

TEST(ConesSketchTests, BuildsFullSceneInOrder)
{
    std::vector<std::string> messages;
    auto& logger = sketchbook::Logger::instance();
    logger.setMinLevel(sketchbook::LogLevel::Info);
    logger.addCallback("cones-test", [&messages](const sketchbook::LogEntry& entry) {
        messages.push_back(entry.message);
    });

    sketchbook::GameEngine engine;
    sketchbook::cones::ConesSketch sketch{sketchbook::cones::ConesSettings{}};
    const auto stats = sketch.build(engine);
    logger.removeCallback("cones-test");

    EXPECT_EQ(stats.shapes, 201u * 201u);
    EXPECT_EQ(stats.lights, 1u);
    EXPECT_EQ(stats.meshKind, sketchbook::MeshKind::Cone);
    EXPECT_EQ(sketch.stats().shapes, stats.shapes);

    const auto& scene = engine.scene();
    EXPECT_EQ(scene.objectCount(), 201u * 201u);
    EXPECT_EQ(scene.registry().count<sketchbook::RenderComponent>(), 201u * 201u);
    ASSERT_EQ(scene.lightCount(), 1u);

    const auto& light = scene.lights().front();
    EXPECT_EQ(light.name(), "RedLight");
    EXPECT_FLOAT_EQ(light.intensity(), 10.0f);
    EXPECT_EQ(light.color(), glm::vec3(1.0f, 0.0f, 0.0f));
    expectVecNear(light.position(), glm::vec3{100.0f, 3.0f, 0.0f});
    expectVecNear(scene.camera().getPosition(), glm::vec3{0.0f, 5.0f, 8.0f});
    EXPECT_NEAR(scene.camera().getFarClip(), 500.0f, 1e-4f);

    const std::vector<std::string> expectedOrder{"Load mesh", "Create shapes", "Create lights", "Put camera"};
    std::vector<std::string> steps;
    for (const auto& message : messages) {
        for (const auto& step : expectedOrder) {
            if (message == step) {
                steps.push_back(message);
            }
        }
    }
    EXPECT_EQ(steps, expectedOrder);
}

TEST(ConesSketchTests, MirroredLightAddsGreenLight)
{
    sketchbook::cones::ConesSettings settings{};
    settings.grid.count = 2;
    settings.mirroredLight = true;

    sketchbook::GameEngine engine;
    sketchbook::cones::ConesSketch sketch{settings};
    const auto stats = sketch.build(engine);

    EXPECT_EQ(stats.shapes, 4u);
    ASSERT_EQ(stats.lights, 2u);
    const auto& green = engine.scene().lights()[1];
    EXPECT_EQ(green.name(), "GreenLight");
    EXPECT_EQ(green.color(), glm::vec3(0.0f, 1.0f, 0.0f));
    expectVecNear(green.position(), glm::vec3{0.0f, 3.0f, 100.0f});
}

TEST(ConesSketchTests, AnimationMovesLightAndCamera)
{
    sketchbook::cones::ConesSettings settings{};
    settings.grid.count = 1;

    sketchbook::GameEngine engine;
    sketchbook::cones::ConesSketch sketch{settings};
    sketch.build(engine);

    const float t = 0.5f;
    engine.update(t);
    expectVecNear(engine.scene().lights().front().position(),
                  glm::vec3{100.0f * std::cos(10.0f * t), 3.0f, -100.0f * std::sin(10.0f * t)}, 1e-2f);
    expectVecNear(engine.scene().camera().getPosition(), glm::vec3{-8.0f * std::sin(t), 5.0f, 8.0f * std::cos(t)});

    const glm::vec3 toOrigin = glm::normalize(-engine.scene().camera().getPosition());
    expectVecNear(engine.scene().camera().forwardVector(), toOrigin);
}

TEST(ConesSketchTests, ZeroCountGridBuildsNoShapes)
{
    sketchbook::cones::ConesSettings settings{};
    settings.grid.count = 0;

    sketchbook::GameEngine engine;
    sketchbook::cones::ConesSketch sketch{settings};
    const auto stats = sketch.build(engine);

    EXPECT_EQ(stats.shapes, 0u);
    EXPECT_EQ(engine.scene().objectCount(), 0u);
    EXPECT_EQ(stats.lights, 1u);
}

} // namespace
