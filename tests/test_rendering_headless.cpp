#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>

#include <stb_image.h>

#include "sketchbook/cones/ConesSketch.hpp"
#include "sketchbook/core/VulkanRenderer.hpp"
#include "sketchbook/engine/HeadlessCapture.hpp"

namespace {

bool gpuTestsEnabled()
{
    const char* enable = std::getenv("SKETCHBOOK_RUN_GPU_TESTS");
    return enable != nullptr && std::string(enable) == "1";
}

TEST(RendererTests, HeadlessCaptureWritesFirstFrame)
{
    if (!gpuTestsEnabled()) {
        GTEST_SKIP() << "Set SKETCHBOOK_RUN_GPU_TESTS=1 to render on a Vulkan device.";
    }

    sketchbook::cones::ConesSettings settings{};
    settings.grid.count = 5;
    settings.mirroredLight = true;

    sketchbook::GameEngine engine;
    sketchbook::cones::ConesSketch sketch{settings};
    sketch.build(engine);

    sketchbook::core::RendererConfig config{};
    config.window.width = 320;
    config.window.height = 240;
    config.window.title = "cones-test";
    config.window.headless = true;
    config.window.resizable = false;
    config.overlayEnabled = false;

    const auto outputPath = sketchbook::resolveRepoRoot() / "tests" / "test_results" / "renders" / "cones_first_frame.jpg";
    std::filesystem::remove(outputPath);

    sketchbook::core::VulkanRenderer renderer(engine, config);
    ASSERT_TRUE(renderer.renderSingleFrameToJpeg(outputPath));
    EXPECT_EQ(renderer.framesRendered(), 1u);
    EXPECT_EQ(renderer.lastDrawCount(), 25u);

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load(outputPath.string().c_str(), &width, &height, &channels, 3);
    ASSERT_NE(pixels, nullptr) << stbi_failure_reason();
    EXPECT_EQ(width, 320);
    EXPECT_EQ(height, 240);
    stbi_image_free(pixels);
}

} // namespace
