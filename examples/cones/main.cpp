#include "sketchbook/cones/CommandLine.hpp"
#include "sketchbook/cones/ConesSettings.hpp"
#include "sketchbook/cones/ConesSketch.hpp"
#include "sketchbook/core/VulkanRenderer.hpp"
#include "sketchbook/engine/GameEngine.hpp"
#include "sketchbook/engine/Logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace {

void applyLogSettings(const sketchbook::cones::LogSettings& log)
{
    auto& logger = sketchbook::Logger::instance();
    logger.setMinLevel(log.level);
    if (!log.file.empty() && !logger.setLogFile(log.file)) {
        SKETCHBOOK_LOG_WARN("Could not open log file " + log.file);
    }
}

sketchbook::core::RendererConfig rendererConfigFrom(const sketchbook::cones::ConesSettings& settings, bool headless)
{
    sketchbook::core::RendererConfig config{};
    config.window.title = settings.display.title;
    config.window.width = settings.display.width;
    config.window.height = settings.display.height;
    config.window.headless = headless;
    config.window.resizable = !headless;
    config.clearColor = settings.display.clearColor;
    config.shapeDimensions = settings.shape.dimensions;
    config.frameLimit = settings.display.frameLimit;
    config.overlayEnabled = !headless;
    return config;
}

} // namespace

int main(int argc, char** argv)
try {
    const auto options = sketchbook::cones::parseCommandLine(argc, argv);

    const auto settings = sketchbook::cones::loadSettings(options.configPath);
    applyLogSettings(settings.log);

    sketchbook::GameEngine engine;
    sketchbook::cones::ConesSketch sketch(settings);
    sketch.build(engine);

    sketchbook::core::VulkanRenderer renderer(engine, rendererConfigFrom(settings, options.capture.enabled));
    if (options.capture.enabled) {
        return renderer.renderSingleFrameToJpeg(options.capture.outputPath) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    renderer.run();
    return EXIT_SUCCESS;
} catch (const std::exception& e) {
    sketchbook::Logger::instance().error(e.what(), "cones");
    std::cerr << "cones failed: " << e.what() << '\n';
    return EXIT_FAILURE;
}
