#pragma once

#include "sketchbook/engine/HeadlessCapture.hpp"

#include <filesystem>

namespace sketchbook::cones {

struct CommandLine {
    std::filesystem::path configPath;
    HeadlessCaptureConfig capture{};
};

// cones [--config <path>] [--headless] [--capture <file.jpg> | --capture=<file.jpg>]
// Unset paths resolve against the checkout: config/cones.json and
// tests/test_results/cones.jpg. Throws std::invalid_argument on an unknown flag
// or a flag missing its value.
CommandLine parseCommandLine(int argc, char** argv);

} // namespace sketchbook::cones
