#include "sketchbook/cones/CommandLine.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace sketchbook::cones {

namespace {
constexpr std::string_view kUsage = "usage: cones [--config <path>] [--headless] [--capture <file.jpg>]";
constexpr std::string_view kConfigPrefix = "--config=";
} // namespace

CommandLine parseCommandLine(int argc, char** argv)
{
    CommandLine options{};
    for (int i = 1; i < argc; ++i) {
        if (consumeHeadlessCaptureArg(options.capture, argc, argv, i)) {
            continue;
        }

        const std::string_view arg = argv[i];
        if (arg.rfind(kConfigPrefix, 0) == 0) {
            const auto value = arg.substr(kConfigPrefix.size());
            if (value.empty()) {
                throw std::invalid_argument("--config= requires a file path");
            }
            options.configPath = std::string(value);
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a file path");
            }
            options.configPath = argv[++i];
        } else {
            throw std::invalid_argument("Unknown argument: " + std::string(arg) + " (" + std::string(kUsage) + ")");
        }
    }

    if (options.configPath.empty()) {
        options.configPath = resolveRepoRoot() / "config" / "cones.json";
    }
    if (options.capture.enabled && options.capture.outputPath.empty()) {
        options.capture.outputPath = defaultCapturePath("cones");
    }
    return options;
}

} // namespace sketchbook::cones
