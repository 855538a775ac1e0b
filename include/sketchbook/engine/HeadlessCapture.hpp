#pragma once

#include "sketchbook/core/filesystem/FileSystem.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sketchbook {

struct HeadlessCaptureConfig {
    bool enabled{false};
    std::filesystem::path outputPath;
};

// Nearest ancestor of the working directory holding the top-level CMakeLists.txt,
// so build/ and build/tests/ both resolve to the checkout.
inline std::filesystem::path resolveRepoRoot()
{
    const std::filesystem::path cwd = std::filesystem::current_path();
    if (auto root = core::fs::findAncestorContaining(cwd, "CMakeLists.txt")) {
        return *root;
    }
    return cwd;
}

inline std::filesystem::path defaultCapturePath(const std::string& name)
{
    return resolveRepoRoot() / "tests" / "test_results" / (name + ".jpg");
}

// Consumes --headless, --capture <file> and --capture=<file> at argv[index].
// Returns false when the argument is not a capture flag.
inline bool consumeHeadlessCaptureArg(HeadlessCaptureConfig& config, int argc, char** argv, int& index)
{
    const std::string_view arg = argv[index];
    if (arg == "--headless") {
        config.enabled = true;
        return true;
    }
    constexpr std::string_view capturePrefix = "--capture=";
    if (arg.rfind(capturePrefix, 0) == 0) {
        const auto value = arg.substr(capturePrefix.size());
        if (value.empty()) {
            throw std::invalid_argument("--capture= requires a file path");
        }
        config.enabled = true;
        config.outputPath = std::filesystem::path(std::string(value));
        return true;
    }
    if (arg == "--capture") {
        if (index + 1 >= argc) {
            throw std::invalid_argument("--capture requires a file path");
        }
        config.enabled = true;
        config.outputPath = std::filesystem::path(argv[++index]);
        return true;
    }
    return false;
}

inline HeadlessCaptureConfig parseHeadlessCaptureArgs(int argc, char** argv, const std::string& defaultName)
{
    HeadlessCaptureConfig config{};
    for (int i = 1; i < argc; ++i) {
        consumeHeadlessCaptureArg(config, argc, argv, i);
    }
    if (config.enabled && config.outputPath.empty()) {
        config.outputPath = defaultCapturePath(defaultName);
    }
    return config;
}

} // namespace sketchbook
