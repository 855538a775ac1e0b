#pragma once

#ifndef GLFW_INCLUDE_VULKAN
#define GLFW_INCLUDE_VULKAN
#endif
#include <GLFW/glfw3.h>

#include <cstdint>
#include <string>
#include <utility>

namespace sketchbook::core {

struct WindowConfig {
    uint32_t width{1280};
    uint32_t height{720};
    std::string title{"Sketchbook"};
    bool headless{false}; // hidden window, used for single-frame captures
    bool resizable{true};
};

// The sketch window and the GLFW library it needs. GLFW is initialized with the
// first window and terminated when it is destroyed.
class WindowManager {
public:
    WindowManager() = default;
    ~WindowManager() { destroy(); }

    WindowManager(const WindowManager&) = delete;
    WindowManager& operator=(const WindowManager&) = delete;

    void setConfig(WindowConfig cfg) noexcept { config = std::move(cfg); }
    [[nodiscard]] const WindowConfig& getConfig() const noexcept { return config; }

    // Returns the existing window if there is one.
    GLFWwindow* createWindow();
    void destroy() noexcept;

    [[nodiscard]] GLFWwindow* handle() const noexcept { return window; }
    [[nodiscard]] bool shouldClose() const noexcept;
    void requestClose() const noexcept;
    void pollEvents() const noexcept { glfwPollEvents(); }
    void waitEvents() const noexcept { glfwWaitEvents(); }

    // Size in pixels, zero while the window is minimized.
    [[nodiscard]] VkExtent2D framebufferExtent() const noexcept;

private:
    WindowConfig config{};
    GLFWwindow* window{nullptr};
    bool libraryLoaded{false};
};

} // namespace sketchbook::core
