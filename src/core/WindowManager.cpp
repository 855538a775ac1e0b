#include "sketchbook/core/WindowManager.hpp"

#include "sketchbook/engine/Logger.hpp"

#include <stdexcept>
#include <string>

namespace sketchbook::core {

namespace {
void reportGlfwError(int code, const char* description)
{
    Logger::instance().error("GLFW error " + std::to_string(code) + ": " + (description != nullptr ? description : "?"), "glfw");
}
} // namespace

GLFWwindow* WindowManager::createWindow()
{
    if (window != nullptr) {
        return window;
    }

    if (!libraryLoaded) {
        glfwSetErrorCallback(reportGlfwError);
        if (glfwInit() != GLFW_TRUE) {
            throw std::runtime_error("Failed to initialize GLFW");
        }
        libraryLoaded = true;
    }
    if (glfwVulkanSupported() != GLFW_TRUE) {
        destroy();
        throw std::runtime_error("GLFW reports no Vulkan loader on this system");
    }

    // Vulkan renders into the surface, so GLFW must not create a GL context.
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_VISIBLE, config.headless ? GLFW_FALSE : GLFW_TRUE);
    glfwWindowHint(GLFW_RESIZABLE, config.resizable && !config.headless ? GLFW_TRUE : GLFW_FALSE);

    window = glfwCreateWindow(static_cast<int>(config.width), static_cast<int>(config.height), config.title.c_str(),
                              nullptr, nullptr);
    if (window == nullptr) {
        destroy();
        throw std::runtime_error("Failed to create a " + std::to_string(config.width) + "x"
                                 + std::to_string(config.height) + " window");
    }
    SKETCHBOOK_LOG_DEBUG("Window '" + config.title + "' created" + (config.headless ? " (hidden)" : ""));
    return window;
}

void WindowManager::destroy() noexcept
{
    if (window != nullptr) {
        glfwDestroyWindow(window);
        window = nullptr;
    }
    if (libraryLoaded) {
        glfwTerminate();
        libraryLoaded = false;
    }
}

bool WindowManager::shouldClose() const noexcept
{
    return window == nullptr || glfwWindowShouldClose(window) == GLFW_TRUE;
}

void WindowManager::requestClose() const noexcept
{
    if (window != nullptr) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

VkExtent2D WindowManager::framebufferExtent() const noexcept
{
    int width = 0;
    int height = 0;
    if (window != nullptr) {
        glfwGetFramebufferSize(window, &width, &height);
    }
    return VkExtent2D{static_cast<uint32_t>(width > 0 ? width : 0), static_cast<uint32_t>(height > 0 ? height : 0)};
}

} // namespace sketchbook::core
