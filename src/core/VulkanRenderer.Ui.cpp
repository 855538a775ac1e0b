#include "sketchbook/core/VulkanRenderer.hpp"

#include "sketchbook/engine/Logger.hpp"

#include <algorithm>
#include <iostream>

#include <imgui.h>

namespace sketchbook::core {

void VulkanRenderer::initUi()
{
    if (!rendererConfig.overlayEnabled || rendererConfig.window.headless || uiLayer.isInitialized()) {
        return;
    }

    ui::OverlayTarget overlay{};
    overlay.instance = gpu.instance();
    overlay.physicalDevice = gpu.physicalDevice();
    overlay.device = gpu.device();
    overlay.queueFamily = gpu.queueFamilies().graphicsFamily.value();
    overlay.queue = gpu.graphicsQueue();
    overlay.renderPass = targets.renderPass();
    overlay.minImageCount = targets.minImageCount();
    overlay.imageCount = targets.imageCount();
    uiLayer.initialize(window, overlay);
}

void VulkanRenderer::buildUi(float deltaSeconds)
{
    if (!uiLayer.isInitialized() || engine == nullptr) {
        return;
    }

    ImGui::GetIO().DeltaTime = std::max(0.0001f, deltaSeconds);

    const float fps = (deltaSeconds > 0.0f) ? (1.0f / deltaSeconds) : 0.0f;
    smoothedFps = smoothedFps * 0.9f + fps * 0.1f;

    const auto& scene = engine->scene();
    const auto& cameraPosition = scene.camera().getPosition();

    ImGui::SetNextWindowPos(ImVec2(12.0f, 12.0f), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(300.0f, 0.0f), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Sketch")) {
        ImGui::Text("FPS: %.1f", smoothedFps);
        ImGui::Text("Time: %.2f s%s", engine->elapsed(), engine->paused() ? " (paused)" : "");
        ImGui::Text("Shapes: %zu  drawn: %zu", scene.objectCount(), drawCount);
        ImGui::Text("Camera: %.2f %.2f %.2f", cameraPosition.x, cameraPosition.y, cameraPosition.z);

        ImGui::Separator();
        for (const auto& light : scene.lights()) {
            const auto& position = light.position();
            ImGui::Text("%s: %.1f %.1f %.1f", light.name().c_str(), position.x, position.y, position.z);
        }

        ImGui::Separator();
        bool paused = engine->paused();
        if (ImGui::Checkbox("Pause motion", &paused)) {
            engine->setPaused(paused);
        }
        ImGui::ColorEdit3("Background", &rendererConfig.clearColor.x);
    }
    ImGui::End();
}

void VulkanRenderer::framebufferResizeCallback(GLFWwindow* window, int /*width*/, int /*height*/)
{
    auto* app = static_cast<VulkanRenderer*>(glfwGetWindowUserPointer(window));
    if (app != nullptr) {
        app->framebufferResized = true;
    }
}

void VulkanRenderer::setupInputCallbacks()
{
    glfwSetFramebufferSizeCallback(window, framebufferResizeCallback);
    glfwSetKeyCallback(window, keyCallback);
}

void VulkanRenderer::handleHotkeys(int key, int action)
{
    if (action != GLFW_PRESS) {
        return;
    }

    switch (key) {
    case GLFW_KEY_ESCAPE:
        requestExit();
        break;
    case GLFW_KEY_F1:
        uiLayer.toggleVisible();
        SKETCHBOOK_LOG_DEBUG(std::string("Overlay ") + (uiLayer.isVisible() ? "shown" : "hidden"));
        break;
    case GLFW_KEY_SPACE:
        engine->setPaused(!engine->paused());
        SKETCHBOOK_LOG_INFO(std::string("Motion ") + (engine->paused() ? "paused" : "resumed"));
        break;
    default:
        break;
    }
}

void VulkanRenderer::printHotkeyHelp() const
{
    std::cout << "Hotkeys - Esc: quit, F1: toggle overlay, Space: pause motion" << '\n';
}

void VulkanRenderer::keyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    auto* app = static_cast<VulkanRenderer*>(glfwGetWindowUserPointer(window));
    if (app == nullptr) {
        return;
    }

    // Keys typed into an overlay widget stay with the overlay.
    if (app->uiLayer.isInitialized() && ImGui::GetIO().WantCaptureKeyboard && key != GLFW_KEY_ESCAPE) {
        return;
    }

    app->handleHotkeys(key, action);
}

} // namespace sketchbook::core
