#pragma once

#ifndef GLFW_INCLUDE_VULKAN
#define GLFW_INCLUDE_VULKAN
#endif
#include <GLFW/glfw3.h>

#include <cstdint>

namespace sketchbook::ui {

// Handles the overlay records into. The render pass and image counts change
// with every swapchain rebuild.
struct OverlayTarget {
    VkInstance instance{VK_NULL_HANDLE};
    VkPhysicalDevice physicalDevice{VK_NULL_HANDLE};
    VkDevice device{VK_NULL_HANDLE};
    uint32_t queueFamily{0};
    VkQueue queue{VK_NULL_HANDLE};
    VkRenderPass renderPass{VK_NULL_HANDLE};
    uint32_t minImageCount{2};
    uint32_t imageCount{2};
};

// Dear ImGui context plus its GLFW and Vulkan backends, drawn as the last
// commands of the scene render pass.
class ImGuiLayer {
public:
    ImGuiLayer() = default;
    ~ImGuiLayer() = default;

    ImGuiLayer(const ImGuiLayer&) = delete;
    ImGuiLayer& operator=(const ImGuiLayer&) = delete;

    void initialize(GLFWwindow* window, const OverlayTarget& overlayTarget);
    void shutdown();

    // False when nothing will be drawn this frame, in which case no widgets may be submitted.
    bool newFrame();
    void render(VkCommandBuffer commandBuffer);

    void onSwapchainDestroyed();
    void onSwapchainRecreated(VkRenderPass renderPass, uint32_t minImageCount, uint32_t imageCount);

    void toggleVisible() noexcept { visible = !visible; }
    [[nodiscard]] bool isVisible() const noexcept { return visible; }
    [[nodiscard]] bool isInitialized() const noexcept { return initialized; }

private:
    void startVulkanBackend();
    void stopVulkanBackend();

private:
    OverlayTarget target{};
    VkDescriptorPool fontPool{VK_NULL_HANDLE};
    bool visible{true};
    bool initialized{false};
    bool backendRunning{false};
    bool frameOpen{false};
};

} // namespace sketchbook::ui
