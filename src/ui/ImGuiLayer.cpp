#include "sketchbook/ui/ImGuiLayer.hpp"

#include "sketchbook/engine/Logger.hpp"

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_vulkan.h>

#include <stdexcept>
#include <string>

namespace sketchbook::ui {

namespace {
constexpr uint32_t kFontDescriptors = 16;

void reportBackendResult(VkResult result)
{
    if (result != VK_SUCCESS) {
        Logger::instance().error("ImGui Vulkan backend returned VkResult " + std::to_string(static_cast<int>(result)), "ui");
    }
}
} // namespace

void ImGuiLayer::initialize(GLFWwindow* window, const OverlayTarget& overlayTarget)
{
    if (initialized) {
        return;
    }
    target = overlayTarget;

    // The overlay samples nothing but the font atlas.
    const VkDescriptorPoolSize fontSamplers{VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, kFontDescriptors};
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    poolInfo.maxSets = kFontDescriptors;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &fontSamplers;
    if (vkCreateDescriptorPool(target.device, &poolInfo, nullptr, &fontPool) != VK_SUCCESS) {
        throw std::runtime_error("Overlay descriptor pool could not be created");
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr;

    // Chains to the key and resize callbacks the renderer installed first.
    if (!ImGui_ImplGlfw_InitForVulkan(window, true)) {
        ImGui::DestroyContext();
        vkDestroyDescriptorPool(target.device, fontPool, nullptr);
        fontPool = VK_NULL_HANDLE;
        throw std::runtime_error("ImGui GLFW backend failed to start");
    }

    initialized = true;
    startVulkanBackend();
    SKETCHBOOK_LOG_DEBUG("Overlay ready");
}

void ImGuiLayer::startVulkanBackend()
{
    ImGui_ImplVulkan_InitInfo backend{};
    backend.Instance = target.instance;
    backend.PhysicalDevice = target.physicalDevice;
    backend.Device = target.device;
    backend.QueueFamily = target.queueFamily;
    backend.Queue = target.queue;
    backend.DescriptorPool = fontPool;
    backend.RenderPass = target.renderPass;
    backend.MinImageCount = target.minImageCount;
    backend.ImageCount = target.imageCount;
    backend.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    backend.CheckVkResultFn = reportBackendResult;

    if (!ImGui_ImplVulkan_Init(&backend)) {
        throw std::runtime_error("ImGui Vulkan backend failed to start");
    }
    backendRunning = true;

    if (!ImGui_ImplVulkan_CreateFontsTexture()) {
        throw std::runtime_error("ImGui font atlas upload failed");
    }
}

void ImGuiLayer::stopVulkanBackend()
{
    if (backendRunning) {
        ImGui_ImplVulkan_Shutdown();
        backendRunning = false;
    }
}

void ImGuiLayer::shutdown()
{
    if (!initialized) {
        return;
    }

    stopVulkanBackend();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    if (fontPool != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(target.device, fontPool, nullptr);
        fontPool = VK_NULL_HANDLE;
    }

    frameOpen = false;
    initialized = false;
}

bool ImGuiLayer::newFrame()
{
    frameOpen = initialized && backendRunning && visible;
    if (frameOpen) {
        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
    }
    return frameOpen;
}

void ImGuiLayer::render(VkCommandBuffer commandBuffer)
{
    if (!frameOpen) {
        return;
    }
    frameOpen = false;
    ImGui::Render();
    ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), commandBuffer);
}

void ImGuiLayer::onSwapchainDestroyed()
{
    if (!initialized) {
        return;
    }
    stopVulkanBackend();
    target.renderPass = VK_NULL_HANDLE;
}

void ImGuiLayer::onSwapchainRecreated(VkRenderPass renderPass, uint32_t minImageCount, uint32_t imageCount)
{
    if (!initialized) {
        return;
    }
    target.renderPass = renderPass;
    target.minImageCount = minImageCount;
    target.imageCount = imageCount;
    startVulkanBackend();
}

} // namespace sketchbook::ui
