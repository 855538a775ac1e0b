#pragma once

#include "sketchbook/core/GpuContext.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sketchbook::core {

// Prefers 8-bit sRGB in BGRA then RGBA order. Throws std::invalid_argument on an empty list.
VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& available);

// Mailbox when offered. FIFO is always available.
VkPresentModeKHR choosePresentMode(const std::vector<VkPresentModeKHR>& available) noexcept;

// The surface's own extent, or the framebuffer size clamped to what the surface allows.
VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D framebuffer) noexcept;

// One image more than the minimum, capped by the maximum when the surface has one.
uint32_t chooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities) noexcept;

// True if pixels read back from this format arrive blue first.
bool isBgraFormat(VkFormat format) noexcept;

// Which frame fence last submitted work for each swapchain image. The per-image
// uniform buffer and command buffer may only be written once that fence has signalled.
class ImageFenceTable {
public:
    void reset(std::size_t imageCount) { fences.assign(imageCount, VK_NULL_HANDLE); }
    void clear() noexcept { fences.clear(); }

    // Hands imageIndex over to frameFence. Returns the fence to wait on before touching
    // the image's resources, or VK_NULL_HANDLE when the image is idle or was last
    // submitted by the same frame slot (whose fence the caller has already waited on).
    [[nodiscard]] VkFence claim(uint32_t imageIndex, VkFence frameFence);

    [[nodiscard]] VkFence owner(uint32_t imageIndex) const { return fences.at(imageIndex); }
    [[nodiscard]] std::size_t size() const noexcept { return fences.size(); }

private:
    std::vector<VkFence> fences;
};

// Everything that is sized by the window: the swapchain and its views, the depth
// buffer, the render pass drawing into them and one framebuffer per image.
class SwapchainTargets {
public:
    SwapchainTargets() = default;

    SwapchainTargets(const SwapchainTargets&) = delete;
    SwapchainTargets& operator=(const SwapchainTargets&) = delete;

    void create(const GpuContext& gpu, VkExtent2D framebufferExtent);
    void destroy(const GpuContext& gpu);

    [[nodiscard]] bool empty() const noexcept { return swapchain == VK_NULL_HANDLE; }
    [[nodiscard]] VkSwapchainKHR handle() const noexcept { return swapchain; }
    [[nodiscard]] VkRenderPass renderPass() const noexcept { return pass; }
    [[nodiscard]] VkFormat colorFormat() const noexcept { return format; }
    [[nodiscard]] VkExtent2D extent() const noexcept { return size; }
    [[nodiscard]] uint32_t minImageCount() const noexcept { return minImages; }
    [[nodiscard]] uint32_t imageCount() const noexcept { return static_cast<uint32_t>(images.size()); }
    [[nodiscard]] VkImage image(uint32_t index) const { return images.at(index); }
    [[nodiscard]] VkFramebuffer framebuffer(uint32_t index) const { return framebuffers.at(index); }

private:
    void createSwapchain(const GpuContext& gpu, VkExtent2D framebufferExtent);
    void createRenderPass(const GpuContext& gpu);
    void createFramebuffers(const GpuContext& gpu);

private:
    VkSwapchainKHR swapchain{VK_NULL_HANDLE};
    VkFormat format{VK_FORMAT_UNDEFINED};
    VkExtent2D size{};
    uint32_t minImages{0};
    std::vector<VkImage> images;
    std::vector<VkImageView> views;
    GpuImage depth{};
    VkRenderPass pass{VK_NULL_HANDLE};
    std::vector<VkFramebuffer> framebuffers;
};

} // namespace sketchbook::core
