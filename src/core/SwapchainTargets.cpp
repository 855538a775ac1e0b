#include "sketchbook/core/SwapchainTargets.hpp"

#include "sketchbook/engine/Logger.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace sketchbook::core {

VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& available)
{
    if (available.empty()) {
        throw std::invalid_argument("Surface reports no formats");
    }
    for (VkFormat preferred : {VK_FORMAT_B8G8R8A8_SRGB, VK_FORMAT_R8G8B8A8_SRGB}) {
        const auto match = std::find_if(available.begin(), available.end(), [preferred](const VkSurfaceFormatKHR& candidate) {
            return candidate.format == preferred && candidate.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        });
        if (match != available.end()) {
            return *match;
        }
    }
    return available.front();
}

VkPresentModeKHR choosePresentMode(const std::vector<VkPresentModeKHR>& available) noexcept
{
    const bool mailbox = std::find(available.begin(), available.end(), VK_PRESENT_MODE_MAILBOX_KHR) != available.end();
    return mailbox ? VK_PRESENT_MODE_MAILBOX_KHR : VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D framebuffer) noexcept
{
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }
    return VkExtent2D{
        std::clamp(framebuffer.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(framebuffer.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height)};
}

uint32_t chooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities) noexcept
{
    const uint32_t wanted = capabilities.minImageCount + 1;
    return capabilities.maxImageCount > 0 ? std::min(wanted, capabilities.maxImageCount) : wanted;
}

bool isBgraFormat(VkFormat format) noexcept
{
    return format == VK_FORMAT_B8G8R8A8_SRGB || format == VK_FORMAT_B8G8R8A8_UNORM;
}

VkFence ImageFenceTable::claim(uint32_t imageIndex, VkFence frameFence)
{
    VkFence& slot = fences.at(imageIndex);
    const VkFence previous = slot;
    slot = frameFence;
    return previous == frameFence ? VK_NULL_HANDLE : previous;
}

void SwapchainTargets::create(const GpuContext& gpu, VkExtent2D framebufferExtent)
{
    createSwapchain(gpu, framebufferExtent);
    createRenderPass(gpu);

    views.reserve(images.size());
    for (VkImage swapchainImage : images) {
        views.push_back(gpu.createImageView(swapchainImage, format, VK_IMAGE_ASPECT_COLOR_BIT));
    }
    depth = gpu.createAttachment(size, gpu.depthFormat(), VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT, VK_IMAGE_ASPECT_DEPTH_BIT);

    createFramebuffers(gpu);

    SKETCHBOOK_LOG_DEBUG("Swapchain " + std::to_string(size.width) + "x" + std::to_string(size.height) + " with "
                         + std::to_string(images.size()) + " images");
}

void SwapchainTargets::destroy(const GpuContext& gpu)
{
    const VkDevice device = gpu.device();
    if (device == VK_NULL_HANDLE) {
        return;
    }

    for (VkFramebuffer target : framebuffers) {
        vkDestroyFramebuffer(device, target, nullptr);
    }
    framebuffers.clear();

    gpu.destroyImage(depth);

    for (VkImageView view : views) {
        vkDestroyImageView(device, view, nullptr);
    }
    views.clear();

    if (pass != VK_NULL_HANDLE) {
        vkDestroyRenderPass(device, pass, nullptr);
        pass = VK_NULL_HANDLE;
    }
    if (swapchain != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device, swapchain, nullptr);
        swapchain = VK_NULL_HANDLE;
    }
    images.clear();
    size = {};
    format = VK_FORMAT_UNDEFINED;
}

void SwapchainTargets::createSwapchain(const GpuContext& gpu, VkExtent2D framebufferExtent)
{
    const SurfaceSupport support = gpu.surfaceSupport();
    const VkSurfaceFormatKHR surfaceFormat = chooseSurfaceFormat(support.formats);
    const QueueFamilyIndices& families = gpu.queueFamilies();
    const std::array<uint32_t, 2> familyIndices = {families.graphicsFamily.value(), families.presentFamily.value()};

    minImages = chooseImageCount(support.capabilities);
    format = surfaceFormat.format;
    size = chooseExtent(support.capabilities, framebufferExtent);

    VkSwapchainCreateInfoKHR swapchainInfo{};
    swapchainInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    swapchainInfo.surface = gpu.surface();
    swapchainInfo.minImageCount = minImages;
    swapchainInfo.imageFormat = surfaceFormat.format;
    swapchainInfo.imageColorSpace = surfaceFormat.colorSpace;
    swapchainInfo.imageExtent = size;
    swapchainInfo.imageArrayLayers = 1;
    // Captures copy straight out of the presented image.
    swapchainInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    if (families.shared()) {
        swapchainInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    } else {
        swapchainInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        swapchainInfo.queueFamilyIndexCount = static_cast<uint32_t>(familyIndices.size());
        swapchainInfo.pQueueFamilyIndices = familyIndices.data();
    }
    swapchainInfo.preTransform = support.capabilities.currentTransform;
    swapchainInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    swapchainInfo.presentMode = choosePresentMode(support.presentModes);
    swapchainInfo.clipped = VK_TRUE;

    vkCheck(vkCreateSwapchainKHR(gpu.device(), &swapchainInfo, nullptr, &swapchain), "vkCreateSwapchainKHR");

    uint32_t count = 0;
    vkCheck(vkGetSwapchainImagesKHR(gpu.device(), swapchain, &count, nullptr), "vkGetSwapchainImagesKHR");
    images.resize(count);
    vkCheck(vkGetSwapchainImagesKHR(gpu.device(), swapchain, &count, images.data()), "vkGetSwapchainImagesKHR");
}

void SwapchainTargets::createRenderPass(const GpuContext& gpu)
{
    std::array<VkAttachmentDescription, 2> attachments{};

    VkAttachmentDescription& color = attachments[0];
    color.format = format;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentDescription& depthAttachment = attachments[1];
    depthAttachment.format = gpu.depthFormat();
    depthAttachment.samples = VK_SAMPLE_COUNT_1_BIT;
    depthAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depthAttachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    depthAttachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depthAttachment.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    depthAttachment.finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

    const VkAttachmentReference colorRef{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    const VkAttachmentReference depthRef{1, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};

    VkSubpassDescription scenePass{};
    scenePass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    scenePass.colorAttachmentCount = 1;
    scenePass.pColorAttachments = &colorRef;
    scenePass.pDepthStencilAttachment = &depthRef;

    constexpr VkPipelineStageFlags attachmentStages =
        VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;

    VkSubpassDependency acquire{};
    acquire.srcSubpass = VK_SUBPASS_EXTERNAL;
    acquire.dstSubpass = 0;
    acquire.srcStageMask = attachmentStages;
    acquire.dstStageMask = attachmentStages;
    acquire.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo passInfo{};
    passInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    passInfo.attachmentCount = static_cast<uint32_t>(attachments.size());
    passInfo.pAttachments = attachments.data();
    passInfo.subpassCount = 1;
    passInfo.pSubpasses = &scenePass;
    passInfo.dependencyCount = 1;
    passInfo.pDependencies = &acquire;

    vkCheck(vkCreateRenderPass(gpu.device(), &passInfo, nullptr, &pass), "vkCreateRenderPass");
}

void SwapchainTargets::createFramebuffers(const GpuContext& gpu)
{
    framebuffers.reserve(views.size());
    for (VkImageView colorView : views) {
        const std::array<VkImageView, 2> attachments = {colorView, depth.view};

        VkFramebufferCreateInfo targetInfo{};
        targetInfo.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        targetInfo.renderPass = pass;
        targetInfo.attachmentCount = static_cast<uint32_t>(attachments.size());
        targetInfo.pAttachments = attachments.data();
        targetInfo.width = size.width;
        targetInfo.height = size.height;
        targetInfo.layers = 1;

        VkFramebuffer target = VK_NULL_HANDLE;
        vkCheck(vkCreateFramebuffer(gpu.device(), &targetInfo, nullptr, &target), "vkCreateFramebuffer");
        framebuffers.push_back(target);
    }
}

} // namespace sketchbook::core
