#pragma once

#ifndef GLFW_INCLUDE_VULKAN
#define GLFW_INCLUDE_VULKAN
#endif
#include <GLFW/glfw3.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sketchbook::core {

// Throws std::runtime_error naming the call and the VkResult unless result is VK_SUCCESS.
void vkCheck(VkResult result, const char* what);

struct QueueFamilyIndices {
    std::optional<uint32_t> graphicsFamily;
    std::optional<uint32_t> presentFamily;

    [[nodiscard]] bool isComplete() const noexcept { return graphicsFamily.has_value() && presentFamily.has_value(); }
    [[nodiscard]] bool shared() const noexcept { return graphicsFamily == presentFamily; }
};

struct SurfaceSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;

    [[nodiscard]] bool usable() const noexcept { return !formats.empty() && !presentModes.empty(); }
};

// A buffer with a dedicated allocation. Host buffers stay mapped for their whole life.
struct GpuBuffer {
    VkBuffer buffer{VK_NULL_HANDLE};
    VkDeviceMemory memory{VK_NULL_HANDLE};
    VkDeviceSize size{0};
    void* mapped{nullptr};
};

struct GpuImage {
    VkImage image{VK_NULL_HANDLE};
    VkDeviceMemory memory{VK_NULL_HANDLE};
    VkImageView view{VK_NULL_HANDLE};
    VkFormat format{VK_FORMAT_UNDEFINED};
};

// Instance, device and queues bound to one window surface. Every other GPU
// object in the renderer is allocated and released through this class.
class GpuContext {
public:
    GpuContext() = default;
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    void create(GLFWwindow* window, const std::string& applicationName);
    void destroy();

    [[nodiscard]] bool ready() const noexcept { return logicalDevice != VK_NULL_HANDLE; }

    [[nodiscard]] VkInstance instance() const noexcept { return vkInstance; }
    [[nodiscard]] VkPhysicalDevice physicalDevice() const noexcept { return gpu; }
    [[nodiscard]] VkDevice device() const noexcept { return logicalDevice; }
    [[nodiscard]] VkSurfaceKHR surface() const noexcept { return windowSurface; }
    [[nodiscard]] VkQueue graphicsQueue() const noexcept { return graphics; }
    [[nodiscard]] VkQueue presentQueue() const noexcept { return present; }
    [[nodiscard]] VkCommandPool commandPool() const noexcept { return pool; }
    [[nodiscard]] const QueueFamilyIndices& queueFamilies() const noexcept { return families; }

    SurfaceSupport surfaceSupport() const;
    VkFormat depthFormat() const;

    GpuBuffer createBuffer(VkDeviceSize size, VkBufferUsageFlags usage, VkMemoryPropertyFlags properties) const;
    // Host-visible, coherent and persistently mapped.
    GpuBuffer createHostBuffer(VkDeviceSize size, VkBufferUsageFlags usage) const;
    // Device-local copy of data, filled through a temporary staging buffer.
    GpuBuffer uploadBuffer(const void* data, VkDeviceSize size, VkBufferUsageFlags usage) const;
    void destroyBuffer(GpuBuffer& buffer) const;

    GpuImage createAttachment(VkExtent2D extent, VkFormat format, VkImageUsageFlags usage, VkImageAspectFlags aspect) const;
    VkImageView createImageView(VkImage image, VkFormat format, VkImageAspectFlags aspect) const;
    void destroyImage(GpuImage& image) const;

    // Records one command buffer, submits it to the graphics queue and blocks until it retires.
    void submitAndWait(const std::function<void(VkCommandBuffer)>& record) const;
    void waitIdle() const;

private:
    void createInstance(const std::string& applicationName);
    void createDebugMessenger();
    void selectPhysicalDevice();
    void createDevice();
    void createCommandPool();

    QueueFamilyIndices queryQueueFamilies(VkPhysicalDevice candidate) const;
    SurfaceSupport querySurfaceSupport(VkPhysicalDevice candidate) const;
    bool supportsDeviceExtensions(VkPhysicalDevice candidate) const;
    uint32_t memoryTypeIndex(uint32_t typeBits, VkMemoryPropertyFlags properties) const;

private:
    VkInstance vkInstance{VK_NULL_HANDLE};
    VkDebugUtilsMessengerEXT debugMessenger{VK_NULL_HANDLE};
    VkSurfaceKHR windowSurface{VK_NULL_HANDLE};
    VkPhysicalDevice gpu{VK_NULL_HANDLE};
    VkDevice logicalDevice{VK_NULL_HANDLE};
    VkQueue graphics{VK_NULL_HANDLE};
    VkQueue present{VK_NULL_HANDLE};
    VkCommandPool pool{VK_NULL_HANDLE};
    QueueFamilyIndices families{};
    VkPhysicalDeviceMemoryProperties memoryProperties{};
    bool validation{false};
};

} // namespace sketchbook::core
