#include "sketchbook/core/GpuContext.hpp"

#include "sketchbook/engine/Logger.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace sketchbook::core {

namespace {
#ifdef NDEBUG
constexpr bool kWantValidation = false;
#else
constexpr bool kWantValidation = true;
#endif

constexpr std::array<const char*, 1> kValidationLayers = {"VK_LAYER_KHRONOS_validation"};
constexpr std::array<const char*, 1> kDeviceExtensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

// Runs the usual two-call Vulkan enumeration and returns the filled list.
template <typename T, typename Query>
std::vector<T> enumerate(const char* what, Query&& query)
{
    uint32_t count = 0;
    std::vector<T> items;
    if constexpr (std::is_same_v<decltype(query(&count, static_cast<T*>(nullptr))), VkResult>) {
        vkCheck(query(&count, static_cast<T*>(nullptr)), what);
        items.resize(count);
        if (count > 0) {
            const VkResult result = query(&count, items.data());
            if (result != VK_INCOMPLETE) {
                vkCheck(result, what);
            }
        }
    } else {
        query(&count, static_cast<T*>(nullptr));
        items.resize(count);
        if (count > 0) {
            query(&count, items.data());
        }
    }
    items.resize(count);
    return items;
}

VKAPI_ATTR VkBool32 VKAPI_CALL onValidationMessage(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                                   VkDebugUtilsMessageTypeFlagsEXT /*types*/,
                                                   const VkDebugUtilsMessengerCallbackDataEXT* data,
                                                   void* /*userData*/)
{
    const LogLevel level = severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT ? LogLevel::Error : LogLevel::Warning;
    Logger::instance().log(level, data->pMessage, "vulkan");
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT messengerCreateInfo()
{
    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT
                       | VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = onValidationMessage;
    return info;
}

bool validationLayersInstalled()
{
    const auto installed = enumerate<VkLayerProperties>("vkEnumerateInstanceLayerProperties",
        [](uint32_t* count, VkLayerProperties* out) { return vkEnumerateInstanceLayerProperties(count, out); });

    return std::all_of(kValidationLayers.begin(), kValidationLayers.end(), [&](const char* wanted) {
        return std::any_of(installed.begin(), installed.end(), [wanted](const VkLayerProperties& layer) {
            return std::strcmp(layer.layerName, wanted) == 0;
        });
    });
}

bool hasStencil(VkFormat format) noexcept
{
    return format == VK_FORMAT_D32_SFLOAT_S8_UINT || format == VK_FORMAT_D24_UNORM_S8_UINT;
}
} // namespace

void vkCheck(VkResult result, const char* what)
{
    if (result != VK_SUCCESS) {
        throw std::runtime_error(std::string(what) + " failed (VkResult " + std::to_string(static_cast<int>(result)) + ")");
    }
}

GpuContext::~GpuContext()
{
    destroy();
}

void GpuContext::create(GLFWwindow* window, const std::string& applicationName)
{
    if (window == nullptr) {
        throw std::invalid_argument("GpuContext needs a window to present to");
    }

    createInstance(applicationName);
    createDebugMessenger();
    vkCheck(glfwCreateWindowSurface(vkInstance, window, nullptr, &windowSurface), "glfwCreateWindowSurface");
    selectPhysicalDevice();
    createDevice();
    createCommandPool();
}

void GpuContext::destroy()
{
    if (logicalDevice != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(logicalDevice);
        if (pool != VK_NULL_HANDLE) {
            vkDestroyCommandPool(logicalDevice, pool, nullptr);
            pool = VK_NULL_HANDLE;
        }
        vkDestroyDevice(logicalDevice, nullptr);
        logicalDevice = VK_NULL_HANDLE;
    }

    if (vkInstance != VK_NULL_HANDLE) {
        if (debugMessenger != VK_NULL_HANDLE) {
            auto destroyMessenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
                vkGetInstanceProcAddr(vkInstance, "vkDestroyDebugUtilsMessengerEXT"));
            if (destroyMessenger != nullptr) {
                destroyMessenger(vkInstance, debugMessenger, nullptr);
            }
            debugMessenger = VK_NULL_HANDLE;
        }
        if (windowSurface != VK_NULL_HANDLE) {
            vkDestroySurfaceKHR(vkInstance, windowSurface, nullptr);
            windowSurface = VK_NULL_HANDLE;
        }
        vkDestroyInstance(vkInstance, nullptr);
        vkInstance = VK_NULL_HANDLE;
    }

    gpu = VK_NULL_HANDLE;
    graphics = VK_NULL_HANDLE;
    present = VK_NULL_HANDLE;
    families = {};
}

void GpuContext::createInstance(const std::string& applicationName)
{
    validation = kWantValidation && validationLayersInstalled();
    if (kWantValidation && !validation) {
        SKETCHBOOK_LOG_WARN("VK_LAYER_KHRONOS_validation is not installed, running without validation");
    }

    VkApplicationInfo application{};
    application.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    application.pApplicationName = applicationName.c_str();
    application.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    application.pEngineName = "Sketchbook";
    application.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    application.apiVersion = VK_API_VERSION_1_2;

    uint32_t surfaceExtensionCount = 0;
    const char** surfaceExtensions = glfwGetRequiredInstanceExtensions(&surfaceExtensionCount);
    if (surfaceExtensions == nullptr) {
        throw std::runtime_error("GLFW reports no Vulkan surface support on this system");
    }
    std::vector<const char*> extensions(surfaceExtensions, surfaceExtensions + surfaceExtensionCount);
    if (validation) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    // Chained so instance creation and destruction are validated too.
    const VkDebugUtilsMessengerCreateInfoEXT messenger = messengerCreateInfo();

    VkInstanceCreateInfo instanceInfo{};
    instanceInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    instanceInfo.pApplicationInfo = &application;
    instanceInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    instanceInfo.ppEnabledExtensionNames = extensions.data();
    if (validation) {
        instanceInfo.enabledLayerCount = static_cast<uint32_t>(kValidationLayers.size());
        instanceInfo.ppEnabledLayerNames = kValidationLayers.data();
        instanceInfo.pNext = &messenger;
    }

    vkCheck(vkCreateInstance(&instanceInfo, nullptr, &vkInstance), "vkCreateInstance");
}

void GpuContext::createDebugMessenger()
{
    if (!validation) {
        return;
    }

    auto createMessenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(vkInstance, "vkCreateDebugUtilsMessengerEXT"));
    if (createMessenger == nullptr) {
        throw std::runtime_error("Vulkan loader does not export vkCreateDebugUtilsMessengerEXT");
    }
    const VkDebugUtilsMessengerCreateInfoEXT info = messengerCreateInfo();
    vkCheck(createMessenger(vkInstance, &info, nullptr, &debugMessenger), "vkCreateDebugUtilsMessengerEXT");
}

void GpuContext::selectPhysicalDevice()
{
    const auto candidates = enumerate<VkPhysicalDevice>("vkEnumeratePhysicalDevices",
        [this](uint32_t* count, VkPhysicalDevice* out) { return vkEnumeratePhysicalDevices(vkInstance, count, out); });
    if (candidates.empty()) {
        throw std::runtime_error("No Vulkan capable GPU found");
    }

    // First usable discrete GPU wins, otherwise the first usable device of any kind.
    VkPhysicalDevice fallback = VK_NULL_HANDLE;
    for (VkPhysicalDevice candidate : candidates) {
        if (!queryQueueFamilies(candidate).isComplete() || !supportsDeviceExtensions(candidate)
            || !querySurfaceSupport(candidate).usable()) {
            continue;
        }
        VkPhysicalDeviceProperties properties{};
        vkGetPhysicalDeviceProperties(candidate, &properties);
        if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
            gpu = candidate;
            break;
        }
        if (fallback == VK_NULL_HANDLE) {
            fallback = candidate;
        }
    }
    if (gpu == VK_NULL_HANDLE) {
        gpu = fallback;
    }
    if (gpu == VK_NULL_HANDLE) {
        throw std::runtime_error("No GPU can present to this window");
    }

    families = queryQueueFamilies(gpu);
    vkGetPhysicalDeviceMemoryProperties(gpu, &memoryProperties);

    VkPhysicalDeviceProperties properties{};
    vkGetPhysicalDeviceProperties(gpu, &properties);
    SKETCHBOOK_LOG_INFO(std::string("Using GPU ") + properties.deviceName);
}

void GpuContext::createDevice()
{
    const std::set<uint32_t> familyIndices = {families.graphicsFamily.value(), families.presentFamily.value()};
    const float priority = 1.0f;

    std::vector<VkDeviceQueueCreateInfo> queues;
    for (uint32_t family : familyIndices) {
        VkDeviceQueueCreateInfo queue{};
        queue.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queue.queueFamilyIndex = family;
        queue.queueCount = 1;
        queue.pQueuePriorities = &priority;
        queues.push_back(queue);
    }

    const VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo deviceInfo{};
    deviceInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    deviceInfo.queueCreateInfoCount = static_cast<uint32_t>(queues.size());
    deviceInfo.pQueueCreateInfos = queues.data();
    deviceInfo.pEnabledFeatures = &features;
    deviceInfo.enabledExtensionCount = static_cast<uint32_t>(kDeviceExtensions.size());
    deviceInfo.ppEnabledExtensionNames = kDeviceExtensions.data();
    if (validation) {
        deviceInfo.enabledLayerCount = static_cast<uint32_t>(kValidationLayers.size());
        deviceInfo.ppEnabledLayerNames = kValidationLayers.data();
    }

    vkCheck(vkCreateDevice(gpu, &deviceInfo, nullptr, &logicalDevice), "vkCreateDevice");
    vkGetDeviceQueue(logicalDevice, families.graphicsFamily.value(), 0, &graphics);
    vkGetDeviceQueue(logicalDevice, families.presentFamily.value(), 0, &present);
}

void GpuContext::createCommandPool()
{
    VkCommandPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolInfo.queueFamilyIndex = families.graphicsFamily.value();
    vkCheck(vkCreateCommandPool(logicalDevice, &poolInfo, nullptr, &pool), "vkCreateCommandPool");
}

QueueFamilyIndices GpuContext::queryQueueFamilies(VkPhysicalDevice candidate) const
{
    const auto properties = enumerate<VkQueueFamilyProperties>("vkGetPhysicalDeviceQueueFamilyProperties",
        [candidate](uint32_t* count, VkQueueFamilyProperties* out) { vkGetPhysicalDeviceQueueFamilyProperties(candidate, count, out); });

    QueueFamilyIndices found;
    for (uint32_t family = 0; family < properties.size() && !found.isComplete(); ++family) {
        if ((properties[family].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0) {
            found.graphicsFamily = family;
        }
        VkBool32 canPresent = VK_FALSE;
        vkCheck(vkGetPhysicalDeviceSurfaceSupportKHR(candidate, family, windowSurface, &canPresent),
                "vkGetPhysicalDeviceSurfaceSupportKHR");
        if (canPresent == VK_TRUE) {
            found.presentFamily = family;
        }
    }
    return found;
}

SurfaceSupport GpuContext::querySurfaceSupport(VkPhysicalDevice candidate) const
{
    SurfaceSupport support;
    vkCheck(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(candidate, windowSurface, &support.capabilities),
            "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");
    support.formats = enumerate<VkSurfaceFormatKHR>("vkGetPhysicalDeviceSurfaceFormatsKHR",
        [&](uint32_t* count, VkSurfaceFormatKHR* out) { return vkGetPhysicalDeviceSurfaceFormatsKHR(candidate, windowSurface, count, out); });
    support.presentModes = enumerate<VkPresentModeKHR>("vkGetPhysicalDeviceSurfacePresentModesKHR",
        [&](uint32_t* count, VkPresentModeKHR* out) { return vkGetPhysicalDeviceSurfacePresentModesKHR(candidate, windowSurface, count, out); });
    return support;
}

bool GpuContext::supportsDeviceExtensions(VkPhysicalDevice candidate) const
{
    const auto available = enumerate<VkExtensionProperties>("vkEnumerateDeviceExtensionProperties",
        [candidate](uint32_t* count, VkExtensionProperties* out) { return vkEnumerateDeviceExtensionProperties(candidate, nullptr, count, out); });

    return std::all_of(kDeviceExtensions.begin(), kDeviceExtensions.end(), [&](const char* wanted) {
        return std::any_of(available.begin(), available.end(), [wanted](const VkExtensionProperties& extension) {
            return std::strcmp(extension.extensionName, wanted) == 0;
        });
    });
}

SurfaceSupport GpuContext::surfaceSupport() const
{
    return querySurfaceSupport(gpu);
}

VkFormat GpuContext::depthFormat() const
{
    for (VkFormat format : {VK_FORMAT_D32_SFLOAT, VK_FORMAT_D32_SFLOAT_S8_UINT, VK_FORMAT_D24_UNORM_S8_UINT}) {
        VkFormatProperties properties{};
        vkGetPhysicalDeviceFormatProperties(gpu, format, &properties);
        if ((properties.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) != 0) {
            return format;
        }
    }
    throw std::runtime_error("GPU offers no depth attachment format");
}

uint32_t GpuContext::memoryTypeIndex(uint32_t typeBits, VkMemoryPropertyFlags properties) const
{
    for (uint32_t index = 0; index < memoryProperties.memoryTypeCount; ++index) {
        const bool allowed = (typeBits & (1u << index)) != 0;
        if (allowed && (memoryProperties.memoryTypes[index].propertyFlags & properties) == properties) {
            return index;
        }
    }
    throw std::runtime_error("GPU has no memory type with the requested properties");
}

GpuBuffer GpuContext::createBuffer(VkDeviceSize size, VkBufferUsageFlags usage, VkMemoryPropertyFlags properties) const
{
    GpuBuffer created{};
    created.size = size;

    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    vkCheck(vkCreateBuffer(logicalDevice, &bufferInfo, nullptr, &created.buffer), "vkCreateBuffer");

    VkMemoryRequirements requirements{};
    vkGetBufferMemoryRequirements(logicalDevice, created.buffer, &requirements);

    VkMemoryAllocateInfo allocation{};
    allocation.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocation.allocationSize = requirements.size;
    allocation.memoryTypeIndex = memoryTypeIndex(requirements.memoryTypeBits, properties);

    VkResult result = vkAllocateMemory(logicalDevice, &allocation, nullptr, &created.memory);
    if (result == VK_SUCCESS) {
        result = vkBindBufferMemory(logicalDevice, created.buffer, created.memory, 0);
    }
    if (result != VK_SUCCESS) {
        destroyBuffer(created);
        vkCheck(result, "allocating buffer memory");
    }
    return created;
}

GpuBuffer GpuContext::createHostBuffer(VkDeviceSize size, VkBufferUsageFlags usage) const
{
    GpuBuffer created = createBuffer(size, usage, VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
    const VkResult mapped = vkMapMemory(logicalDevice, created.memory, 0, size, 0, &created.mapped);
    if (mapped != VK_SUCCESS) {
        destroyBuffer(created);
        vkCheck(mapped, "vkMapMemory");
    }
    return created;
}

GpuBuffer GpuContext::uploadBuffer(const void* data, VkDeviceSize size, VkBufferUsageFlags usage) const
{
    GpuBuffer staging = createHostBuffer(size, VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
    std::memcpy(staging.mapped, data, static_cast<size_t>(size));

    GpuBuffer target{};
    try {
        target = createBuffer(size, usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
        submitAndWait([&](VkCommandBuffer commands) {
            VkBufferCopy region{};
            region.size = size;
            vkCmdCopyBuffer(commands, staging.buffer, target.buffer, 1, &region);
        });
    } catch (const std::exception&) {
        destroyBuffer(target);
        destroyBuffer(staging);
        throw;
    }

    destroyBuffer(staging);
    return target;
}

void GpuContext::destroyBuffer(GpuBuffer& buffer) const
{
    if (logicalDevice != VK_NULL_HANDLE) {
        if (buffer.mapped != nullptr) {
            vkUnmapMemory(logicalDevice, buffer.memory);
        }
        if (buffer.buffer != VK_NULL_HANDLE) {
            vkDestroyBuffer(logicalDevice, buffer.buffer, nullptr);
        }
        if (buffer.memory != VK_NULL_HANDLE) {
            vkFreeMemory(logicalDevice, buffer.memory, nullptr);
        }
    }
    buffer = GpuBuffer{};
}

GpuImage GpuContext::createAttachment(VkExtent2D extent, VkFormat format, VkImageUsageFlags usage, VkImageAspectFlags aspect) const
{
    GpuImage created{};
    created.format = format;

    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.format = format;
    imageInfo.extent = {extent.width, extent.height, 1};
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.usage = usage;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    vkCheck(vkCreateImage(logicalDevice, &imageInfo, nullptr, &created.image), "vkCreateImage");

    VkMemoryRequirements requirements{};
    vkGetImageMemoryRequirements(logicalDevice, created.image, &requirements);

    VkMemoryAllocateInfo allocation{};
    allocation.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocation.allocationSize = requirements.size;
    allocation.memoryTypeIndex = memoryTypeIndex(requirements.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);

    VkResult result = vkAllocateMemory(logicalDevice, &allocation, nullptr, &created.memory);
    if (result == VK_SUCCESS) {
        result = vkBindImageMemory(logicalDevice, created.image, created.memory, 0);
    }
    if (result != VK_SUCCESS) {
        destroyImage(created);
        vkCheck(result, "allocating image memory");
    }

    try {
        created.view = createImageView(created.image, format, aspect);
    } catch (const std::exception&) {
        destroyImage(created);
        throw;
    }
    return created;
}

VkImageView GpuContext::createImageView(VkImage image, VkFormat format, VkImageAspectFlags aspect) const
{
    VkImageViewCreateInfo viewInfo{};
    viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewInfo.image = image;
    viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
    viewInfo.format = format;
    viewInfo.subresourceRange.aspectMask = aspect;
    if ((aspect & VK_IMAGE_ASPECT_DEPTH_BIT) != 0 && hasStencil(format)) {
        viewInfo.subresourceRange.aspectMask |= VK_IMAGE_ASPECT_STENCIL_BIT;
    }
    viewInfo.subresourceRange.levelCount = 1;
    viewInfo.subresourceRange.layerCount = 1;

    VkImageView view = VK_NULL_HANDLE;
    vkCheck(vkCreateImageView(logicalDevice, &viewInfo, nullptr, &view), "vkCreateImageView");
    return view;
}

void GpuContext::destroyImage(GpuImage& image) const
{
    if (logicalDevice != VK_NULL_HANDLE) {
        if (image.view != VK_NULL_HANDLE) {
            vkDestroyImageView(logicalDevice, image.view, nullptr);
        }
        if (image.image != VK_NULL_HANDLE) {
            vkDestroyImage(logicalDevice, image.image, nullptr);
        }
        if (image.memory != VK_NULL_HANDLE) {
            vkFreeMemory(logicalDevice, image.memory, nullptr);
        }
    }
    image = GpuImage{};
}

void GpuContext::submitAndWait(const std::function<void(VkCommandBuffer)>& record) const
{
    VkCommandBufferAllocateInfo allocation{};
    allocation.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocation.commandPool = pool;
    allocation.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocation.commandBufferCount = 1;

    VkCommandBuffer commands = VK_NULL_HANDLE;
    vkCheck(vkAllocateCommandBuffers(logicalDevice, &allocation, &commands), "vkAllocateCommandBuffers");

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    VkResult result = vkBeginCommandBuffer(commands, &begin);
    if (result == VK_SUCCESS) {
        record(commands);
        result = vkEndCommandBuffer(commands);
    }
    if (result == VK_SUCCESS) {
        VkSubmitInfo submit{};
        submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submit.commandBufferCount = 1;
        submit.pCommandBuffers = &commands;
        result = vkQueueSubmit(graphics, 1, &submit, VK_NULL_HANDLE);
    }
    if (result == VK_SUCCESS) {
        result = vkQueueWaitIdle(graphics);
    }

    vkFreeCommandBuffers(logicalDevice, pool, 1, &commands);
    vkCheck(result, "one-shot command submission");
}

void GpuContext::waitIdle() const
{
    if (logicalDevice != VK_NULL_HANDLE) {
        vkCheck(vkDeviceWaitIdle(logicalDevice), "vkDeviceWaitIdle");
    }
}

} // namespace sketchbook::core
