#include "sketchbook/core/VulkanRenderer.hpp"

#include "sketchbook/core/RenderData.hpp"
#include "sketchbook/core/Vertex.hpp"
#include "sketchbook/engine/Logger.hpp"
#include "sketchbook/engine/assets/ImageWriter.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#ifndef SHADER_BINARY_DIR
#define SHADER_BINARY_DIR ""
#endif

namespace sketchbook::core {

namespace {
constexpr float kMaxFrameDelta = 0.1f;
constexpr uint64_t kNoTimeout = std::numeric_limits<uint64_t>::max();
constexpr int kCaptureJpegQuality = 92;

// Mesh vertices go to the GPU as they are.
static_assert(sizeof(MeshVertex) == sizeof(Vertex), "MeshVertex and Vertex must share one layout");

VkImageMemoryBarrier colorImageBarrier(VkImage image, VkImageLayout from, VkImageLayout to,
                                       VkAccessFlags srcAccess, VkAccessFlags dstAccess)
{
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.oldLayout = from;
    barrier.newLayout = to;
    barrier.srcAccessMask = srcAccess;
    barrier.dstAccessMask = dstAccess;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
    return barrier;
}
} // namespace

VulkanRenderer::VulkanRenderer(IGameEngine& engineRef, RendererConfig config)
    : engine(&engineRef)
    , rendererConfig(std::move(config))
    , lastFrameTime(std::chrono::steady_clock::now())
{
    if (rendererConfig.shaderDirectory.empty()) {
        rendererConfig.shaderDirectory = SHADER_BINARY_DIR;
    }
}

VulkanRenderer::~VulkanRenderer()
{
    shutdown();
}

void VulkanRenderer::requestExit()
{
    exitRequested.store(true);
    windowManager.requestClose();
}

void VulkanRenderer::run()
{
    rendererConfig.window.headless = false;
    startup();
    mainLoop();
    shutdown();
}

bool VulkanRenderer::renderSingleFrameToJpeg(const std::filesystem::path& outputPath)
{
    rendererConfig.window.headless = true;
    startup();

    capture.path = outputPath;
    capture.pending = true;
    capture.written = false;

    // Zero delta, so the captured pose is the one the engine already holds.
    lastFrameTime = std::chrono::steady_clock::now();
    drawFrame();
    gpu.waitIdle();

    const bool written = capture.written;
    shutdown();

    if (written) {
        SKETCHBOOK_LOG_INFO("Captured frame to " + outputPath.string());
    } else {
        SKETCHBOOK_LOG_ERROR("Failed to capture frame to " + outputPath.string());
    }
    return written;
}

void VulkanRenderer::startup()
{
    exitRequested.store(false);

    windowManager.setConfig(rendererConfig.window);
    window = windowManager.createWindow();
    glfwSetWindowUserPointer(window, this);
    setupInputCallbacks();
    if (!rendererConfig.window.headless) {
        printHotkeyHelp();
    }

    gpu.create(window, rendererConfig.window.title);
    cameraLayout = createCameraSetLayout(gpu);
    createFrameSync();
    createSwapchainResources();
    initUi();
}

void VulkanRenderer::mainLoop()
{
    const int frameLimit = rendererConfig.frameLimit;
    const auto frameBudget = std::chrono::duration<float>(frameLimit > 0 ? 1.0f / static_cast<float>(frameLimit) : 0.0f);

    lastFrameTime = std::chrono::steady_clock::now();
    while (!exitRequested.load() && !windowManager.shouldClose()) {
        const auto frameStart = std::chrono::steady_clock::now();

        windowManager.pollEvents();
        drawFrame();

        if (frameLimit > 0) {
            const auto spent = std::chrono::duration<float>(std::chrono::steady_clock::now() - frameStart);
            if (spent < frameBudget) {
                std::this_thread::sleep_for(frameBudget - spent);
            }
        }
    }
    gpu.waitIdle();
}

// Safe to call repeatedly and on a partially started renderer.
void VulkanRenderer::shutdown()
{
    if (gpu.ready()) {
        if (vkDeviceWaitIdle(gpu.device()) != VK_SUCCESS) {
            SKETCHBOOK_LOG_WARN("Device did not go idle before shutdown");
        }

        uiLayer.shutdown();
        destroySwapchainResources();
        destroyMeshes();
        gpu.destroyBuffer(capture.readback);
        destroyFrameSync();

        if (cameraLayout != VK_NULL_HANDLE) {
            vkDestroyDescriptorSetLayout(gpu.device(), cameraLayout, nullptr);
            cameraLayout = VK_NULL_HANDLE;
        }
    }
    gpu.destroy();

    capture = CaptureState{};
    currentFrame = 0;

    windowManager.destroy();
    window = nullptr;
}

void VulkanRenderer::createSwapchainResources()
{
    targets.create(gpu, windowManager.framebufferExtent());

    ShapePipelineDesc pipelineDesc{};
    pipelineDesc.renderPass = targets.renderPass();
    pipelineDesc.cameraLayout = cameraLayout;
    pipelineDesc.shaderDirectory = rendererConfig.shaderDirectory;
    shapePipeline = createShapePipeline(gpu, pipelineDesc);

    createCameraBuffers();
    createDescriptorSets();
    createCommandBuffers();

    // Presentation may still hold the semaphore of an earlier frame, so there is one per image.
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    renderFinished.assign(targets.imageCount(), VK_NULL_HANDLE);
    for (VkSemaphore& semaphore : renderFinished) {
        vkCheck(vkCreateSemaphore(gpu.device(), &semaphoreInfo, nullptr, &semaphore), "vkCreateSemaphore");
    }
    imageFences.reset(targets.imageCount());
}

void VulkanRenderer::destroySwapchainResources()
{
    const VkDevice device = gpu.device();
    uiLayer.onSwapchainDestroyed();

    for (VkSemaphore semaphore : renderFinished) {
        if (semaphore != VK_NULL_HANDLE) {
            vkDestroySemaphore(device, semaphore, nullptr);
        }
    }
    renderFinished.clear();
    imageFences.clear();

    if (!commandBuffers.empty()) {
        vkFreeCommandBuffers(device, gpu.commandPool(), static_cast<uint32_t>(commandBuffers.size()), commandBuffers.data());
        commandBuffers.clear();
    }

    if (descriptorPool != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(device, descriptorPool, nullptr);
        descriptorPool = VK_NULL_HANDLE;
    }
    descriptorSets.clear();

    for (GpuBuffer& buffer : cameraBuffers) {
        gpu.destroyBuffer(buffer);
    }
    cameraBuffers.clear();

    destroyShapePipeline(gpu, shapePipeline);
    targets.destroy(gpu);
}

void VulkanRenderer::recreateSwapchain()
{
    // A minimized window has no area to present to.
    VkExtent2D size = windowManager.framebufferExtent();
    while ((size.width == 0 || size.height == 0) && !windowManager.shouldClose()) {
        windowManager.waitEvents();
        size = windowManager.framebufferExtent();
    }

    gpu.waitIdle();
    destroySwapchainResources();
    createSwapchainResources();
    uiLayer.onSwapchainRecreated(targets.renderPass(), targets.minImageCount(), targets.imageCount());
}

void VulkanRenderer::createCameraBuffers()
{
    cameraBuffers.reserve(targets.imageCount());
    for (uint32_t image = 0; image < targets.imageCount(); ++image) {
        cameraBuffers.push_back(gpu.createHostBuffer(sizeof(CameraBufferObject), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT));
    }
}

void VulkanRenderer::createDescriptorSets()
{
    const uint32_t setCount = targets.imageCount();

    const VkDescriptorPoolSize uniformSlots{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, setCount};
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = setCount;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &uniformSlots;
    vkCheck(vkCreateDescriptorPool(gpu.device(), &poolInfo, nullptr, &descriptorPool), "vkCreateDescriptorPool");

    const std::vector<VkDescriptorSetLayout> layouts(setCount, cameraLayout);
    VkDescriptorSetAllocateInfo allocation{};
    allocation.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocation.descriptorPool = descriptorPool;
    allocation.descriptorSetCount = setCount;
    allocation.pSetLayouts = layouts.data();

    descriptorSets.resize(setCount);
    vkCheck(vkAllocateDescriptorSets(gpu.device(), &allocation, descriptorSets.data()), "vkAllocateDescriptorSets");

    for (uint32_t image = 0; image < setCount; ++image) {
        const VkDescriptorBufferInfo cameraBuffer{cameraBuffers[image].buffer, 0, sizeof(CameraBufferObject)};

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = descriptorSets[image];
        write.dstBinding = 0;
        write.descriptorCount = 1;
        write.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        write.pBufferInfo = &cameraBuffer;
        vkUpdateDescriptorSets(gpu.device(), 1, &write, 0, nullptr);
    }
}

void VulkanRenderer::createCommandBuffers()
{
    commandBuffers.resize(targets.imageCount());

    VkCommandBufferAllocateInfo allocation{};
    allocation.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocation.commandPool = gpu.commandPool();
    allocation.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocation.commandBufferCount = static_cast<uint32_t>(commandBuffers.size());
    vkCheck(vkAllocateCommandBuffers(gpu.device(), &allocation, commandBuffers.data()), "vkAllocateCommandBuffers");
}

void VulkanRenderer::createFrameSync()
{
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    // Signalled, so the first wait on each slot returns at once.
    VkFenceCreateInfo fenceInfo{};
    fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (FrameSync& frame : frames) {
        vkCheck(vkCreateSemaphore(gpu.device(), &semaphoreInfo, nullptr, &frame.imageAvailable), "vkCreateSemaphore");
        vkCheck(vkCreateFence(gpu.device(), &fenceInfo, nullptr, &frame.inFlight), "vkCreateFence");
    }
}

void VulkanRenderer::destroyFrameSync()
{
    for (FrameSync& frame : frames) {
        if (frame.imageAvailable != VK_NULL_HANDLE) {
            vkDestroySemaphore(gpu.device(), frame.imageAvailable, nullptr);
        }
        if (frame.inFlight != VK_NULL_HANDLE) {
            vkDestroyFence(gpu.device(), frame.inFlight, nullptr);
        }
        frame = FrameSync{};
    }
}

const VulkanRenderer::MeshGpuBuffers& VulkanRenderer::meshFor(MeshKind kind)
{
    const auto cached = meshCache.find(kind);
    if (cached != meshCache.end()) {
        return cached->second;
    }

    const MeshData mesh = PrimitiveGenerator::createShape(kind, rendererConfig.shapeDimensions);
    MeshGpuBuffers& buffers = meshCache[kind];
    if (mesh.vertices.empty() || mesh.indices.empty()) {
        return buffers;
    }

    buffers.vertices = gpu.uploadBuffer(mesh.vertices.data(), sizeof(MeshVertex) * mesh.vertices.size(),
                                        VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    buffers.indices = gpu.uploadBuffer(mesh.indices.data(), sizeof(uint32_t) * mesh.indices.size(),
                                       VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
    buffers.indexCount = static_cast<uint32_t>(mesh.indices.size());

    SKETCHBOOK_LOG_DEBUG(std::string("Uploaded ") + toString(kind) + " mesh: " + std::to_string(mesh.vertices.size())
                         + " vertices, " + std::to_string(mesh.triangleCount()) + " triangles");
    return buffers;
}

void VulkanRenderer::destroyMeshes()
{
    for (auto& entry : meshCache) {
        gpu.destroyBuffer(entry.second.vertices);
        gpu.destroyBuffer(entry.second.indices);
    }
    meshCache.clear();
}

void VulkanRenderer::drawFrame()
{
    const auto now = std::chrono::steady_clock::now();
    const float deltaTime = std::clamp(std::chrono::duration<float>(now - lastFrameTime).count(), 0.0f, kMaxFrameDelta);
    lastFrameTime = now;
    engine->update(deltaTime);

    FrameSync& frame = frames[currentFrame];
    vkCheck(vkWaitForFences(gpu.device(), 1, &frame.inFlight, VK_TRUE, kNoTimeout), "vkWaitForFences");

    uint32_t imageIndex = 0;
    const VkResult acquired = vkAcquireNextImageKHR(gpu.device(), targets.handle(), kNoTimeout, frame.imageAvailable,
                                                    VK_NULL_HANDLE, &imageIndex);
    if (acquired == VK_ERROR_OUT_OF_DATE_KHR) {
        recreateSwapchain();
        return;
    }
    if (acquired != VK_SUBOPTIMAL_KHR) {
        vkCheck(acquired, "vkAcquireNextImageKHR");
    }

    // Another slot may still be drawing from this image's uniforms and command buffer.
    const VkFence previousOwner = imageFences.claim(imageIndex, frame.inFlight);
    if (previousOwner != VK_NULL_HANDLE) {
        vkCheck(vkWaitForFences(gpu.device(), 1, &previousOwner, VK_TRUE, kNoTimeout), "vkWaitForFences");
    }

    if (capture.pending) {
        const VkExtent2D extent = targets.extent();
        const VkDeviceSize bytes = static_cast<VkDeviceSize>(extent.width) * extent.height * 4;
        if (capture.readback.size != bytes) {
            gpu.destroyBuffer(capture.readback);
            capture.readback = gpu.createHostBuffer(bytes, VK_BUFFER_USAGE_TRANSFER_DST_BIT);
        }
        capture.extent = extent;
        capture.imageIndex = imageIndex;
    }

    writeCameraBuffer(imageIndex);
    if (uiLayer.newFrame()) {
        buildUi(deltaTime);
    }

    VkCommandBuffer commands = commandBuffers[imageIndex];
    vkCheck(vkResetFences(gpu.device(), 1, &frame.inFlight), "vkResetFences");
    vkCheck(vkResetCommandBuffer(commands, 0), "vkResetCommandBuffer");
    recordFrame(commands, imageIndex);

    const VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo submit{};
    submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount = 1;
    submit.pWaitSemaphores = &frame.imageAvailable;
    submit.pWaitDstStageMask = &waitStage;
    submit.commandBufferCount = 1;
    submit.pCommandBuffers = &commands;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores = &renderFinished[imageIndex];
    vkCheck(vkQueueSubmit(gpu.graphicsQueue(), 1, &submit, frame.inFlight), "vkQueueSubmit");

    const VkSwapchainKHR swapchain = targets.handle();
    VkPresentInfoKHR presentation{};
    presentation.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    presentation.waitSemaphoreCount = 1;
    presentation.pWaitSemaphores = &renderFinished[imageIndex];
    presentation.swapchainCount = 1;
    presentation.pSwapchains = &swapchain;
    presentation.pImageIndices = &imageIndex;
    const VkResult presented = vkQueuePresentKHR(gpu.presentQueue(), &presentation);

    if (capture.pending) {
        finishCapture();
    }
    ++frameCounter;

    if (presented == VK_ERROR_OUT_OF_DATE_KHR || presented == VK_SUBOPTIMAL_KHR || framebufferResized) {
        framebufferResized = false;
        recreateSwapchain();
    } else {
        vkCheck(presented, "vkQueuePresentKHR");
    }

    currentFrame = (currentFrame + 1) % kFramesInFlight;
}

void VulkanRenderer::recordFrame(VkCommandBuffer commands, uint32_t imageIndex)
{
    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    vkCheck(vkBeginCommandBuffer(commands, &begin), "vkBeginCommandBuffer");

    const glm::vec4& background = rendererConfig.clearColor;
    std::array<VkClearValue, 2> clears{};
    clears[0].color = {{background.r, background.g, background.b, background.a}};
    clears[1].depthStencil = {1.0f, 0};

    const VkExtent2D extent = targets.extent();
    VkRenderPassBeginInfo passBegin{};
    passBegin.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    passBegin.renderPass = targets.renderPass();
    passBegin.framebuffer = targets.framebuffer(imageIndex);
    passBegin.renderArea = {{0, 0}, extent};
    passBegin.clearValueCount = static_cast<uint32_t>(clears.size());
    passBegin.pClearValues = clears.data();
    vkCmdBeginRenderPass(commands, &passBegin, VK_SUBPASS_CONTENTS_INLINE);

    const VkViewport viewport{0.0f, 0.0f, static_cast<float>(extent.width), static_cast<float>(extent.height), 0.0f, 1.0f};
    const VkRect2D scissor{{0, 0}, extent};
    vkCmdSetViewport(commands, 0, 1, &viewport);
    vkCmdSetScissor(commands, 0, 1, &scissor);

    vkCmdBindPipeline(commands, VK_PIPELINE_BIND_POINT_GRAPHICS, shapePipeline.pipeline);
    vkCmdBindDescriptorSets(commands, VK_PIPELINE_BIND_POINT_GRAPHICS, shapePipeline.layout, 0, 1,
                            &descriptorSets[imageIndex], 0, nullptr);
    drawShapes(commands);

    uiLayer.render(commands);
    vkCmdEndRenderPass(commands);

    if (capture.pending && capture.imageIndex == imageIndex) {
        recordCapture(commands, imageIndex);
    }

    vkCheck(vkEndCommandBuffer(commands), "vkEndCommandBuffer");
}

void VulkanRenderer::drawShapes(VkCommandBuffer commands)
{
    // Creation order, one draw per visible shape. Consecutive shapes of one kind share the bound mesh.
    const MeshGpuBuffers* bound = nullptr;
    drawCount = 0;
    engine->scene().registry().view<RenderComponent, Transform>(
        [&](ecs::Entity, const RenderComponent& render, const Transform& transform) {
            if (!render.visible || render.opacity <= 0.0f) {
                return;
            }
            const MeshGpuBuffers& mesh = meshFor(render.mesh);
            if (mesh.indexCount == 0) {
                return;
            }
            if (&mesh != bound) {
                const VkDeviceSize offset = 0;
                vkCmdBindVertexBuffers(commands, 0, 1, &mesh.vertices.buffer, &offset);
                vkCmdBindIndexBuffer(commands, mesh.indices.buffer, 0, VK_INDEX_TYPE_UINT32);
                bound = &mesh;
            }

            ObjectPushConstants object{};
            object.model = transform.matrix();
            object.baseColor = render.baseColor;
            object.materialParams = glm::vec4(render.metallic, render.roughness, render.specular, render.opacity);
            object.emissiveParams = glm::vec4(render.emissive, render.emissiveIntensity);
            vkCmdPushConstants(commands, shapePipeline.layout, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT,
                               0, sizeof(ObjectPushConstants), &object);
            vkCmdDrawIndexed(commands, mesh.indexCount, 1, 0, 0, 0);
            ++drawCount;
        });
}

void VulkanRenderer::recordCapture(VkCommandBuffer commands, uint32_t imageIndex)
{
    const VkImage presented = targets.image(imageIndex);

    const VkImageMemoryBarrier toTransfer = colorImageBarrier(presented, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
        VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT, VK_ACCESS_TRANSFER_READ_BIT);
    vkCmdPipelineBarrier(commands, VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT, 0,
                         0, nullptr, 0, nullptr, 1, &toTransfer);

    VkBufferImageCopy region{};
    region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
    region.imageExtent = {capture.extent.width, capture.extent.height, 1};
    vkCmdCopyImageToBuffer(commands, presented, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, capture.readback.buffer, 1, &region);

    const VkImageMemoryBarrier backToPresent = colorImageBarrier(presented, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
        VK_IMAGE_LAYOUT_PRESENT_SRC_KHR, VK_ACCESS_TRANSFER_READ_BIT, 0);
    vkCmdPipelineBarrier(commands, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT, 0,
                         0, nullptr, 0, nullptr, 1, &backToPresent);

    VkBufferMemoryBarrier hostRead{};
    hostRead.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER;
    hostRead.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    hostRead.dstAccessMask = VK_ACCESS_HOST_READ_BIT;
    hostRead.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    hostRead.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    hostRead.buffer = capture.readback.buffer;
    hostRead.size = VK_WHOLE_SIZE;
    vkCmdPipelineBarrier(commands, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_HOST_BIT, 0,
                         0, nullptr, 1, &hostRead, 0, nullptr);
}

void VulkanRenderer::finishCapture()
{
    capture.pending = false;
    vkCheck(vkWaitForFences(gpu.device(), 1, &frames[currentFrame].inFlight, VK_TRUE, kNoTimeout), "vkWaitForFences");

    const auto* source = static_cast<const std::uint8_t*>(capture.readback.mapped);
    std::vector<std::uint8_t> pixels(source, source + capture.readback.size);
    if (isBgraFormat(targets.colorFormat())) {
        for (size_t texel = 0; texel + 3 < pixels.size(); texel += 4) {
            std::swap(pixels[texel], pixels[texel + 2]);
        }
    }

    capture.written = writeJpeg(capture.path, static_cast<int>(capture.extent.width),
                                static_cast<int>(capture.extent.height), pixels, kCaptureJpegQuality);
}

void VulkanRenderer::writeCameraBuffer(uint32_t imageIndex)
{
    const Scene& scene = engine->scene();
    const Camera& camera = scene.camera();
    const VkExtent2D extent = targets.extent();
    const float aspect = static_cast<float>(extent.width) / static_cast<float>(std::max(1u, extent.height));

    CameraBufferObject frameData{};
    frameData.view = camera.viewMatrix();
    frameData.proj = camera.projectionMatrix(aspect);
    frameData.cameraPosition = glm::vec4(camera.getPosition(), 1.0f);
    frameData.ambientColor = glm::vec4(rendererConfig.ambientColor, 1.0f);

    uint32_t lightCount = 0;
    scene.registry().view<LightComponent>([&](ecs::Entity, const LightComponent& light) {
        if (light.enabled && lightCount < kMaxSceneLights) {
            frameData.lightPositions[lightCount] = glm::vec4(light.position, light.range);
            frameData.lightColors[lightCount] = glm::vec4(light.color, light.intensity);
            ++lightCount;
        }
    });
    frameData.lightParams.x = static_cast<float>(lightCount);

    std::memcpy(cameraBuffers[imageIndex].mapped, &frameData, sizeof(frameData));
}

} // namespace sketchbook::core
