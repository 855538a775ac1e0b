#pragma once

#include <glm/glm.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <vector>

#include "sketchbook/core/GpuContext.hpp"
#include "sketchbook/core/PipelineLibrary.hpp"
#include "sketchbook/core/SwapchainTargets.hpp"
#include "sketchbook/core/WindowManager.hpp"
#include "sketchbook/core/primitives/PrimitiveGenerator.hpp"
#include "sketchbook/engine/GameEngine.hpp"
#include "sketchbook/ui/ImGuiLayer.hpp"

namespace sketchbook::core {

struct RendererConfig {
    WindowConfig window{};
    glm::vec4 clearColor{0.34f, 0.36f, 0.52f, 1.0f};
    glm::vec3 ambientColor{0.08f, 0.08f, 0.1f};
    ShapeDimensions shapeDimensions{};
    int frameLimit{60}; // frames per second, 0 = uncapped
    bool overlayEnabled{true};
    std::filesystem::path shaderDirectory{}; // empty = the directory the build compiled shaders into
};

// Forward renderer for a sketch scene: one translucent pass over every visible
// shape, lit by up to kMaxSceneLights point lights, with an ImGui overlay on top.
class VulkanRenderer {
public:
    explicit VulkanRenderer(IGameEngine& engineRef, RendererConfig config = {});
    ~VulkanRenderer();

    VulkanRenderer(const VulkanRenderer&) = delete;
    VulkanRenderer& operator=(const VulkanRenderer&) = delete;

    // Opens the window and renders until it is closed or requestExit() is called.
    void run();

    // Renders one frame into a hidden window and writes it as a JPEG.
    // Returns false if the frame could not be read back or written.
    bool renderSingleFrameToJpeg(const std::filesystem::path& outputPath);

    void requestExit();

    [[nodiscard]] const RendererConfig& config() const noexcept { return rendererConfig; }
    [[nodiscard]] std::uint64_t framesRendered() const noexcept { return frameCounter; }
    [[nodiscard]] std::size_t lastDrawCount() const noexcept { return drawCount; }

private:
    static constexpr uint32_t kFramesInFlight = 2;

    struct MeshGpuBuffers {
        GpuBuffer vertices{};
        GpuBuffer indices{};
        uint32_t indexCount{0};
    };

    struct FrameSync {
        VkSemaphore imageAvailable{VK_NULL_HANDLE};
        VkFence inFlight{VK_NULL_HANDLE};
    };

    struct CaptureState {
        std::filesystem::path path{};
        GpuBuffer readback{};
        VkExtent2D extent{};
        uint32_t imageIndex{0};
        bool pending{false};
        bool written{false};
    };

    void startup();
    void mainLoop();
    void shutdown();

    void createSwapchainResources();
    void destroySwapchainResources();
    void recreateSwapchain();

    void createCameraBuffers();
    void createDescriptorSets();
    void createCommandBuffers();
    void createFrameSync();
    void destroyFrameSync();

    void initUi();
    void buildUi(float deltaSeconds);

    void drawFrame();
    void recordFrame(VkCommandBuffer commands, uint32_t imageIndex);
    void drawShapes(VkCommandBuffer commands);
    void recordCapture(VkCommandBuffer commands, uint32_t imageIndex);
    void finishCapture();
    void writeCameraBuffer(uint32_t imageIndex);

    const MeshGpuBuffers& meshFor(MeshKind kind);
    void destroyMeshes();

    void handleHotkeys(int key, int action);
    void printHotkeyHelp() const;
    void setupInputCallbacks();
    static void framebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);

private:
    IGameEngine* engine{nullptr};
    RendererConfig rendererConfig{};

    WindowManager windowManager{};
    std::atomic<bool> exitRequested{false};
    GLFWwindow* window = nullptr;
    bool framebufferResized = false;

    GpuContext gpu{};
    SwapchainTargets targets{};
    VkDescriptorSetLayout cameraLayout = VK_NULL_HANDLE;
    ShapePipeline shapePipeline{};

    // One camera buffer, descriptor set and command buffer per swapchain image.
    std::vector<GpuBuffer> cameraBuffers;
    VkDescriptorPool descriptorPool = VK_NULL_HANDLE;
    std::vector<VkDescriptorSet> descriptorSets;
    std::vector<VkCommandBuffer> commandBuffers;
    std::vector<VkSemaphore> renderFinished;
    ImageFenceTable imageFences{};

    std::array<FrameSync, kFramesInFlight> frames{};
    uint32_t currentFrame = 0;

    std::map<MeshKind, MeshGpuBuffers> meshCache;
    CaptureState capture{};

    ui::ImGuiLayer uiLayer{};
    float smoothedFps = 0.0f;

    std::chrono::steady_clock::time_point lastFrameTime{};
    std::uint64_t frameCounter = 0;
    std::size_t drawCount = 0;
};

} // namespace sketchbook::core
