#pragma once

#include "sketchbook/core/GpuContext.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace sketchbook::core {

// Reads a compiled shader. Throws std::runtime_error if the file is missing,
// truncated or does not start with the SPIR-V magic number.
std::vector<uint32_t> loadSpirv(const std::filesystem::path& path);

// Set 0: the per-frame CameraBufferObject, read by both shader stages.
VkDescriptorSetLayout createCameraSetLayout(const GpuContext& gpu);

struct ShapePipelineDesc {
    VkRenderPass renderPass{VK_NULL_HANDLE};
    VkDescriptorSetLayout cameraLayout{VK_NULL_HANDLE};
    std::filesystem::path shaderDirectory{}; // holds shape.vert.spv and shape.frag.spv
};

struct ShapePipeline {
    VkPipelineLayout layout{VK_NULL_HANDLE};
    VkPipeline pipeline{VK_NULL_HANDLE};
};

// Translucent, unculled shapes with per-draw push constants. Viewport and
// scissor are dynamic, so only a new render pass forces a rebuild.
ShapePipeline createShapePipeline(const GpuContext& gpu, const ShapePipelineDesc& desc);
void destroyShapePipeline(const GpuContext& gpu, ShapePipeline& shapePipeline);

} // namespace sketchbook::core
