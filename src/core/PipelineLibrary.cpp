#include "sketchbook/core/PipelineLibrary.hpp"

#include "sketchbook/core/RenderData.hpp"
#include "sketchbook/core/Vertex.hpp"
#include "sketchbook/core/filesystem/FileSystem.hpp"

#include <array>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

namespace sketchbook::core {
namespace {

constexpr uint32_t kSpirvMagic = 0x07230203u;
constexpr VkShaderStageFlags kShapeStages = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;

class ShaderModule {
public:
    ShaderModule(VkDevice owner, const std::vector<uint32_t>& words) : device(owner)
    {
        VkShaderModuleCreateInfo moduleInfo{};
        moduleInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        moduleInfo.codeSize = words.size() * sizeof(uint32_t);
        moduleInfo.pCode = words.data();
        vkCheck(vkCreateShaderModule(device, &moduleInfo, nullptr, &handle), "vkCreateShaderModule");
    }

    ~ShaderModule()
    {
        if (handle != VK_NULL_HANDLE) {
            vkDestroyShaderModule(device, handle, nullptr);
        }
    }

    ShaderModule(const ShaderModule&) = delete;
    ShaderModule& operator=(const ShaderModule&) = delete;

    VkPipelineShaderStageCreateInfo stage(VkShaderStageFlagBits which) const
    {
        VkPipelineShaderStageCreateInfo stageInfo{};
        stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stageInfo.stage = which;
        stageInfo.module = handle;
        stageInfo.pName = "main";
        return stageInfo;
    }

private:
    VkDevice device;
    VkShaderModule handle{VK_NULL_HANDLE};
};

VkPipelineColorBlendAttachmentState alphaBlending()
{
    VkPipelineColorBlendAttachmentState blend{};
    blend.blendEnable = VK_TRUE;
    blend.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
    blend.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    blend.colorBlendOp = VK_BLEND_OP_ADD;
    blend.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
    blend.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    blend.alphaBlendOp = VK_BLEND_OP_ADD;
    blend.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT
                           | VK_COLOR_COMPONENT_A_BIT;
    return blend;
}

} // namespace

std::vector<uint32_t> loadSpirv(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto bytes = fs::readBinary(path, &ec);
    if (!bytes) {
        throw std::runtime_error("Cannot read shader " + path.string() + ": " + ec.message());
    }
    if (bytes->size() < sizeof(uint32_t) || bytes->size() % sizeof(uint32_t) != 0) {
        throw std::runtime_error("Shader " + path.string() + " is truncated (" + std::to_string(bytes->size()) + " bytes)");
    }

    std::vector<uint32_t> words(bytes->size() / sizeof(uint32_t));
    std::memcpy(words.data(), bytes->data(), bytes->size());
    if (words.front() != kSpirvMagic) {
        throw std::runtime_error("Shader " + path.string() + " is not SPIR-V");
    }
    return words;
}

VkDescriptorSetLayout createCameraSetLayout(const GpuContext& gpu)
{
    VkDescriptorSetLayoutBinding camera{};
    camera.binding = 0;
    camera.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    camera.descriptorCount = 1;
    camera.stageFlags = kShapeStages;

    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = 1;
    layoutInfo.pBindings = &camera;

    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    vkCheck(vkCreateDescriptorSetLayout(gpu.device(), &layoutInfo, nullptr, &layout), "vkCreateDescriptorSetLayout");
    return layout;
}

ShapePipeline createShapePipeline(const GpuContext& gpu, const ShapePipelineDesc& desc)
{
    if (!gpu.ready() || desc.renderPass == VK_NULL_HANDLE || desc.cameraLayout == VK_NULL_HANDLE) {
        throw std::invalid_argument("Shape pipeline needs a device, a render pass and the camera set layout");
    }

    const ShaderModule vertexShader(gpu.device(), loadSpirv(desc.shaderDirectory / "shape.vert.spv"));
    const ShaderModule fragmentShader(gpu.device(), loadSpirv(desc.shaderDirectory / "shape.frag.spv"));
    const std::array<VkPipelineShaderStageCreateInfo, 2> stages = {
        vertexShader.stage(VK_SHADER_STAGE_VERTEX_BIT),
        fragmentShader.stage(VK_SHADER_STAGE_FRAGMENT_BIT),
    };

    const VkVertexInputBindingDescription binding = Vertex::bindingDescription();
    const auto attributes = Vertex::attributeDescriptions();

    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInput.vertexBindingDescriptionCount = 1;
    vertexInput.pVertexBindingDescriptions = &binding;
    vertexInput.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributes.size());
    vertexInput.pVertexAttributeDescriptions = attributes.data();

    VkPipelineInputAssemblyStateCreateInfo assembly{};
    assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    assembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkPipelineViewportStateCreateInfo viewport{};
    viewport.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewport.viewportCount = 1;
    viewport.scissorCount = 1;

    constexpr std::array<VkDynamicState, 2> dynamicStates = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamic{};
    dynamic.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamic.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
    dynamic.pDynamicStates = dynamicStates.data();

    // Translucent shapes show their inside faces.
    VkPipelineRasterizationStateCreateInfo raster{};
    raster.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    raster.polygonMode = VK_POLYGON_MODE_FILL;
    raster.cullMode = VK_CULL_MODE_NONE;
    raster.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    raster.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo multisample{};
    multisample.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisample.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineDepthStencilStateCreateInfo depth{};
    depth.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depth.depthTestEnable = VK_TRUE;
    depth.depthWriteEnable = VK_TRUE;
    depth.depthCompareOp = VK_COMPARE_OP_LESS;
    depth.maxDepthBounds = 1.0f;

    const VkPipelineColorBlendAttachmentState blend = alphaBlending();
    VkPipelineColorBlendStateCreateInfo blendState{};
    blendState.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    blendState.attachmentCount = 1;
    blendState.pAttachments = &blend;

    const VkPushConstantRange objectRange{kShapeStages, 0, sizeof(ObjectPushConstants)};

    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = 1;
    layoutInfo.pSetLayouts = &desc.cameraLayout;
    layoutInfo.pushConstantRangeCount = 1;
    layoutInfo.pPushConstantRanges = &objectRange;

    ShapePipeline created{};
    vkCheck(vkCreatePipelineLayout(gpu.device(), &layoutInfo, nullptr, &created.layout), "vkCreatePipelineLayout");

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.stageCount = static_cast<uint32_t>(stages.size());
    pipelineInfo.pStages = stages.data();
    pipelineInfo.pVertexInputState = &vertexInput;
    pipelineInfo.pInputAssemblyState = &assembly;
    pipelineInfo.pViewportState = &viewport;
    pipelineInfo.pRasterizationState = &raster;
    pipelineInfo.pMultisampleState = &multisample;
    pipelineInfo.pDepthStencilState = &depth;
    pipelineInfo.pColorBlendState = &blendState;
    pipelineInfo.pDynamicState = &dynamic;
    pipelineInfo.layout = created.layout;
    pipelineInfo.renderPass = desc.renderPass;

    const VkResult result = vkCreateGraphicsPipelines(gpu.device(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &created.pipeline);
    if (result != VK_SUCCESS) {
        destroyShapePipeline(gpu, created);
        vkCheck(result, "vkCreateGraphicsPipelines");
    }
    return created;
}

void destroyShapePipeline(const GpuContext& gpu, ShapePipeline& shapePipeline)
{
    if (gpu.device() == VK_NULL_HANDLE) {
        return;
    }
    if (shapePipeline.pipeline != VK_NULL_HANDLE) {
        vkDestroyPipeline(gpu.device(), shapePipeline.pipeline, nullptr);
    }
    if (shapePipeline.layout != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(gpu.device(), shapePipeline.layout, nullptr);
    }
    shapePipeline = ShapePipeline{};
}

} // namespace sketchbook::core
