#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "sketchbook/core/PipelineLibrary.hpp"
#include "sketchbook/core/RenderData.hpp"
#include "sketchbook/core/SwapchainTargets.hpp"
#include "sketchbook/core/Vertex.hpp"
#include "sketchbook/core/primitives/PrimitiveGenerator.hpp"
#include "sketchbook/engine/HeadlessCapture.hpp"
#include "sketchbook/engine/assets/ImageWriter.hpp"

namespace {

class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage(args)
    {
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }

private:
    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

void expectIndicesInRange(const sketchbook::MeshData& mesh)
{
    ASSERT_EQ(mesh.indices.size() % 3, 0u);
    for (auto index : mesh.indices) {
        ASSERT_LT(index, mesh.vertices.size());
    }
}

TEST(PrimitiveTests, DefaultConeTopology)
{
    const auto mesh = sketchbook::PrimitiveGenerator::createShape(sketchbook::MeshKind::Cone, {});

    // 7 apex copies, 8 ring vertices, base center plus 8 rim vertices.
    EXPECT_EQ(mesh.vertices.size(), 24u);
    EXPECT_EQ(mesh.indices.size(), 42u);
    EXPECT_EQ(mesh.triangleCount(), 14u);
    expectIndicesInRange(mesh);

    EXPECT_FLOAT_EQ(mesh.boundsMax.y, 1.0f);
    EXPECT_FLOAT_EQ(mesh.boundsMin.y, -1.0f);
    EXPECT_EQ(mesh.vertices.front().position, glm::vec3(0.0f, 1.0f, 0.0f));
}

TEST(PrimitiveTests, ConeNormalsAreUnitLength)
{
    const auto mesh = sketchbook::PrimitiveGenerator::createCone(1.0f, 2.0f, 7);
    for (const auto& vertex : mesh.vertices) {
        EXPECT_NEAR(glm::length(vertex.normal), 1.0f, 1e-5f);
    }
    // Side normals tilt upward, the base cap points down.
    EXPECT_GT(mesh.vertices.front().normal.y, 0.0f);
    EXPECT_FLOAT_EQ(mesh.vertices.back().normal.y, -1.0f);
}

TEST(PrimitiveTests, ConeClampsSectors)
{
    const auto mesh = sketchbook::PrimitiveGenerator::createCone(1.0f, 1.0f, 1);
    EXPECT_EQ(mesh.vertices.size(), 3u * 3u + 3u);
    EXPECT_EQ(mesh.triangleCount(), 6u);
}

TEST(PrimitiveTests, CylinderAndSphereTopology)
{
    const auto cylinder = sketchbook::PrimitiveGenerator::createShape(sketchbook::MeshKind::Cylinder, {});
    EXPECT_EQ(cylinder.vertices.size(), 2u * 8u + 2u * 9u);
    EXPECT_EQ(cylinder.triangleCount(), 28u);
    expectIndicesInRange(cylinder);

    const auto sphere = sketchbook::PrimitiveGenerator::createShape(sketchbook::MeshKind::Sphere, {});
    EXPECT_EQ(sphere.vertices.size(), 4u * 8u);
    EXPECT_EQ(sphere.triangleCount(), 28u);
    expectIndicesInRange(sphere);
    for (const auto& vertex : sphere.vertices) {
        EXPECT_NEAR(glm::length(vertex.position), 1.0f, 1e-5f);
    }
}

TEST(PrimitiveTests, TrianglesFaceTheirVertexNormals)
{
    for (const auto kind : {sketchbook::MeshKind::Cone, sketchbook::MeshKind::Cylinder, sketchbook::MeshKind::Sphere}) {
        const auto mesh = sketchbook::PrimitiveGenerator::createShape(kind, {});
        for (std::size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
            const auto& a = mesh.vertices[mesh.indices[i]];
            const auto& b = mesh.vertices[mesh.indices[i + 1]];
            const auto& c = mesh.vertices[mesh.indices[i + 2]];
            const glm::vec3 face = glm::cross(b.position - a.position, c.position - a.position);
            ASSERT_GT(glm::length(face), 1e-6f) << sketchbook::toString(kind) << " triangle " << i / 3 << " is degenerate";
            EXPECT_GT(glm::dot(face, a.normal + b.normal + c.normal), 0.0f)
                << sketchbook::toString(kind) << " triangle " << i / 3 << " winds clockwise from outside";
            EXPECT_GT(glm::dot(face, (a.position + b.position + c.position) / 3.0f), 0.0f)
                << sketchbook::toString(kind) << " triangle " << i / 3 << " faces the center";
        }
    }
}

TEST(PrimitiveTests, RejectsNonPositiveDimensions)
{
    sketchbook::ShapeDimensions dimensions{};
    dimensions.radius = 0.0f;
    EXPECT_THROW((void)sketchbook::PrimitiveGenerator::createShape(sketchbook::MeshKind::Cone, dimensions), std::invalid_argument);

    dimensions.radius = 1.0f;
    dimensions.height = -2.0f;
    EXPECT_THROW((void)sketchbook::PrimitiveGenerator::createShape(sketchbook::MeshKind::Cylinder, dimensions), std::invalid_argument);
}

TEST(GpuLayoutTests, VertexMatchesMeshVertex)
{
    static_assert(sizeof(sketchbook::core::Vertex) == sizeof(sketchbook::MeshVertex));
    EXPECT_EQ(offsetof(sketchbook::core::Vertex, pos), offsetof(sketchbook::MeshVertex, position));
    EXPECT_EQ(offsetof(sketchbook::core::Vertex, normal), offsetof(sketchbook::MeshVertex, normal));
    EXPECT_EQ(offsetof(sketchbook::core::Vertex, uv), offsetof(sketchbook::MeshVertex, uv));

    const auto binding = sketchbook::core::Vertex::bindingDescription();
    EXPECT_EQ(binding.stride, sizeof(sketchbook::core::Vertex));
    const auto attributes = sketchbook::core::Vertex::attributeDescriptions();
    EXPECT_EQ(attributes[2].location, 2u);
    EXPECT_EQ(attributes[2].format, VK_FORMAT_R32G32_SFLOAT);
}

TEST(GpuLayoutTests, BuffersFollowStd140)
{
    EXPECT_EQ(sizeof(sketchbook::core::CameraBufferObject) % 16, 0u);
    EXPECT_EQ(offsetof(sketchbook::core::CameraBufferObject, cameraPosition), 128u);
    EXPECT_EQ(offsetof(sketchbook::core::CameraBufferObject, lightPositions), 144u);
    EXPECT_LE(sizeof(sketchbook::core::ObjectPushConstants), 128u);
}

TEST(ImageWriterTests, EncodesDecodableJpeg)
{
    constexpr int width = 16;
    constexpr int height = 8;
    std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * height * 4);
    for (std::size_t i = 0; i < rgba.size(); i += 4) {
        rgba[i + 0] = 200;
        rgba[i + 1] = 40;
        rgba[i + 2] = 40;
        rgba[i + 3] = 255;
    }

    const auto jpeg = sketchbook::encodeJpeg(width, height, rgba, 92);
    ASSERT_GT(jpeg.size(), 4u);
    EXPECT_EQ(jpeg[0], 0xFF);
    EXPECT_EQ(jpeg[1], 0xD8);

    int decodedWidth = 0;
    int decodedHeight = 0;
    int channels = 0;
    stbi_uc* decoded = stbi_load_from_memory(jpeg.data(), static_cast<int>(jpeg.size()),
                                             &decodedWidth, &decodedHeight, &channels, 3);
    ASSERT_NE(decoded, nullptr) << stbi_failure_reason();
    EXPECT_EQ(decodedWidth, width);
    EXPECT_EQ(decodedHeight, height);
    EXPECT_NEAR(decoded[0], 200, 12);
    EXPECT_NEAR(decoded[1], 40, 12);
    EXPECT_NEAR(decoded[2], 40, 12);
    stbi_image_free(decoded);
}

TEST(ImageWriterTests, RejectsBadInput)
{
    std::vector<std::uint8_t> tooSmall(4 * 4 * 4 - 1);
    EXPECT_TRUE(sketchbook::encodeJpeg(4, 4, tooSmall).empty());
    EXPECT_TRUE(sketchbook::encodeJpeg(0, 4, {}).empty());
}

TEST(ImageWriterTests, WriteCreatesParentDirectories)
{
    const auto dir = std::filesystem::temp_directory_path() / "sketchbook_tests" / "captures";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "frame.jpg";

    std::vector<std::uint8_t> rgba(8 * 8 * 4, 128);
    ASSERT_TRUE(sketchbook::writeJpeg(path, 8, 8, rgba));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_GT(std::filesystem::file_size(path), 0u);
}

TEST(HeadlessCaptureTests, DisabledWithoutFlags)
{
    Argv args{"cones", "--config", "cones.json"};
    const auto capture = sketchbook::parseHeadlessCaptureArgs(args.argc(), args.argv(), "cones");
    EXPECT_FALSE(capture.enabled);
    EXPECT_TRUE(capture.outputPath.empty());
}

TEST(HeadlessCaptureTests, HeadlessUsesDefaultPath)
{
    Argv args{"cones", "--headless"};
    const auto capture = sketchbook::parseHeadlessCaptureArgs(args.argc(), args.argv(), "cones");
    EXPECT_TRUE(capture.enabled);
    EXPECT_EQ(capture.outputPath.filename(), "cones.jpg");
    EXPECT_EQ(capture.outputPath.parent_path().filename(), "test_results");
}

TEST(HeadlessCaptureTests, CaptureAcceptsBothSpellings)
{
    Argv separate{"cones", "--capture", "out/a.jpg"};
    auto capture = sketchbook::parseHeadlessCaptureArgs(separate.argc(), separate.argv(), "cones");
    EXPECT_TRUE(capture.enabled);
    EXPECT_EQ(capture.outputPath, std::filesystem::path("out/a.jpg"));

    Argv joined{"cones", "--capture=b.jpg"};
    capture = sketchbook::parseHeadlessCaptureArgs(joined.argc(), joined.argv(), "cones");
    EXPECT_TRUE(capture.enabled);
    EXPECT_EQ(capture.outputPath, std::filesystem::path("b.jpg"));
}

TEST(HeadlessCaptureTests, CaptureWithoutPathThrows)
{
    Argv missing{"cones", "--capture"};
    EXPECT_THROW((void)sketchbook::parseHeadlessCaptureArgs(missing.argc(), missing.argv(), "cones"), std::invalid_argument);

    Argv empty{"cones", "--capture="};
    EXPECT_THROW((void)sketchbook::parseHeadlessCaptureArgs(empty.argc(), empty.argv(), "cones"), std::invalid_argument);
}

VkSurfaceCapabilitiesKHR surfaceLimits(uint32_t minImages, uint32_t maxImages)
{
    VkSurfaceCapabilitiesKHR caps{};
    caps.minImageCount = minImages;
    caps.maxImageCount = maxImages;
    caps.currentExtent = {std::numeric_limits<uint32_t>::max(), std::numeric_limits<uint32_t>::max()};
    caps.minImageExtent = {64, 64};
    caps.maxImageExtent = {1920, 1080};
    return caps;
}

TEST(SwapchainChoiceTests, PrefersSrgbBgra)
{
    using sketchbook::core::chooseSurfaceFormat;
    const VkColorSpaceKHR srgb = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;

    const auto picked = chooseSurfaceFormat({{VK_FORMAT_R8G8B8A8_UNORM, srgb},
                                             {VK_FORMAT_R8G8B8A8_SRGB, srgb},
                                             {VK_FORMAT_B8G8R8A8_SRGB, srgb}});
    EXPECT_EQ(picked.format, VK_FORMAT_B8G8R8A8_SRGB);

    const auto rgba = chooseSurfaceFormat({{VK_FORMAT_R8G8B8A8_UNORM, srgb}, {VK_FORMAT_R8G8B8A8_SRGB, srgb}});
    EXPECT_EQ(rgba.format, VK_FORMAT_R8G8B8A8_SRGB);

    const auto fallback = chooseSurfaceFormat({{VK_FORMAT_A2B10G10R10_UNORM_PACK32, srgb}});
    EXPECT_EQ(fallback.format, VK_FORMAT_A2B10G10R10_UNORM_PACK32);

    EXPECT_THROW((void)chooseSurfaceFormat({}), std::invalid_argument);
}

TEST(SwapchainChoiceTests, MailboxOverFifo)
{
    using sketchbook::core::choosePresentMode;
    EXPECT_EQ(choosePresentMode({VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_MAILBOX_KHR}), VK_PRESENT_MODE_MAILBOX_KHR);
    EXPECT_EQ(choosePresentMode({VK_PRESENT_MODE_IMMEDIATE_KHR, VK_PRESENT_MODE_FIFO_KHR}), VK_PRESENT_MODE_FIFO_KHR);
    EXPECT_EQ(choosePresentMode({}), VK_PRESENT_MODE_FIFO_KHR);
}

TEST(SwapchainChoiceTests, ExtentFollowsSurfaceOrClampsFramebuffer)
{
    using sketchbook::core::chooseExtent;
    auto caps = surfaceLimits(2, 3);

    const VkExtent2D clamped = chooseExtent(caps, {4000, 10});
    EXPECT_EQ(clamped.width, 1920u);
    EXPECT_EQ(clamped.height, 64u);

    const VkExtent2D inside = chooseExtent(caps, {800, 600});
    EXPECT_EQ(inside.width, 800u);
    EXPECT_EQ(inside.height, 600u);

    caps.currentExtent = {1024, 768};
    const VkExtent2D fixed = chooseExtent(caps, {800, 600});
    EXPECT_EQ(fixed.width, 1024u);
    EXPECT_EQ(fixed.height, 768u);
}

TEST(SwapchainChoiceTests, ImageCountIsMinimumPlusOneWithinMaximum)
{
    using sketchbook::core::chooseImageCount;
    EXPECT_EQ(chooseImageCount(surfaceLimits(2, 8)), 3u);
    EXPECT_EQ(chooseImageCount(surfaceLimits(3, 3)), 3u);
    EXPECT_EQ(chooseImageCount(surfaceLimits(2, 0)), 3u) << "0 means no upper limit";
}

TEST(SwapchainChoiceTests, ReadbackSwizzleOnlyForBgra)
{
    EXPECT_TRUE(sketchbook::core::isBgraFormat(VK_FORMAT_B8G8R8A8_SRGB));
    EXPECT_TRUE(sketchbook::core::isBgraFormat(VK_FORMAT_B8G8R8A8_UNORM));
    EXPECT_FALSE(sketchbook::core::isBgraFormat(VK_FORMAT_R8G8B8A8_SRGB));
}

VkFence fenceHandle(std::uint64_t value)
{
    static_assert(sizeof(VkFence) == sizeof(value), "non-dispatchable handles are 64-bit");
    VkFence fence{};
    std::memcpy(&fence, &value, sizeof(fence));
    return fence;
}

TEST(ImageFenceTableTests, WaitsOnTheSlotThatLastUsedTheImage)
{
    const VkFence slot0 = fenceHandle(0x10);
    const VkFence slot1 = fenceHandle(0x20);

    sketchbook::core::ImageFenceTable table;
    table.reset(3);

    EXPECT_EQ(table.claim(2, slot1), VK_NULL_HANDLE) << "fresh images have nothing in flight";
    EXPECT_EQ(table.claim(0, slot0), VK_NULL_HANDLE);

    // Slot 0 acquires the image slot 1 is still drawing into: its uniforms must not be
    // overwritten until slot 1's fence signals.
    EXPECT_EQ(table.claim(2, slot0), slot1);
    EXPECT_EQ(table.owner(2), slot0);

    EXPECT_EQ(table.claim(2, slot0), VK_NULL_HANDLE) << "own fence was already waited on";
}

TEST(ImageFenceTableTests, ResetForgetsOwnersAndRejectsBadIndices)
{
    sketchbook::core::ImageFenceTable table;
    table.reset(2);
    (void)table.claim(1, fenceHandle(0x30));

    table.reset(4);
    EXPECT_EQ(table.size(), 4u);
    EXPECT_EQ(table.owner(1), VK_NULL_HANDLE);
    EXPECT_THROW((void)table.claim(4, fenceHandle(0x30)), std::out_of_range);

    table.clear();
    EXPECT_EQ(table.size(), 0u);
}

class SpirvFileTests : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path() / "sketchbook_tests" / "spirv";
        std::filesystem::create_directories(dir);
    }

    std::filesystem::path write(const std::string& name, const std::vector<std::uint32_t>& words, std::size_t extraBytes = 0)
    {
        const auto path = dir / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(words.data()), static_cast<std::streamsize>(words.size() * sizeof(std::uint32_t)));
        for (std::size_t i = 0; i < extraBytes; ++i) {
            out.put('\0');
        }
        return path;
    }

    std::filesystem::path dir;
};

TEST_F(SpirvFileTests, AcceptsModuleWithMagic)
{
    const auto words = sketchbook::core::loadSpirv(write("ok.spv", {0x07230203u, 0x00010000u, 0u, 1u, 0u}));
    ASSERT_EQ(words.size(), 5u);
    EXPECT_EQ(words.front(), 0x07230203u);
}

TEST_F(SpirvFileTests, RejectsMissingTruncatedAndForeignFiles)
{
    using sketchbook::core::loadSpirv;
    EXPECT_THROW((void)loadSpirv(dir / "missing.spv"), std::runtime_error);
    EXPECT_THROW((void)loadSpirv(write("empty.spv", {})), std::runtime_error);
    EXPECT_THROW((void)loadSpirv(write("odd.spv", {0x07230203u}, 2)), std::runtime_error);
    EXPECT_THROW((void)loadSpirv(write("text.spv", {0x64636261u, 0u})), std::runtime_error);
}

} // namespace
