#include "sketchbook/engine/assets/ImageWriter.hpp"

#include "sketchbook/core/filesystem/FileSystem.hpp"

#include <algorithm>
#include <fstream>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace sketchbook {

namespace {
void appendToBuffer(void* context, void* data, int size)
{
    auto* buffer = static_cast<std::vector<std::uint8_t>*>(context);
    auto* bytes = static_cast<std::uint8_t*>(data);
    buffer->insert(buffer->end(), bytes, bytes + size);
}
} // namespace

std::vector<std::uint8_t> encodeJpeg(int width,
                                     int height,
                                     const std::vector<std::uint8_t>& rgbaPixels,
                                     int quality)
{
    std::vector<std::uint8_t> jpeg;
    if (width <= 0 || height <= 0) {
        return jpeg;
    }
    if (rgbaPixels.size() < static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4) {
        return jpeg;
    }

    const int clampedQuality = std::clamp(quality, 1, 100);
    if (stbi_write_jpg_to_func(appendToBuffer, &jpeg, width, height, 4, rgbaPixels.data(), clampedQuality) == 0) {
        jpeg.clear();
    }
    return jpeg;
}

bool writeJpeg(const std::filesystem::path& path,
               int width,
               int height,
               const std::vector<std::uint8_t>& rgbaPixels,
               int quality)
{
    const auto jpeg = encodeJpeg(width, height, rgbaPixels, quality);
    if (jpeg.empty()) {
        return false;
    }

    if (path.has_parent_path() && !core::fs::createDirectories(path.parent_path())) {
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
    return static_cast<bool>(file);
}

} // namespace sketchbook
