#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace sketchbook {

// Encodes tightly packed RGBA8 pixels as a baseline JPEG. Returns an empty buffer on bad input.
std::vector<std::uint8_t> encodeJpeg(int width,
                                     int height,
                                     const std::vector<std::uint8_t>& rgbaPixels,
                                     int quality = 90);

// Encodes and writes to path, creating parent directories. Returns false on failure.
bool writeJpeg(const std::filesystem::path& path,
               int width,
               int height,
               const std::vector<std::uint8_t>& rgbaPixels,
               int quality = 90);

} // namespace sketchbook
