#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace sketchbook::core::fs {

using Path = std::filesystem::path;

// Returns true if the path exists.
bool exists(const Path& p);

// Reads the entire file into a string. Returns std::nullopt on error.
std::optional<std::string> readText(const Path& p, std::error_code* ecOut = nullptr);

// Reads the entire file as raw bytes (SPIR-V modules, images).
std::optional<std::vector<char>> readBinary(const Path& p, std::error_code* ecOut = nullptr);

// Writes text to the file, creating parent directories if requested. Returns false on failure.
bool writeText(const Path& p, const std::string& content, bool createParents = true, std::error_code* ecOut = nullptr);

// Creates directories. Returns true if created or already exists.
bool createDirectories(const Path& dir, std::error_code* ecOut = nullptr);

// Removes a file or directory recursively. Returns count removed, or std::nullopt on error.
std::optional<std::uintmax_t> removeAll(const Path& p, std::error_code* ecOut = nullptr);

// Walks from start towards the filesystem root and returns the first directory containing marker.
std::optional<Path> findAncestorContaining(const Path& start, const Path& marker);

} // namespace sketchbook::core::fs
