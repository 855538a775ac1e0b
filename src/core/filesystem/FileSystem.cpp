#include "sketchbook/core/filesystem/FileSystem.hpp"

#include <fstream>
#include <iterator>

namespace sketchbook::core::fs {

namespace {

// Stores ec for callers that asked for it and turns it into a success flag.
bool settle(std::error_code* ecOut, std::error_code ec)
{
    if (ecOut != nullptr) {
        *ecOut = ec;
    }
    return !ec;
}

template <typename Buffer>
std::optional<Buffer> slurp(const Path& p, std::error_code* ecOut)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec)) {
        settle(ecOut, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        return std::nullopt;
    }

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) {
        settle(ecOut, std::make_error_code(std::errc::permission_denied));
        return std::nullopt;
    }
    Buffer content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        settle(ecOut, std::make_error_code(std::errc::io_error));
        return std::nullopt;
    }
    settle(ecOut, {});
    return content;
}

} // namespace

bool exists(const Path& p)
{
    std::error_code ec;
    return std::filesystem::exists(p, ec) && !ec;
}

std::optional<std::string> readText(const Path& p, std::error_code* ecOut)
{
    return slurp<std::string>(p, ecOut);
}

std::optional<std::vector<char>> readBinary(const Path& p, std::error_code* ecOut)
{
    return slurp<std::vector<char>>(p, ecOut);
}

bool writeText(const Path& p, const std::string& content, bool createParents, std::error_code* ecOut)
{
    if (createParents && p.has_parent_path() && !createDirectories(p.parent_path(), ecOut)) {
        return false;
    }

    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
    out.close();
    return settle(ecOut, out.fail() ? std::make_error_code(std::errc::io_error) : std::error_code{});
}

bool createDirectories(const Path& dir, std::error_code* ecOut)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (!ec && !std::filesystem::is_directory(dir, ec) && !ec) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    return settle(ecOut, ec);
}

std::optional<std::uintmax_t> removeAll(const Path& p, std::error_code* ecOut)
{
    std::error_code ec;
    const std::uintmax_t removed = std::filesystem::remove_all(p, ec);
    if (!settle(ecOut, ec)) {
        return std::nullopt;
    }
    return removed;
}

std::optional<Path> findAncestorContaining(const Path& start, const Path& marker)
{
    std::error_code ec;
    const Path origin = std::filesystem::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    for (Path dir = origin; !dir.empty(); dir = dir.parent_path()) {
        if (fs::exists(dir / marker)) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }
    return std::nullopt;
}

} // namespace sketchbook::core::fs
