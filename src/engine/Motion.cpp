#include "sketchbook/engine/Motion.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace sketchbook {

float Oscillator::value(float seconds) const noexcept
{
    return amplitude * std::sin(frequency * seconds + phase);
}

float Oscillator::period() const noexcept
{
    if (frequency == 0.0f) {
        return std::numeric_limits<float>::infinity();
    }
    return glm::two_pi<float>() / std::abs(frequency);
}

glm::vec3 OrbitPath::evaluate(float seconds) const noexcept
{
    return center + glm::vec3{x.value(seconds), y.value(seconds), z.value(seconds)};
}

OrbitPath OrbitPath::circle(const glm::vec3& center, float radius, float frequency, float startAngle) noexcept
{
    // cos(a) == sin(a + pi/2)
    OrbitPath path{};
    path.center = center;
    path.x = Oscillator{radius, frequency, startAngle + glm::half_pi<float>()};
    path.z = Oscillator{-radius, frequency, startAngle};
    return path;
}

std::size_t GridLayout::cellCount() const noexcept
{
    if (count <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(count) * static_cast<std::size_t>(count);
}

glm::vec3 GridLayout::position(int row, int col) const noexcept
{
    const int center = offset();
    return glm::vec3{static_cast<float>(row - center) * spacing, 0.0f, static_cast<float>(col - center) * spacing};
}

std::vector<glm::vec3> GridLayout::positions() const
{
    std::vector<glm::vec3> result;
    result.reserve(cellCount());
    for (int row = 0; row < count; ++row) {
        for (int col = 0; col < count; ++col) {
            result.push_back(position(row, col));
        }
    }
    return result;
}

void GridLayout::validate() const
{
    if (!(spacing > 0.0f)) {
        throw std::invalid_argument("Grid spacing must be positive, got " + std::to_string(spacing));
    }
}

} // namespace sketchbook
