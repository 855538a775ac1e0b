#pragma once

#ifndef GLM_FORCE_RADIANS
#define GLM_FORCE_RADIANS
#endif
#include <glm/glm.hpp>

#include <cstddef>
#include <vector>

namespace sketchbook {

/// @brief Sine wave: amplitude * sin(frequency * t + phase).
struct Oscillator {
    float amplitude{0.0f};
    float frequency{1.0f}; ///< Angular frequency in radians per second.
    float phase{0.0f};     ///< Radians.

    [[nodiscard]] float value(float seconds) const noexcept;

    /// @brief Seconds for one full cycle; infinity when the frequency is zero.
    [[nodiscard]] float period() const noexcept;
};

/// @brief Closed path made of one oscillator per axis around a fixed center.
struct OrbitPath {
    glm::vec3 center{0.0f};
    Oscillator x{};
    Oscillator y{};
    Oscillator z{};

    [[nodiscard]] glm::vec3 evaluate(float seconds) const noexcept;

    /**
     * @brief Horizontal circle in the XZ plane.
     * @param center Circle center; its Y is the height of the path.
     * @param radius Circle radius.
     * @param frequency Angular speed in radians per second.
     * @param startAngle Angle at t = 0, measured from +X towards -Z.
     * @return Path with x = r cos(wt + a) and z = -r sin(wt + a).
     */
    [[nodiscard]] static OrbitPath circle(const glm::vec3& center, float radius, float frequency, float startAngle = 0.0f) noexcept;
};

/// @brief Square grid of cells centered on the origin of the XZ plane.
struct GridLayout {
    int count{201};
    float spacing{2.5f};

    [[nodiscard]] int offset() const noexcept { return count / 2; }
    [[nodiscard]] std::size_t cellCount() const noexcept;

    [[nodiscard]] glm::vec3 position(int row, int col) const noexcept;

    /// @brief All cell positions, rows outer and columns inner.
    [[nodiscard]] std::vector<glm::vec3> positions() const;

    /// @throws std::invalid_argument when the spacing is not positive.
    void validate() const;
};

} // namespace sketchbook
