#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Conversions between hex color strings and linear RGB vectors.
 *
 * Accepted forms are "#rrggbb" and "#rgb", case-insensitive, with the leading
 * '#' optional. Components map to [0,1].
 */
namespace color
{
    [[nodiscard]] std::optional<glm::vec3> parseHex(std::string_view text) noexcept;

    /// "#rrggbb", lowercase. Components are clamped into [0,1] first.
    [[nodiscard]] std::string toHex(const glm::vec3& rgb);

    /// Convenience for constants: 0xRRGGBB.
    [[nodiscard]] constexpr glm::vec3 fromInt(uint32_t rgb) noexcept
    {
        return glm::vec3(static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
                         static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
                         static_cast<float>(rgb & 0xFF) / 255.0f);
    }
} // namespace color
