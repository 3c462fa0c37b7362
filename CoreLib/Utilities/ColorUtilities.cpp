#include "ColorUtilities.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace color
{
    namespace
    {
        int hexDigit(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::optional<glm::vec3> parseHex(std::string_view text) noexcept
    {
        if (!text.empty() && text.front() == '#')
            text.remove_prefix(1);

        if (text.size() != 3 && text.size() != 6)
            return std::nullopt;

        int digits[6] = {};
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            digits[i] = hexDigit(text[i]);
            if (digits[i] < 0)
                return std::nullopt;
        }

        int r = 0, g = 0, b = 0;
        if (text.size() == 3)
        {
            // #rgb expands each digit: f -> ff
            r = digits[0] * 17;
            g = digits[1] * 17;
            b = digits[2] * 17;
        }
        else
        {
            r = digits[0] * 16 + digits[1];
            g = digits[2] * 16 + digits[3];
            b = digits[4] * 16 + digits[5];
        }

        return glm::vec3(static_cast<float>(r) / 255.0f,
                         static_cast<float>(g) / 255.0f,
                         static_cast<float>(b) / 255.0f);
    }

    std::string toHex(const glm::vec3& rgb)
    {
        auto channel = [](float v) {
            if (!std::isfinite(v))
                v = 0.0f;
            return static_cast<unsigned>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        };

        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", channel(rgb.x), channel(rgb.y), channel(rgb.z));
        return std::string(buf);
    }
} // namespace color
