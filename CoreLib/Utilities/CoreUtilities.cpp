#include "CoreUtilities.hpp"

namespace un
{
    namespace
    {
        char lower(char c) noexcept
        {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        bool is_alnum(char c) noexcept
        {
            return std::isalnum(static_cast<unsigned char>(c)) != 0;
        }

        bool is_upper(char c) noexcept
        {
            return std::isupper(static_cast<unsigned char>(c)) != 0;
        }

        bool is_lower(char c) noexcept
        {
            return std::islower(static_cast<unsigned char>(c)) != 0;
        }

        bool is_digit(char c) noexcept
        {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }
    } // namespace

    ray make_ray(const glm::vec3& org, const glm::vec3& dir) noexcept
    {
        ray r = {};
        r.org = org;
        r.dir = safe_normalize(dir);
        r.inv = 1.0f / r.dir;
        return r;
    }

    bool equals_nocase(std::string_view a, std::string_view b) noexcept
    {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return lower(x) == lower(y); });
    }

    std::vector<std::string> name_tokens(std::string_view name)
    {
        std::vector<std::string> tokens;
        std::string              cur;

        auto flush = [&]() {
            if (!cur.empty())
            {
                tokens.push_back(cur);
                cur.clear();
            }
        };

        for (std::size_t i = 0; i < name.size(); ++i)
        {
            const char c = name[i];
            if (!is_alnum(c))
            {
                flush();
                continue;
            }

            if (!cur.empty())
            {
                const char prev = name[i - 1];
                const char next = (i + 1 < name.size()) ? name[i + 1] : '\0';

                const bool camel   = is_lower(prev) && is_upper(c);
                const bool acronym = is_upper(prev) && is_upper(c) && is_lower(next);
                const bool digits  = is_digit(prev) != is_digit(c);

                if (camel || acronym || digits)
                    flush();
            }

            cur.push_back(lower(c));
        }
        flush();

        return tokens;
    }

    glm::vec3 aim_rotation(const glm::vec3& dir) noexcept
    {
        const glm::vec3 d = safe_normalize(dir);
        if (d == glm::vec3(0.0f))
            return glm::vec3(0.0f);

        // Ry(yaw) * Rx(pitch) * (0,0,-1) = (-cos p sin y, sin p, -cos p cos y)
        const float pitch = std::asin(std::clamp(d.y, -1.0f, 1.0f));
        const float yaw   = std::atan2(-d.x, -d.z);
        return glm::vec3(pitch, yaw, 0.0f);
    }

    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept
    {
        constexpr float EPS = 1e-7f;

        const glm::vec3 e1  = b - a;
        const glm::vec3 e2  = c - a;
        const glm::vec3 p   = glm::cross(r.dir, e2);
        const float     det = glm::dot(e1, p);

        if (std::fabs(det) < EPS)
            return false;

        const float     invDet = 1.0f / det;
        const glm::vec3 tvec   = r.org - a;
        const float     u      = glm::dot(tvec, p) * invDet;
        if (u < 0.0f || u > 1.0f)
            return false;

        const glm::vec3 q = glm::cross(tvec, e1);
        const float     v = glm::dot(r.dir, q) * invDet;
        if (v < 0.0f || u + v > 1.0f)
            return false;

        const float t = glm::dot(e2, q) * invDet;
        if (t < 0.0f)
            return false;

        out_t = t;
        return true;
    }

} // namespace un
