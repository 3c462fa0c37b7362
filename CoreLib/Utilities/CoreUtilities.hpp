#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <glm/glm.hpp>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup MathUtils Math / Geometry Utilities
 * @brief Small utilities for rays, intersections, aiming and name handling.
 *
 * Helpers here are lightweight wrappers around GLM or simple algorithms used
 * across classification, picking and light helper construction.
 */
namespace un
{

    /**
     * @brief Simple ray type used for picking and intersections.
     * @ingroup MathUtils
     *
     * @note `dir` should be normalized. `inv` is the component-wise inverse of `dir`
     * (i.e., `1.0f / dir`) and is cached for faster AABB tests.
     */
    struct ray
    {
        glm::vec3 org; ///< Origin of the ray in 3D space.
        glm::vec3 dir; ///< Direction vector (should be normalized).
        glm::vec3 inv; ///< 1.0f / dir (component-wise); used for fast AABB tests.
    };

    /**
     * @brief Build a ray from an origin and an (unnormalized) direction.
     * @ingroup MathUtils
     */
    ray make_ray(const glm::vec3& org, const glm::vec3& dir) noexcept;

    /**
     * @brief True if every component is finite.
     * @ingroup MathUtils
     */
    inline bool is_finite(const glm::vec3& v) noexcept
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    /**
     * @brief Case-insensitive (ASCII) equality.
     * @ingroup MathUtils
     */
    bool equals_nocase(std::string_view a, std::string_view b) noexcept;

    /**
     * @brief Split an identifier-like name into lowercase word tokens.
     *
     * Boundaries are any non-alphanumeric character, a lower-to-upper case
     * change ("pointLight" -> point, light), the last capital of an acronym
     * run ("XYZHandle" -> xyz, handle) and letter/digit changes
     * ("light2" -> light, 2).
     *
     * @param name Arbitrary, possibly empty, name.
     * @return Tokens in name order. Never contains empty strings.
     * @ingroup MathUtils
     */
    std::vector<std::string> name_tokens(std::string_view name);

    /**
     * @brief Normalize a vector safely (avoids NaNs for tiny/invalid inputs).
     *
     * Returns (0,0,0) if the vector length is near zero or non-finite.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v, float eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return glm::vec3(0.0f);
    }

    /**
     * @brief XYZ Euler rotation (radians) that turns local -Z onto @p dir.
     *
     * Roll is always 0. A degenerate @p dir yields zero rotation.
     * @ingroup MathUtils
     */
    glm::vec3 aim_rotation(const glm::vec3& dir) noexcept;

    /**
     * @brief Intersect a ray with a triangle (Moller-Trumbore, two-sided).
     *
     * @param r     Input ray.
     * @param a     Triangle vertex A.
     * @param b     Triangle vertex B.
     * @param c     Triangle vertex C.
     * @param out_t Ray parameter of the hit, t >= 0.
     * @return True if the ray intersects the triangle in front of its origin.
     * @ingroup MathUtils
     */
    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept;

} // namespace un
