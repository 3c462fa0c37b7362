//============================================================
// Light.hpp
//============================================================
#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "NodeTypes.hpp"

using LightId                     = int32_t; // monotonic, never reused within a session
constexpr LightId kInvalidLightId = -1;

enum class LightKind : uint8_t
{
    Ambient = 0,
    Directional,
    Point,
    Spot,
    Area
};

[[nodiscard]] const char* toString(LightKind kind) noexcept;

/// Lowercase key used for helper builder registration ("point", "spot", ...).
[[nodiscard]] const char* kindKey(LightKind kind) noexcept;

/**
 * @brief Authoritative parameters of a managed light.
 *
 * Position and rotation are WORLD space (managed light nodes are top level).
 * Rotation is XYZ Euler in radians; emission points down local -Z.
 *
 * Which fields are used depends on the kind:
 *  - distance/decay: Point, Spot (distance 0 = unlimited)
 *  - angle/penumbra: Spot
 *  - width/height:   Area
 */
struct LightProperties
{
    float     intensity = 1.0f;
    glm::vec3 color     = glm::vec3(1.0f);
    glm::vec3 position  = glm::vec3(0.0f);
    glm::vec3 rotation  = glm::vec3(0.0f);
    float     distance  = 0.0f;
    float     decay     = 2.0f;
    float     angle     = 0.52359877559f; // pi/6
    float     penumbra  = 0.0f;
    float     width     = 1.0f;
    float     height    = 1.0f;
};

/**
 * @brief Creation parameters. Unset fields take the kind defaults.
 *
 * A directional or spot light created without a rotation is aimed at the
 * world origin from its position.
 */
struct LightInit
{
    std::string              name = {};
    std::optional<float>     intensity;
    std::optional<glm::vec3> color;
    std::optional<glm::vec3> position;
    std::optional<glm::vec3> rotation;
    std::optional<float>     distance;
    std::optional<float>     decay;
    std::optional<float>     angle;
    std::optional<float>     penumbra;
    std::optional<float>     width;
    std::optional<float>     height;
    bool                     visible = true;
};

/// Value accepted by LightHandler::updateProperty.
using PropertyValue = std::variant<double, glm::vec3, std::string>;

/**
 * @brief Read-only snapshot of a managed light and its bundle.
 *
 * Returned by value; editing it has no effect on the scene.
 */
struct ManagedLight
{
    LightId         id   = kInvalidLightId;
    std::string     name = {};
    LightKind       kind = LightKind::Point;
    LightProperties properties;

    bool visible = true;
    bool partial = false; ///< Helper or proxy could not be built

    NodeId lightNode  = kInvalidNodeId;
    NodeId helperNode = kInvalidNodeId;
    NodeId proxyNode  = kInvalidNodeId;

    NodeTransform                lightTransform;
    std::optional<NodeTransform> helperTransform;
    std::optional<NodeTransform> proxyTransform;

    std::optional<bool> helperVisible;
    std::optional<bool> proxyVisible;
};

/**
 * @brief Kind defaults used when a LightInit field is unset.
 */
[[nodiscard]] LightProperties defaultLightProperties(LightKind kind) noexcept;

/**
 * @brief Engine light type a managed kind maps onto.
 */
[[nodiscard]] EngineLightType engineLightType(LightKind kind) noexcept;
