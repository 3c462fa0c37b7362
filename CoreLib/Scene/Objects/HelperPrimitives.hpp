#pragma once

#include <glm/vec3.hpp>

#include "NodeTypes.hpp"

/**
 * @brief Geometry generators for light helpers.
 *
 * All shapes are built in local space around the origin. Emission
 * direction conventions follow Light.hpp: lights point down local -Z and area
 * lights lie in the local XY plane.
 */
namespace Primitives
{
    /**
     * @brief Wireframe sphere made of three great circles (XY, XZ, YZ).
     * @param radius   Sphere radius
     * @param segments Line segments per circle (min 8)
     */
    NodeGeometry wireSphere(float radius, int segments);

    /**
     * @brief Closed UV sphere (triangles).
     * @param radius Sphere radius
     * @param rings  Latitude bands (min 2)
     * @param sides  Longitude segments (min 3)
     */
    NodeGeometry solidSphere(float radius, int rings, int sides);

    /**
     * @brief Wireframe cone with its apex at the origin opening down -Z.
     * @param length   Distance from apex to base circle
     * @param angleRad Half-angle of the cone
     * @param segments Segments of the base circle
     * @param spokes   Lines from apex to the rim
     */
    NodeGeometry wireCone(float length, float angleRad, int segments, int spokes);

    /// Single segment a-b.
    NodeGeometry line(const glm::vec3& a, const glm::vec3& b);

    /// Three unit axis lines scaled to @p length.
    NodeGeometry axes(float length);

    /// Rectangle border in the XY plane, centered.
    NodeGeometry rectOutline(float width, float height);

    /// L-shaped marks at the four corners of a centered width x height rectangle.
    NodeGeometry cornerMarkers(float width, float height, float size);

    /// Two-triangle quad in the XY plane, centered.
    NodeGeometry plane(float width, float height);
} // namespace Primitives
