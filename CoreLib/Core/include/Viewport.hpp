// ============================================================================
// Viewport.hpp  (RH + ZO + projection Y-flip)
// ============================================================================

#pragma once

#include <SysCounter.hpp>
#include <cstdint>
#include <glm/glm.hpp>

#include "CoreTypes.hpp"
#include "CoreUtilities.hpp"

/**
 * @brief Orbit camera of a viewport, reduced to what pointer picking needs.
 *
 * Conventions:
 *  - Right-handed view/projection.
 *  - Clip/NDC Z range is [0, 1] (ZO).
 *  - Projection matrix is Y-flipped so screen space is top-left origin, Y down.
 *
 * Screen coordinates are pixels (origin top-left, y down) with depth in [0,1].
 * Camera state (pan anchor, rotation, distance) is owned by the host and
 * shared by reference.
 */
class Viewport
{
public:
    Viewport() = delete;

    /**
     * @param pan  World-space orbit anchor.
     * @param rot  Rotation in degrees: rot.x yaw, rot.y pitch.
     * @param dist View translation along Z (negative moves the camera back).
     */
    explicit Viewport(glm::vec3& pan, glm::vec3& rot, float& dist);

    /// Clamps to >= 0. A zero-sized viewport projects everything to the origin.
    void resize(int32_t width, int32_t height) noexcept;

    [[nodiscard]] ViewMode viewMode() const noexcept;
    void                   viewMode(ViewMode mode) noexcept;

    /**
     * @brief Orbits by a pointer delta in pixels (one degree per pixel).
     *
     * Used by hosts while a gesture is dragging. Call apply() afterwards.
     */
    void rotate(float deltaX, float deltaY) noexcept;

    /// World point to screen (x, y in pixels, z depth).
    [[nodiscard]] glm::vec3 project(const glm::vec3& world) const noexcept;

    /// Screen point (pixels plus depth) to world. (0,0,0) for an invalid viewport.
    [[nodiscard]] glm::vec3 unproject(const glm::vec3& screen) const noexcept;

    /**
     * @brief World-space picking ray through a pixel.
     *
     * Starts on the near plane and points away from the camera.
     */
    [[nodiscard]] un::ray ray(float x, float y) const;

    [[nodiscard]] glm::vec3 cameraPosition() const;

    [[nodiscard]] int32_t width() const noexcept { return m_width; }
    [[nodiscard]] int32_t height() const noexcept { return m_height; }

    [[nodiscard]] SysCounterPtr changeCounter() noexcept { return m_changeCounter; }

    /**
     * @brief Rebuilds view and projection from the shared camera state.
     *
     * Call after changing pan/rot/dist, view mode or size and before any
     * project/unproject/ray.
     */
    void apply() noexcept;

private:
    ViewMode m_viewMode = ViewMode::PERSPECTIVE;
    int32_t  m_width    = 0;
    int32_t  m_height   = 0;

    glm::vec3& m_pan;
    glm::vec3& m_rot;
    float&     m_dist;

    glm::mat4 m_matProj        = glm::mat4(1.0f);
    glm::mat4 m_matView        = glm::mat4(1.0f);
    glm::mat4 m_matViewProj    = glm::mat4(1.0f);
    glm::mat4 m_matInvViewProj = glm::mat4(1.0f);

    SysCounterPtr m_changeCounter = {};
};
