#include "Viewport.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace
{
    constexpr float kNearPlane = 0.1f;
    constexpr float kFarPlane  = 5000.0f;
    constexpr float kFovDeg    = 45.0f;

    glm::mat4 viewModeRotation(ViewMode mode, const glm::vec3& rot)
    {
        const glm::vec3 xAxis(1.f, 0.f, 0.f);
        const glm::vec3 yAxis(0.f, 1.f, 0.f);

        switch (mode)
        {
            case ViewMode::PERSPECTIVE:
            {
                glm::mat4 m = glm::rotate(glm::mat4(1.0f), glm::radians(rot.y), xAxis);
                return glm::rotate(m, glm::radians(rot.x), yAxis);
            }
            case ViewMode::FRONT:
                return glm::mat4(1.0f);
            case ViewMode::BACK:
                return glm::rotate(glm::mat4(1.0f), glm::radians(180.0f), yAxis);
            case ViewMode::LEFT:
                return glm::rotate(glm::mat4(1.0f), glm::radians(90.0f), yAxis);
            case ViewMode::RIGHT:
                return glm::rotate(glm::mat4(1.0f), glm::radians(-90.0f), yAxis);
            case ViewMode::TOP:
                return glm::rotate(glm::mat4(1.0f), glm::radians(90.0f), xAxis);
            case ViewMode::BOTTOM:
                return glm::rotate(glm::mat4(1.0f), glm::radians(-90.0f), xAxis);
        }
        return glm::mat4(1.0f);
    }
} // namespace

Viewport::Viewport(glm::vec3& pan, glm::vec3& rot, float& dist) :
    m_pan(pan),
    m_rot(rot),
    m_dist(dist),
    m_changeCounter(std::make_shared<SysCounter>())
{
}

void Viewport::resize(int32_t width, int32_t height) noexcept
{
    width  = std::max<int32_t>(0, width);
    height = std::max<int32_t>(0, height);

    if (m_width == width && m_height == height)
        return;

    m_width  = width;
    m_height = height;
    m_changeCounter->change();
}

ViewMode Viewport::viewMode() const noexcept
{
    return m_viewMode;
}

void Viewport::viewMode(ViewMode mode) noexcept
{
    if (m_viewMode == mode)
        return;

    m_viewMode = mode;
    m_changeCounter->change();
}

void Viewport::rotate(float deltaX, float deltaY) noexcept
{
    m_rot.x -= deltaX;
    m_rot.y -= deltaY;
    m_changeCounter->change();
}

glm::vec3 Viewport::project(const glm::vec3& world) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec3(0.0f);

    const glm::vec4 clip = m_matViewProj * glm::vec4(world, 1.0f);
    if (clip.w == 0.0f)
        return glm::vec3(0.0f);

    const glm::vec3 ndc = glm::vec3(clip) / clip.w;

    // ndc.y is already y-down because of the flipped projection.
    const float x = (ndc.x * 0.5f + 0.5f) * static_cast<float>(m_width);
    const float y = (ndc.y * 0.5f + 0.5f) * static_cast<float>(m_height);

    return glm::vec3(x, y, ndc.z);
}

glm::vec3 Viewport::unproject(const glm::vec3& screen) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec3(0.0f);

    const float ndcX = (screen.x / static_cast<float>(m_width)) * 2.0f - 1.0f;
    const float ndcY = (screen.y / static_cast<float>(m_height)) * 2.0f - 1.0f;

    const glm::vec4 worldH = m_matInvViewProj * glm::vec4(ndcX, ndcY, screen.z, 1.0f);
    if (worldH.w == 0.0f)
        return glm::vec3(0.0f);

    return glm::vec3(worldH) / worldH.w;
}

un::ray Viewport::ray(float x, float y) const
{
    const glm::vec3 nearPt = unproject(glm::vec3(x, y, 0.0f));
    const glm::vec3 farPt  = unproject(glm::vec3(x, y, 1.0f));
    return un::make_ray(nearPt, farPt - nearPt);
}

glm::vec3 Viewport::cameraPosition() const
{
    return glm::vec3(glm::inverse(m_matView)[3]);
}

// -----------------------------------------------------------------------------
// apply()
// -----------------------------------------------------------------------------

void Viewport::apply() noexcept
{
    const float w           = static_cast<float>(m_width);
    const float h           = static_cast<float>(m_height);
    const float aspectRatio = (h > 0.0f) ? (w / h) : 1.0f;

    // RH + ZO + Y flip.
    if (m_viewMode == ViewMode::PERSPECTIVE)
    {
        m_matProj = glm::perspectiveRH_ZO(glm::radians(kFovDeg), aspectRatio, kNearPlane, kFarPlane);
    }
    else
    {
        // Ortho extent follows the orbit distance.
        const float halfH = std::max(1e-6f, std::abs(m_dist) * 0.4f);
        const float halfW = halfH * aspectRatio;
        m_matProj         = glm::orthoRH_ZO(-halfW, halfW, -halfH, halfH, kNearPlane, kFarPlane);
    }
    m_matProj[1][1] *= -1.0f;

    m_matView = glm::translate(glm::mat4(1.0f), glm::vec3(0.f, 0.f, m_dist)) *
                viewModeRotation(m_viewMode, m_rot) *
                glm::translate(glm::mat4(1.0f), -m_pan);

    m_matViewProj    = m_matProj * m_matView;
    m_matInvViewProj = glm::inverse(m_matViewProj);
}
