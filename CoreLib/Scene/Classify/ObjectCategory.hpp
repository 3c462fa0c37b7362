#pragma once

#include <array>
#include <cstdint>

/**
 * @brief What a scene node is from the editor's point of view.
 *
 * User categories are content the user placed in the scene. Every other
 * category is tooling the editor adds for itself and must never appear in
 * curated views (outliner, picking, export).
 */
enum class ObjectCategory : uint8_t
{
    UserMesh,
    UserLight,
    UserCamera,
    UserGroup,
    SystemHelper,
    SystemGizmo,
    SystemGrid,
    SystemLightHelper,
    SystemCameraHelper,
    TransformControl,
    TransformHandle,
    Unknown
};

constexpr std::size_t kObjectCategoryCount = static_cast<std::size_t>(ObjectCategory::Unknown) + 1;

constexpr std::array<ObjectCategory, kObjectCategoryCount> kAllObjectCategories = {
    ObjectCategory::UserMesh,
    ObjectCategory::UserLight,
    ObjectCategory::UserCamera,
    ObjectCategory::UserGroup,
    ObjectCategory::SystemHelper,
    ObjectCategory::SystemGizmo,
    ObjectCategory::SystemGrid,
    ObjectCategory::SystemLightHelper,
    ObjectCategory::SystemCameraHelper,
    ObjectCategory::TransformControl,
    ObjectCategory::TransformHandle,
    ObjectCategory::Unknown,
};

[[nodiscard]] constexpr bool isUserCategory(ObjectCategory c) noexcept
{
    return c == ObjectCategory::UserMesh || c == ObjectCategory::UserLight ||
           c == ObjectCategory::UserCamera || c == ObjectCategory::UserGroup;
}

/// Editor tooling of any sort. Unknown is neither user nor system.
[[nodiscard]] constexpr bool isSystemCategory(ObjectCategory c) noexcept
{
    return !isUserCategory(c) && c != ObjectCategory::Unknown;
}

[[nodiscard]] constexpr const char* toString(ObjectCategory c) noexcept
{
    switch (c)
    {
        case ObjectCategory::UserMesh:
            return "user-mesh";
        case ObjectCategory::UserLight:
            return "user-light";
        case ObjectCategory::UserCamera:
            return "user-camera";
        case ObjectCategory::UserGroup:
            return "user-group";
        case ObjectCategory::SystemHelper:
            return "system-helper";
        case ObjectCategory::SystemGizmo:
            return "system-gizmo";
        case ObjectCategory::SystemGrid:
            return "system-grid";
        case ObjectCategory::SystemLightHelper:
            return "system-light-helper";
        case ObjectCategory::SystemCameraHelper:
            return "system-camera-helper";
        case ObjectCategory::TransformControl:
            return "transform-control";
        case ObjectCategory::TransformHandle:
            return "transform-handle";
        case ObjectCategory::Unknown:
            return "unknown";
    }
    return "unknown";
}
