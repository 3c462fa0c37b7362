#pragma once

#include <string_view>

/**
 * @brief Attribute keys used to mark editor tooling on scene nodes.
 *
 * Attributes are authoritative for classification and beat any name
 * heuristic, so every node the editor creates for itself carries at least
 * one of these.
 */
namespace tags
{
    constexpr std::string_view kIsSystemObject     = "isSystemObject";
    constexpr std::string_view kIsHelper           = "isHelper";
    constexpr std::string_view kIsLightHelper      = "isLightHelper";
    constexpr std::string_view kLightId            = "lightId";
    constexpr std::string_view kIsTransformControl = "isTransformControl";
    constexpr std::string_view kIsGizmo            = "isGizmo";
    constexpr std::string_view kIsTransformHandle  = "isTransformHandle";

    /// Pickable stand-in for a light; resolves to the light given by kLightId.
    constexpr std::string_view kIsLightSelector = "isLightSelector";

    /// Emissive plane that gives an area light a visible surface.
    constexpr std::string_view kIsLightProxy = "isLightProxy";

    constexpr std::string_view kHideInOutliner = "hideInOutliner";
    constexpr std::string_view kHideInRender   = "hideInRender";

    /// Stays visible in clean renders even though it is tooling.
    constexpr std::string_view kKeepInRender = "keepInRender";
} // namespace tags
