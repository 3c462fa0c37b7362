//============================================================
// LightLinks.hpp
//============================================================
#pragma once

#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "Light.hpp"
#include "NodeTypes.hpp"

/**
 * @brief Whether and how strongly a light affects one mesh.
 */
struct LightLink
{
    bool  enabled   = true;
    float influence = 1.0f; // [0, 1]
};

struct LightLinkEntry
{
    LightId   light = kInvalidLightId;
    NodeId    mesh  = kInvalidNodeId;
    LightLink link;
};

/**
 * @brief Sparse per (light, mesh) link overrides.
 *
 * A pair with no entry is linked with full influence. The light registry
 * calls removeLight() when a light goes away.
 */
class LightLinkTable final
{
public:
    /// Stores the link, clamping influence into [0, 1]. False for invalid ids.
    bool set(LightId light, NodeId mesh, const LightLink& link);

    [[nodiscard]] std::optional<LightLink> get(LightId light, NodeId mesh) const;

    bool remove(LightId light, NodeId mesh);

    void enableForAll(LightId light, std::span<const NodeId> meshes);
    void disableForAll(LightId light, std::span<const NodeId> meshes);

    void enableAllLights(NodeId mesh, std::span<const LightId> lights);
    void disableAllLights(NodeId mesh, std::span<const LightId> lights);

    /// Drops every entry of @p light. Returns the number removed.
    std::size_t removeLight(LightId light);

    /// Drops every entry of @p mesh. Returns the number removed.
    std::size_t removeMesh(NodeId mesh);

    /// True when @p light illuminates @p mesh (enabled and influence > 0).
    [[nodiscard]] bool affects(LightId light, NodeId mesh) const;

    /// Every entry ordered by (light, mesh).
    [[nodiscard]] std::vector<LightLinkEntry> all() const;

    void clear() noexcept { m_links.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return m_links.size(); }

private:
    void setEnabled(LightId light, NodeId mesh, bool enabled);

    std::map<std::pair<LightId, NodeId>, LightLink> m_links;
};
