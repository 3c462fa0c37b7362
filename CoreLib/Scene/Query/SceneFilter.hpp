#pragma once

#include <array>
#include <span>
#include <string>
#include <vector>

#include "NodeTypes.hpp"
#include "ObjectCategory.hpp"

class SysNodeGraph;

/**
 * @brief Which nodes a curated view accepts.
 *
 * Built per call site, usually through the presets in namespace filter.
 */
struct FilterQuery
{
    /// Per-category inclusion flags, indexed by ObjectCategory.
    std::array<bool, kObjectCategoryCount> include = {};

    /// Reject nodes that are hidden themselves or through an ancestor.
    bool requireVisible = false;

    /// Accept nodes tagged isLightSelector whatever their category.
    bool includeLightSelectors = false;

    /// Reject nodes tagged hideInOutliner.
    bool honorHideInOutliner = false;

    /// Report nodes that classify as Unknown on std::cerr.
    bool logUnknown = false;

    FilterQuery& with(ObjectCategory c, bool on = true) noexcept
    {
        include[static_cast<std::size_t>(c)] = on;
        return *this;
    }

    [[nodiscard]] bool includes(ObjectCategory c) const noexcept
    {
        return include[static_cast<std::size_t>(c)];
    }
};

struct FilteredNode
{
    NodeId         id       = kInvalidNodeId;
    ObjectCategory category = ObjectCategory::Unknown;
};

/// One outliner line.
struct OutlinerRow
{
    NodeId         id = kInvalidNodeId;
    std::string    label;
    ObjectCategory category = ObjectCategory::Unknown;
    int32_t        depth    = 0;
};

namespace filter
{
    /**
     * @brief Classify @p nodes and keep the ones @p query accepts.
     *
     * Output preserves input order. Dead ids are skipped.
     */
    [[nodiscard]] std::vector<FilteredNode> apply(const SysNodeGraph&   graph,
                                                  std::span<const NodeId> nodes,
                                                  const FilterQuery&    query);

    /// apply() over the whole graph in traversal order.
    [[nodiscard]] std::vector<FilteredNode> applyToScene(const SysNodeGraph& graph, const FilterQuery& query);

    // ------------------------------------------------------------
    // Presets
    // ------------------------------------------------------------

    /**
     * @brief Outliner view.
     *
     * All user categories; helper, grid, light-helper and camera-helper
     * categories only when @p showSystemHelpers is set. Gizmos and transform
     * controls/handles are never listed.
     */
    [[nodiscard]] FilterQuery outliner(bool showSystemHelpers = false) noexcept;

    /// Visible user meshes plus light selectors.
    [[nodiscard]] FilterQuery pickable() noexcept;

    /// User categories and Unknown: everything that is not tooling.
    [[nodiscard]] FilterQuery exportVisible() noexcept;

    /// User meshes only, e.g. for material editing lists.
    [[nodiscard]] FilterQuery userMeshes() noexcept;

    // ------------------------------------------------------------
    // Outliner helpers
    // ------------------------------------------------------------

    /// Node name, or "<Kind> <id>" when the name is empty.
    [[nodiscard]] std::string displayName(const SysNodeGraph& graph, NodeId id);

    /// Outliner rows with depth relative to the nearest listed ancestor.
    [[nodiscard]] std::vector<OutlinerRow> outlinerRows(const SysNodeGraph& graph, bool showSystemHelpers = false);
} // namespace filter
