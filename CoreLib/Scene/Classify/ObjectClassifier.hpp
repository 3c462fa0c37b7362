#pragma once

#include "NodeTypes.hpp"
#include "ObjectCategory.hpp"

class SysNodeGraph;

/**
 * @brief Decides whether a node is user content or editor tooling.
 *
 * The result is a pure function of the node, its attributes, its name, its
 * type tag and its ancestors. Nothing is cached: the graph is mutable and a
 * stale category would leak tooling into curated views.
 *
 * Rules are tried in order and the first match wins:
 *  1. attribute hints on the node itself,
 *  2. a transform-control ancestor,
 *  3. known helper type names,
 *  4. exact axis-handle names (x, xy, xyz, e, start, end, ...),
 *  5. whole-word name patterns (helper, gizmo, grid, ...),
 *  6. the structural kind tag (with payload inspection for untagged nodes).
 * Anything left is ObjectCategory::Unknown.
 */
namespace classifier
{
    /**
     * @brief Classify a single node.
     * @return Unknown for dead ids. Never throws.
     */
    [[nodiscard]] ObjectCategory classify(const SysNodeGraph& graph, NodeId id) noexcept;

    /// True for user-mesh/light/camera/group.
    [[nodiscard]] bool isUserContent(const SysNodeGraph& graph, NodeId id) noexcept;

    /// True for every tooling category. Unknown is not a system object.
    [[nodiscard]] bool isSystemObject(const SysNodeGraph& graph, NodeId id) noexcept;
} // namespace classifier
