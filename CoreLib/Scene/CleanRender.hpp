//============================================================
// CleanRender.hpp
//============================================================
#pragma once

#include <functional>
#include <vector>

#include "NodeTypes.hpp"

class SysNodeGraph;

/// @brief RAII scope that hides everything a final render must not show.
///
/// Usage:
/// {
///     CleanRenderScope clean(graph);
///     renderer.render(graph);
/// }
///
/// On construction every visible node outside the exportVisible() preset, or
/// tagged hideInRender, is hidden unless it carries keepInRender (emissive
/// light proxies). The destructor makes every node it hid visible again,
/// even with early returns or exceptions. Nodes destroyed in between are
/// skipped.
class CleanRenderScope
{
public:
    explicit CleanRenderScope(SysNodeGraph& graph);
    ~CleanRenderScope();

    CleanRenderScope(const CleanRenderScope&)            = delete;
    CleanRenderScope& operator=(const CleanRenderScope&) = delete;

    /// Nodes hidden by this scope, in traversal order.
    [[nodiscard]] const std::vector<NodeId>& hidden() const noexcept { return m_hidden; }

private:
    SysNodeGraph&       m_graph;
    std::vector<NodeId> m_hidden;
};

/**
 * @brief Runs @p render inside a CleanRenderScope.
 *
 * An exception thrown by @p render is logged and reported as false.
 * Visibility is restored in every case.
 */
bool renderClean(SysNodeGraph& graph, const std::function<void(const SysNodeGraph&)>& render);
