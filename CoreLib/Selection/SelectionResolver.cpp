#include "SelectionResolver.hpp"

#include <cmath>
#include <vector>

#include "CoreUtilities.hpp"
#include "SceneFilter.hpp"
#include "SceneQuery.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"
#include "Viewport.hpp"

SelectionResolver::SelectionResolver(const SysNodeGraph& graph, SceneQuery& query, const SelectionSettings& settings) :
    m_graph{graph},
    m_query{query},
    m_settings{settings}
{
}

void SelectionResolver::pointerDown(const CoreEvent& event) noexcept
{
    m_state  = PointerState::Pressed;
    m_pressX = event.x;
    m_pressY = event.y;
}

void SelectionResolver::pointerMove(const CoreEvent& event) noexcept
{
    if (m_state != PointerState::Pressed)
        return;

    const float dx = event.x - m_pressX;
    const float dy = event.y - m_pressY;
    if (std::sqrt(dx * dx + dy * dy) > m_settings.dragThresholdPx)
        m_state = PointerState::Dragging;
}

SelectionChange SelectionResolver::pointerUp(const Viewport& vp, const CoreEvent& event)
{
    const PointerState prev = m_state;
    m_state                 = PointerState::Idle;

    if (prev != PointerState::Pressed)
        return SelectionChange{false, m_selection, m_selection};

    const un::ray ray = vp.ray(event.x, event.y);
    return select(resolve(ray));
}

void SelectionResolver::pointerCancel() noexcept
{
    m_state = PointerState::Idle;
}

Selection SelectionResolver::resolve(const un::ray& ray, std::span<const NodeId> pickable)
{
    const NodeHit hit = m_query.queryNearest(m_graph, pickable, ray);
    if (!hit.valid())
        return Selection::none();

    const SysNode* n = m_graph.node(hit.node);
    if (!n)
        return Selection::none();

    const NodeAttributes& attrs = n->attributes();
    if (attrs.flag(tags::kIsLightSelector))
    {
        if (auto id = attrs.integer(tags::kLightId))
            return Selection::ofLight(static_cast<LightId>(*id), hit.node);
    }

    return Selection::ofNode(hit.node);
}

Selection SelectionResolver::resolve(const un::ray& ray)
{
    const std::vector<FilteredNode> nodes = filter::applyToScene(m_graph, filter::pickable());

    std::vector<NodeId> ids;
    ids.reserve(nodes.size());
    for (const FilteredNode& f : nodes)
        ids.push_back(f.id);

    return resolve(ray, ids);
}

SelectionChange SelectionResolver::select(const Selection& next) noexcept
{
    SelectionChange change = {};
    change.previous        = m_selection;
    change.current         = next;
    change.changed         = !m_selection.sameTarget(next);

    m_selection = next;
    return change;
}

SelectionChange SelectionResolver::clear() noexcept
{
    return select(Selection::none());
}
