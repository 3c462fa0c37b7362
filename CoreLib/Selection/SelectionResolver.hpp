#pragma once

#include <span>

#include "CoreTypes.hpp"
#include "Light.hpp"
#include "NodeTypes.hpp"
#include "SelectionSettings.hpp"

class SceneQuery;
class SysNodeGraph;
class Viewport;

namespace un
{
    struct ray;
} // namespace un

/**
 * @brief What the user has selected: nothing, a node, or a managed light.
 */
struct Selection
{
    enum class Kind
    {
        None,
        Node,
        Light
    };

    Kind    kind  = Kind::None;
    NodeId  node  = kInvalidNodeId;  ///< Hit node (for a light: the selector that was hit)
    LightId light = kInvalidLightId; ///< Set for Kind::Light

    [[nodiscard]] static Selection none() noexcept { return {}; }

    [[nodiscard]] static Selection ofNode(NodeId id) noexcept
    {
        return Selection{Kind::Node, id, kInvalidLightId};
    }

    [[nodiscard]] static Selection ofLight(LightId id, NodeId selector) noexcept
    {
        return Selection{Kind::Light, selector, id};
    }

    [[nodiscard]] bool empty() const noexcept { return kind == Kind::None; }

    /// Same target. A light is the same light whichever selector was hit.
    [[nodiscard]] bool sameTarget(const Selection& o) const noexcept
    {
        if (kind != o.kind)
            return false;
        if (kind == Kind::Light)
            return light == o.light;
        return node == o.node;
    }
};

struct SelectionChange
{
    bool      changed = false;
    Selection previous;
    Selection current;
};

enum class PointerState
{
    Idle,
    Pressed,
    Dragging
};

/**
 * @class SelectionResolver
 * @brief Turns pointer gestures into selection changes.
 *
 * Idle -> Pressed on pointer down. Moving further than the drag threshold
 * while pressed turns the gesture into a drag (camera orbit); releasing a
 * drag never changes the selection. Releasing a press casts a ray through the
 * release point against the pickable set and selects the nearest hit.
 *
 * A hit on a light selector (helper selector sphere or area proxy) selects the
 * light it belongs to, not the node.
 */
class SelectionResolver final
{
public:
    SelectionResolver(const SysNodeGraph& graph, SceneQuery& query, const SelectionSettings& settings = {});

    void pointerDown(const CoreEvent& event) noexcept;
    void pointerMove(const CoreEvent& event) noexcept;

    /**
     * @brief Ends the gesture.
     *
     * Only a release from Pressed resolves a pick, using the viewport ray at
     * the release point.
     */
    SelectionChange pointerUp(const Viewport& vp, const CoreEvent& event);

    /// Abandons the gesture without touching the selection.
    void pointerCancel() noexcept;

    /**
     * @brief Nearest hit among @p pickable along @p ray.
     *
     * Ties keep the node that comes first in @p pickable. Does not change the
     * current selection.
     */
    [[nodiscard]] Selection resolve(const un::ray& ray, std::span<const NodeId> pickable);

    /// resolve() against the pickable preset of the whole scene.
    [[nodiscard]] Selection resolve(const un::ray& ray);

    /// Replaces the current selection.
    SelectionChange select(const Selection& next) noexcept;

    SelectionChange clear() noexcept;

    [[nodiscard]] const Selection& selection() const noexcept { return m_selection; }
    [[nodiscard]] PointerState     state() const noexcept { return m_state; }

private:
    const SysNodeGraph& m_graph;
    SceneQuery&         m_query;
    SelectionSettings   m_settings;

    PointerState m_state   = PointerState::Idle;
    float        m_pressX  = 0.0f;
    float        m_pressY  = 0.0f;
    Selection    m_selection;
};
