//=============================================================================
// LightHelperBuilders.cpp
//=============================================================================
#include "LightHelperBuilders.hpp"

#include <string>

#include "HelperPrimitives.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"

namespace
{
    void tagHelperNode(SysNode& n, LightId lightId)
    {
        NodeAttributes& attrs = n.editAttributes();
        attrs.set(std::string(tags::kIsLightHelper), true);
        attrs.set(std::string(tags::kLightId), static_cast<int64_t>(lightId));
        attrs.set(std::string(tags::kHideInOutliner), true);
    }

    void markSelector(SysNodeGraph& graph, NodeId id)
    {
        if (SysNode* n = graph.node(id))
            n->editAttributes().set(std::string(tags::kIsLightSelector), true);
    }

    bool replaceGeometry(SysNodeGraph& graph, NodeId id, NodeGeometry geometry)
    {
        if (id == kInvalidNodeId)
            return true;
        return graph.setGeometry(id, std::move(geometry));
    }

    NodeGeometry selectorGeometry(const HelperContext& ctx)
    {
        return Primitives::solidSphere(ctx.settings.selectorRadius, ctx.settings.selectorRings, ctx.settings.selectorSides);
    }

    NodeGeometry directionGeometry(const HelperContext& ctx)
    {
        return Primitives::line(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -ctx.settings.directionLength));
    }
} // namespace

std::vector<NodeId> HelperParts::parts() const
{
    std::vector<NodeId> out;
    for (NodeId id : {range, body, markers, direction, selector})
    {
        if (id != kInvalidNodeId)
            out.push_back(id);
    }
    return out;
}

// ------------------------------------------------------------
// LightHelperBuilder
// ------------------------------------------------------------

NodeId LightHelperBuilder::makeRoot(SysNodeGraph& graph, const HelperContext& ctx, std::string_view typeName)
{
    const NodeId root = graph.createNode(std::string(ctx.name) + " Helper", NodeKind::Group);
    if (SysNode* n = graph.node(root))
    {
        n->typeName(typeName);
        tagHelperNode(*n, ctx.lightId);
    }
    return root;
}

NodeId LightHelperBuilder::makePart(SysNodeGraph&        graph,
                                    const HelperContext& ctx,
                                    NodeId               root,
                                    std::string_view     suffix,
                                    NodeGeometry         geometry)
{
    const bool lines = geometry.primitive == PrimitiveType::Lines;

    const NodeId id = graph.createNode(std::string(ctx.name) + " " + std::string(suffix), NodeKind::Mesh, root);
    SysNode*     n  = graph.node(id);
    if (!n)
        return kInvalidNodeId;

    tagHelperNode(*n, ctx.lightId);

    NodeMaterial mat = {};
    mat.color        = ctx.props.color;
    mat.wireframe    = lines;
    mat.transparent  = true;
    n->material(mat);

    if (!graph.setGeometry(id, std::move(geometry)))
        return kInvalidNodeId;

    return id;
}

float LightHelperBuilder::shownRange(const HelperContext& ctx) noexcept
{
    return ctx.props.distance > 0.0f ? ctx.props.distance : ctx.settings.infiniteRangeIndicator;
}

// ------------------------------------------------------------
// Point: wireframe range sphere + solid selector sphere
// ------------------------------------------------------------

bool PointHelperBuilder::build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out)
{
    out.root = makeRoot(graph, ctx, "PointLightHelper");
    if (out.root == kInvalidNodeId)
        return false;

    out.range = makePart(graph, ctx, out.root, "Range", Primitives::wireSphere(shownRange(ctx), ctx.settings.rangeSegments));
    if (out.range == kInvalidNodeId)
        return false;

    out.selector = makePart(graph, ctx, out.root, "Selector", selectorGeometry(ctx));
    if (out.selector == kInvalidNodeId)
        return false;

    markSelector(graph, out.selector);
    out.icons = {out.selector};
    return true;
}

bool PointHelperBuilder::rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts)
{
    return replaceGeometry(graph, parts.range, Primitives::wireSphere(shownRange(ctx), ctx.settings.rangeSegments));
}

// ------------------------------------------------------------
// Spot: cone + direction line + selector
// ------------------------------------------------------------

bool SpotHelperBuilder::build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out)
{
    out.root = makeRoot(graph, ctx, "SpotLightHelper");
    if (out.root == kInvalidNodeId)
        return false;

    out.range = makePart(graph, ctx, out.root, "Cone", Primitives::wireCone(shownRange(ctx), ctx.props.angle, ctx.settings.coneSegments, ctx.settings.coneSpokes));
    if (out.range == kInvalidNodeId)
        return false;

    out.direction = makePart(graph, ctx, out.root, "Direction", directionGeometry(ctx));
    if (out.direction == kInvalidNodeId)
        return false;

    out.selector = makePart(graph, ctx, out.root, "Selector", selectorGeometry(ctx));
    if (out.selector == kInvalidNodeId)
        return false;

    markSelector(graph, out.selector);
    out.icons = {out.selector, out.direction};
    return true;
}

bool SpotHelperBuilder::rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts)
{
    return replaceGeometry(graph, parts.range, Primitives::wireCone(shownRange(ctx), ctx.props.angle, ctx.settings.coneSegments, ctx.settings.coneSpokes));
}

// ------------------------------------------------------------
// Directional: axis helper + direction line + selector
// ------------------------------------------------------------

bool DirectionalHelperBuilder::build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out)
{
    out.root = makeRoot(graph, ctx, "DirectionalLightHelper");
    if (out.root == kInvalidNodeId)
        return false;

    out.body = makePart(graph, ctx, out.root, "Axes", Primitives::axes(ctx.settings.axesLength));
    if (out.body == kInvalidNodeId)
        return false;

    out.direction = makePart(graph, ctx, out.root, "Direction", directionGeometry(ctx));
    if (out.direction == kInvalidNodeId)
        return false;

    out.selector = makePart(graph, ctx, out.root, "Selector", selectorGeometry(ctx));
    if (out.selector == kInvalidNodeId)
        return false;

    markSelector(graph, out.selector);
    out.icons = {out.body, out.direction, out.selector};
    return true;
}

bool DirectionalHelperBuilder::rebuild(SysNodeGraph& /*graph*/, const HelperContext& /*ctx*/, const HelperParts& /*parts*/)
{
    // Nothing size-dependent.
    return true;
}

// ------------------------------------------------------------
// Area: bordered plane + corner markers
// ------------------------------------------------------------

bool AreaHelperBuilder::build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out)
{
    out.root = makeRoot(graph, ctx, "RectAreaLightHelper");
    if (out.root == kInvalidNodeId)
        return false;

    out.body = makePart(graph, ctx, out.root, "Outline", Primitives::rectOutline(ctx.props.width, ctx.props.height));
    if (out.body == kInvalidNodeId)
        return false;

    out.markers = makePart(graph, ctx, out.root, "Corners", Primitives::cornerMarkers(ctx.props.width, ctx.props.height, ctx.settings.cornerMarkerSize));
    if (out.markers == kInvalidNodeId)
        return false;

    out.direction = makePart(graph, ctx, out.root, "Direction", directionGeometry(ctx));
    if (out.direction == kInvalidNodeId)
        return false;

    out.icons = {out.direction};
    return true;
}

bool AreaHelperBuilder::rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts)
{
    const bool outline = replaceGeometry(graph, parts.body, Primitives::rectOutline(ctx.props.width, ctx.props.height));
    const bool corners = replaceGeometry(graph, parts.markers, Primitives::cornerMarkers(ctx.props.width, ctx.props.height, ctx.settings.cornerMarkerSize));
    return outline && corners;
}
