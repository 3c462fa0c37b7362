//============================================================
// LightBundle.cpp
//============================================================
#include "LightBundle.hpp"

#include <algorithm>
#include <exception>

#include "HelperPrimitives.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"

namespace
{
    const char* engineTypeName(LightKind kind) noexcept
    {
        switch (kind)
        {
            case LightKind::Ambient:
                return "AmbientLight";
            case LightKind::Directional:
                return "DirectionalLight";
            case LightKind::Point:
                return "PointLight";
            case LightKind::Spot:
                return "SpotLight";
            case LightKind::Area:
                return "RectAreaLight";
        }
        return "Light";
    }

    void setVisible(SysNodeGraph& graph, NodeId id, bool visible)
    {
        if (SysNode* n = graph.node(id))
            n->visible(visible);
    }

    void setTransform(SysNodeGraph& graph, NodeId id, const NodeTransform& xf)
    {
        if (SysNode* n = graph.node(id))
            n->transform(xf);
    }

    void followParent(SysNodeGraph& graph, NodeId id, NodeId parent)
    {
        const SysNode* n = graph.node(id);
        if (n && n->parent() != parent)
            graph.reparent(id, parent);
    }
} // namespace

LightBundle::LightBundle(LightId id, LightKind kind, std::string name, const LightProperties& props, const LightVisualSettings& settings) :
    m_id{id},
    m_kind{kind},
    m_name{std::move(name)},
    m_props{props},
    m_settings{settings}
{
}

HelperContext LightBundle::context() const noexcept
{
    return HelperContext{m_id, m_name, m_props, m_settings};
}

NodeTransform LightBundle::placement() const noexcept
{
    NodeTransform xf = {};
    xf.position      = m_props.position;
    xf.rotation      = m_props.rotation;
    return xf;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

bool LightBundle::buildLight(SysNodeGraph& graph)
{
    m_lightNode = graph.createNode(m_name, NodeKind::Light);
    SysNode* n  = graph.node(m_lightNode);
    if (!n)
        return false;

    m_lightUid = n->uid();
    n->typeName(engineTypeName(m_kind));
    n->transform(placement());
    n->visible(m_visible);
    applyLightData(graph);
    return true;
}

bool LightBundle::buildHelper(SysNodeGraph& graph, std::unique_ptr<LightHelperBuilder> builder, std::string& error)
{
    if (!builder)
    {
        error = std::string("no helper builder registered for '") + kindKey(m_kind) + "'";
        markPartial();
        return false;
    }

    HelperParts parts;
    bool        ok = false;
    try
    {
        ok = builder->build(graph, context(), parts);
        if (!ok)
            error = "helper geometry could not be created";
    }
    catch (const std::exception& e)
    {
        error = e.what();
        ok    = false;
    }

    if (ok && !graph.valid(parts.root))
    {
        error = "helper builder reported success without a root";
        ok    = false;
    }

    if (!ok)
    {
        if (parts.root != kInvalidNodeId)
            graph.destroyNode(parts.root);
        markPartial();
        return false;
    }

    m_helper    = std::move(parts);
    m_helperUid = graph.node(m_helper.root)->uid();
    m_builder   = std::move(builder);

    setTransform(graph, m_helper.root, placement());
    setVisible(graph, m_helper.root, m_visible);
    applyHelperLook(graph);
    return true;
}

bool LightBundle::buildProxy(SysNodeGraph& graph, std::string& error)
{
    const NodeId id = graph.createNode(m_name + " Emitter", NodeKind::Mesh);
    SysNode*     n  = graph.node(id);
    if (!n)
    {
        error = "proxy node could not be created";
        markPartial();
        return false;
    }

    NodeAttributes& attrs = n->editAttributes();
    attrs.set(std::string(tags::kIsLightProxy), true);
    attrs.set(std::string(tags::kIsLightSelector), true);
    attrs.set(std::string(tags::kKeepInRender), true);
    attrs.set(std::string(tags::kHideInOutliner), true);
    attrs.set(std::string(tags::kLightId), static_cast<int64_t>(m_id));

    if (!graph.setGeometry(id, Primitives::plane(m_props.width, m_props.height)))
    {
        graph.destroyNode(id);
        error = "proxy geometry could not be created";
        markPartial();
        return false;
    }

    m_proxyNode = id;
    m_proxyUid  = n->uid();
    n->material(NodeMaterial{});
    n->transform(placement());
    n->visible(m_visible);
    applyProxyLook(graph);
    return true;
}

// ------------------------------------------------------------
// Appearance
// ------------------------------------------------------------

void LightBundle::applyLightData(SysNodeGraph& graph) const
{
    SysNode* n = graph.node(m_lightNode);
    if (!n)
        return;

    NodeLightData data = {};
    data.type          = engineLightType(m_kind);
    data.color         = m_props.color;
    data.intensity     = m_props.intensity;
    data.distance      = m_props.distance;
    data.decay         = m_props.decay;
    data.angle         = m_props.angle;
    data.penumbra      = m_props.penumbra;
    data.width         = m_props.width;
    data.height        = m_props.height;
    data.castShadow    = (m_kind == LightKind::Directional || m_kind == LightKind::Spot);
    n->light(data);
}

void LightBundle::applyHelperLook(SysNodeGraph& graph) const
{
    if (m_helper.root == kInvalidNodeId)
        return;

    const LightVisualSettings& s = m_settings;

    const float opacity = std::clamp(m_props.intensity * s.helperOpacityGain, s.helperOpacityMin, s.helperOpacityMax);
    const float scale   = std::clamp(s.helperScaleBase + m_props.intensity * s.helperScaleGain, s.helperScaleMin, s.helperScaleMax);

    for (NodeId id : m_helper.parts())
    {
        SysNode* n = graph.node(id);
        if (!n)
            continue;

        if (NodeMaterial* mat = n->material())
        {
            mat->color       = m_props.color;
            mat->opacity     = opacity;
            mat->transparent = true;
            n->touch();
        }
    }

    for (NodeId id : m_helper.icons)
    {
        if (SysNode* n = graph.node(id))
            n->scale(glm::vec3(scale));
    }
}

void LightBundle::applyProxyLook(SysNodeGraph& graph) const
{
    SysNode* n = graph.node(m_proxyNode);
    if (!n)
        return;

    NodeMaterial* mat = n->material();
    if (!mat)
        return;

    mat->color             = m_props.color;
    mat->emissive          = m_props.color;
    mat->emissiveIntensity = std::clamp(m_props.intensity * m_settings.emissiveGain, 0.0f, m_settings.emissiveMax);
    mat->opacity           = m_settings.proxyOpacity;
    mat->transparent       = true;
    mat->doubleSided       = true;
    n->touch();
}

// ------------------------------------------------------------
// Mutation entry points
// ------------------------------------------------------------

void LightBundle::applyColor(SysNodeGraph& graph, const glm::vec3& color)
{
    dropStaleMembers(graph);

    m_props.color = color;
    applyLightData(graph);
    applyHelperLook(graph);
    applyProxyLook(graph);
}

void LightBundle::applyIntensity(SysNodeGraph& graph, float intensity)
{
    dropStaleMembers(graph);

    m_props.intensity = intensity;
    applyLightData(graph);
    applyHelperLook(graph);
    applyProxyLook(graph);
}

void LightBundle::applyTransform(SysNodeGraph& graph, const glm::vec3& position, const glm::vec3& rotation)
{
    dropStaleMembers(graph);

    m_props.position = position;
    m_props.rotation = rotation;

    const NodeTransform xf = placement();
    setTransform(graph, m_lightNode, xf);
    setTransform(graph, m_helper.root, xf);
    setTransform(graph, m_proxyNode, xf);
}

void LightBundle::applyVisibility(SysNodeGraph& graph, bool visible)
{
    dropStaleMembers(graph);

    m_visible = visible;
    setVisible(graph, m_lightNode, visible);
    setVisible(graph, m_helper.root, visible);
    setVisible(graph, m_proxyNode, visible);
}

void LightBundle::applyAttenuation(SysNodeGraph& graph, float decay, float penumbra)
{
    dropStaleMembers(graph);

    m_props.decay    = decay;
    m_props.penumbra = penumbra;
    applyLightData(graph);
}

bool LightBundle::applyShape(SysNodeGraph& graph, const LightProperties& next)
{
    dropStaleMembers(graph);

    m_props.distance = next.distance;
    m_props.angle    = next.angle;
    m_props.width    = next.width;
    m_props.height   = next.height;
    applyLightData(graph);

    bool ok = true;
    if (m_builder && m_helper.root != kInvalidNodeId)
    {
        try
        {
            ok = m_builder->rebuild(graph, context(), m_helper);
        }
        catch (const std::exception&)
        {
            ok = false;
        }
    }

    if (m_proxyNode != kInvalidNodeId)
        ok = graph.setGeometry(m_proxyNode, Primitives::plane(m_props.width, m_props.height)) && ok;

    return ok;
}

void LightBundle::rename(SysNodeGraph& graph, std::string_view name)
{
    dropStaleMembers(graph);

    m_name = std::string(name);
    if (SysNode* n = graph.node(m_lightNode))
        n->name(m_name);
    if (SysNode* n = graph.node(m_helper.root))
        n->name(m_name + " Helper");
    if (SysNode* n = graph.node(m_proxyNode))
        n->name(m_name + " Emitter");
}

void LightBundle::sync(SysNodeGraph& graph)
{
    dropStaleMembers(graph);

    const SysNode* n = graph.node(m_lightNode);
    if (!n)
        return;

    // Same parent first, so equal local placement means equal world placement.
    followParent(graph, m_helper.root, n->parent());
    followParent(graph, m_proxyNode, n->parent());

    const NodeTransform& xf = n->transform();
    if (xf.position != m_props.position || xf.rotation != m_props.rotation)
        applyTransform(graph, xf.position, xf.rotation);
    else
    {
        // Members may have drifted individually; placement() is authoritative.
        setTransform(graph, m_helper.root, placement());
        setTransform(graph, m_proxyNode, placement());
    }

    if (n->visible() != m_visible)
        applyVisibility(graph, n->visible());
    else
    {
        setVisible(graph, m_helper.root, m_visible);
        setVisible(graph, m_proxyNode, m_visible);
    }
}

void LightBundle::destroy(SysNodeGraph& graph)
{
    dropStaleMembers(graph);

    if (m_proxyNode != kInvalidNodeId)
        graph.destroyNode(m_proxyNode);
    if (m_helper.root != kInvalidNodeId)
        graph.destroyNode(m_helper.root);
    if (m_lightNode != kInvalidNodeId)
        graph.destroyNode(m_lightNode);

    m_proxyNode = kInvalidNodeId;
    m_lightNode = kInvalidNodeId;
    m_helper    = {};
    m_builder.reset();
}

void LightBundle::dropStaleMembers(const SysNodeGraph& graph)
{
    if (m_lightNode != kInvalidNodeId && !graph.alive(m_lightNode, m_lightUid))
    {
        m_lightNode = kInvalidNodeId;
        markPartial();
    }

    if (m_proxyNode != kInvalidNodeId && !graph.alive(m_proxyNode, m_proxyUid))
    {
        m_proxyNode = kInvalidNodeId;
        markPartial();
    }

    if (m_helper.root == kInvalidNodeId)
        return;

    if (!graph.alive(m_helper.root, m_helperUid))
    {
        m_helper = {};
        m_builder.reset();
        markPartial();
        return;
    }

    for (NodeId* part : {&m_helper.range, &m_helper.body, &m_helper.markers, &m_helper.direction, &m_helper.selector})
    {
        if (*part != kInvalidNodeId && !isHelperPart(graph, *part))
        {
            *part = kInvalidNodeId;
            markPartial();
        }
    }

    auto& icons = m_helper.icons;
    icons.erase(std::remove_if(icons.begin(), icons.end(), [&](NodeId id) { return !isHelperPart(graph, id); }), icons.end());
}

bool LightBundle::isHelperPart(const SysNodeGraph& graph, NodeId id) const
{
    // Parts are direct children of the root; a recycled slot lands elsewhere.
    const SysNode* n = graph.node(id);
    return n && n->parent() == m_helper.root;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

bool LightBundle::owns(const SysNodeGraph& graph, NodeId node) const
{
    if (node == kInvalidNodeId || !graph.valid(node))
        return false;

    if (node == m_lightNode)
        return graph.alive(node, m_lightUid);
    if (node == m_proxyNode)
        return graph.alive(node, m_proxyUid);

    if (m_helper.root == kInvalidNodeId || !graph.alive(m_helper.root, m_helperUid))
        return false;
    if (node == m_helper.root)
        return true;

    const std::vector<NodeId> up = graph.ancestors(node);
    return std::find(up.begin(), up.end(), m_helper.root) != up.end();
}

ManagedLight LightBundle::snapshot(const SysNodeGraph& graph) const
{
    ManagedLight m = {};
    m.id           = m_id;
    m.name         = m_name;
    m.kind         = m_kind;
    m.properties   = m_props;
    m.visible      = m_visible;
    m.lightNode    = graph.alive(m_lightNode, m_lightUid) ? m_lightNode : kInvalidNodeId;
    m.helperNode   = graph.alive(m_helper.root, m_helperUid) ? m_helper.root : kInvalidNodeId;
    m.proxyNode    = graph.alive(m_proxyNode, m_proxyUid) ? m_proxyNode : kInvalidNodeId;
    m.partial      = m_partial || m.lightNode != m_lightNode || m.helperNode != m_helper.root || m.proxyNode != m_proxyNode;

    if (const SysNode* n = graph.node(m.lightNode))
        m.lightTransform = n->transform();

    if (const SysNode* n = graph.node(m.helperNode))
    {
        m.helperTransform = n->transform();
        m.helperVisible   = n->visible();
    }

    if (const SysNode* n = graph.node(m.proxyNode))
    {
        m.proxyTransform = n->transform();
        m.proxyVisible   = n->visible();
    }

    return m;
}
