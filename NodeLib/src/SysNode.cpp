#include "SysNode.hpp"

SysNode::SysNode(NodeId id, uint64_t uid, std::string_view name, NodeKind kind) :
    m_id{id},
    m_uid{uid},
    m_name{name},
    m_kind{kind},
    m_changeCounter{std::make_shared<SysCounter>()}
{
}

NodeId SysNode::id() const noexcept
{
    return m_id;
}

uint64_t SysNode::uid() const noexcept
{
    return m_uid;
}

const std::string& SysNode::name() const noexcept
{
    return m_name;
}

void SysNode::name(std::string_view name)
{
    if (m_name == name)
        return;

    m_name = std::string(name);
    m_changeCounter->change();
}

NodeKind SysNode::kind() const noexcept
{
    return m_kind;
}

void SysNode::kind(NodeKind kind) noexcept
{
    if (m_kind == kind)
        return;

    m_kind = kind;
    m_changeCounter->change();
}

const std::string& SysNode::typeName() const noexcept
{
    return m_typeName;
}

void SysNode::typeName(std::string_view typeName)
{
    m_typeName = std::string(typeName);
    m_changeCounter->change();
}

bool SysNode::visible() const noexcept
{
    return m_visible;
}

void SysNode::visible(bool visible) noexcept
{
    if (m_visible == visible)
        return;

    m_visible = visible;
    m_changeCounter->change();
}

const NodeTransform& SysNode::transform() const noexcept
{
    return m_transform;
}

void SysNode::transform(const NodeTransform& xf) noexcept
{
    if (m_transform == xf)
        return;

    m_transform = xf;
    m_changeCounter->change();
}

void SysNode::position(const glm::vec3& p) noexcept
{
    NodeTransform xf = m_transform;
    xf.position      = p;
    transform(xf);
}

void SysNode::rotation(const glm::vec3& r) noexcept
{
    NodeTransform xf = m_transform;
    xf.rotation      = r;
    transform(xf);
}

void SysNode::scale(const glm::vec3& s) noexcept
{
    NodeTransform xf = m_transform;
    xf.scale         = s;
    transform(xf);
}

const NodeAttributes& SysNode::attributes() const noexcept
{
    return m_attributes;
}

NodeAttributes& SysNode::editAttributes() noexcept
{
    m_changeCounter->change();
    return m_attributes;
}

const NodeGeometry* SysNode::geometry() const noexcept
{
    return m_geometry ? &*m_geometry : nullptr;
}

const NodeMaterial* SysNode::material() const noexcept
{
    return m_material ? &*m_material : nullptr;
}

NodeMaterial* SysNode::material() noexcept
{
    return m_material ? &*m_material : nullptr;
}

void SysNode::material(const NodeMaterial& mat)
{
    m_material = mat;
    m_changeCounter->change();
}

const NodeLightData* SysNode::light() const noexcept
{
    return m_light ? &*m_light : nullptr;
}

NodeLightData* SysNode::light() noexcept
{
    return m_light ? &*m_light : nullptr;
}

void SysNode::light(const NodeLightData& data)
{
    m_light = data;
    m_changeCounter->change();
}

const NodeCameraData* SysNode::camera() const noexcept
{
    return m_camera ? &*m_camera : nullptr;
}

void SysNode::camera(const NodeCameraData& data)
{
    m_camera = data;
    m_changeCounter->change();
}

NodeId SysNode::parent() const noexcept
{
    return m_parent;
}

const std::vector<NodeId>& SysNode::children() const noexcept
{
    return m_children;
}

bool SysNode::hasChildren() const noexcept
{
    return !m_children.empty();
}

void SysNode::touch() noexcept
{
    m_changeCounter->change();
}

SysCounterPtr SysNode::changeCounter() const noexcept
{
    return m_changeCounter;
}
