#include "SysNodeGraph.hpp"

#include <algorithm>

SysNodeGraph::SysNodeGraph(NodeGraphCaps caps) :
    m_caps{caps},
    m_changeCounter{std::make_shared<SysCounter>()}
{
}

NodeId SysNodeGraph::createNode(std::string_view name, NodeKind kind, NodeId parent)
{
    if (parent != kInvalidNodeId && !valid(parent))
        return kInvalidNodeId;

    // The slot index is the id, so the node is inserted first and constructed in place.
    const NodeId id = m_nodes.insert(std::unique_ptr<SysNode>{});
    m_nodes[id]     = std::make_unique<SysNode>(id, m_nextUid++, name, kind);
    m_nodes[id]->m_changeCounter->addParent(m_changeCounter);

    if (parent == kInvalidNodeId)
    {
        m_roots.push_back(id);
    }
    else
    {
        m_nodes[id]->m_parent = parent;
        m_nodes[parent]->m_children.push_back(id);
    }

    m_changeCounter->change();
    return id;
}

bool SysNodeGraph::destroyNode(NodeId id)
{
    if (!valid(id))
        return false;

    const std::vector<NodeId> doomed = subtree(id);

    detach(id);

    // Children first so no live node ever points at a freed slot.
    for (auto it = doomed.rbegin(); it != doomed.rend(); ++it)
    {
        m_nodes[*it].reset();
        m_nodes.remove(*it);
    }

    m_changeCounter->change();
    return true;
}

bool SysNodeGraph::reparent(NodeId id, NodeId parent)
{
    if (!valid(id))
        return false;

    if (parent != kInvalidNodeId)
    {
        if (!valid(parent) || parent == id)
            return false;

        const std::vector<NodeId> up = ancestors(parent);
        if (std::find(up.begin(), up.end(), id) != up.end())
            return false;
    }

    if (m_nodes[id]->m_parent == parent)
        return true;

    detach(id);

    if (parent == kInvalidNodeId)
    {
        m_roots.push_back(id);
    }
    else
    {
        m_nodes[id]->m_parent = parent;
        m_nodes[parent]->m_children.push_back(id);
    }

    m_changeCounter->change();
    return true;
}

SysNode* SysNodeGraph::node(NodeId id) noexcept
{
    return valid(id) ? m_nodes[id].get() : nullptr;
}

const SysNode* SysNodeGraph::node(NodeId id) const noexcept
{
    return valid(id) ? m_nodes[id].get() : nullptr;
}

bool SysNodeGraph::valid(NodeId id) const noexcept
{
    return m_nodes.valid(id) && m_nodes[id] != nullptr;
}

bool SysNodeGraph::alive(NodeId id, uint64_t uid) const noexcept
{
    return valid(id) && m_nodes[id]->m_uid == uid;
}

const std::vector<NodeId>& SysNodeGraph::roots() const noexcept
{
    return m_roots;
}

std::vector<NodeId> SysNodeGraph::traverse() const
{
    std::vector<NodeId> out;
    out.reserve(m_nodes.size());
    for (NodeId root : m_roots)
        collect(root, out);
    return out;
}

std::vector<NodeId> SysNodeGraph::subtree(NodeId id) const
{
    std::vector<NodeId> out;
    if (valid(id))
        collect(id, out);
    return out;
}

std::vector<NodeId> SysNodeGraph::ancestors(NodeId id) const
{
    std::vector<NodeId> out;
    if (!valid(id))
        return out;

    NodeId cur = m_nodes[id]->m_parent;
    while (cur != kInvalidNodeId && valid(cur))
    {
        out.push_back(cur);
        cur = m_nodes[cur]->m_parent;
    }
    return out;
}

glm::mat4 SysNodeGraph::worldMatrix(NodeId id) const noexcept
{
    glm::mat4 m(1.0f);

    NodeId cur = id;
    while (cur != kInvalidNodeId && valid(cur))
    {
        m   = m_nodes[cur]->m_transform.matrix() * m;
        cur = m_nodes[cur]->m_parent;
    }
    return m;
}

bool SysNodeGraph::effectiveVisible(NodeId id) const noexcept
{
    if (!valid(id))
        return false;

    NodeId cur = id;
    while (cur != kInvalidNodeId && valid(cur))
    {
        if (!m_nodes[cur]->m_visible)
            return false;
        cur = m_nodes[cur]->m_parent;
    }
    return true;
}

bool SysNodeGraph::setGeometry(NodeId id, NodeGeometry geometry)
{
    if (!m_caps.geometry || !valid(id))
        return false;

    m_nodes[id]->m_geometry = std::move(geometry);
    m_nodes[id]->m_changeCounter->change();
    return true;
}

const NodeGraphCaps& SysNodeGraph::caps() const noexcept
{
    return m_caps;
}

int32_t SysNodeGraph::size() const noexcept
{
    return m_nodes.size();
}

void SysNodeGraph::clear() noexcept
{
    m_nodes.clear();
    m_roots.clear();
    m_changeCounter->change();
}

SysCounterPtr SysNodeGraph::changeCounter() const noexcept
{
    return m_changeCounter;
}

void SysNodeGraph::collect(NodeId id, std::vector<NodeId>& out) const
{
    out.push_back(id);
    for (NodeId child : m_nodes[id]->m_children)
    {
        if (valid(child))
            collect(child, out);
    }
}

void SysNodeGraph::detach(NodeId id) noexcept
{
    SysNode&     n      = *m_nodes[id];
    const NodeId parent = n.m_parent;

    std::vector<NodeId>& siblings = (parent != kInvalidNodeId && valid(parent)) ? m_nodes[parent]->m_children : m_roots;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());

    n.m_parent = kInvalidNodeId;
}
