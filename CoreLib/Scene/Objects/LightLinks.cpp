//============================================================
// LightLinks.cpp
//============================================================
#include "LightLinks.hpp"

#include <algorithm>
#include <cmath>

bool LightLinkTable::set(LightId light, NodeId mesh, const LightLink& link)
{
    if (light == kInvalidLightId || mesh == kInvalidNodeId)
        return false;

    LightLink stored = link;
    stored.influence = std::isfinite(link.influence) ? std::clamp(link.influence, 0.0f, 1.0f) : 1.0f;

    m_links[{light, mesh}] = stored;
    return true;
}

std::optional<LightLink> LightLinkTable::get(LightId light, NodeId mesh) const
{
    if (auto it = m_links.find({light, mesh}); it != m_links.end())
        return it->second;
    return std::nullopt;
}

bool LightLinkTable::remove(LightId light, NodeId mesh)
{
    return m_links.erase({light, mesh}) > 0;
}

void LightLinkTable::setEnabled(LightId light, NodeId mesh, bool enabled)
{
    if (light == kInvalidLightId || mesh == kInvalidNodeId)
        return;

    m_links[{light, mesh}].enabled = enabled;
}

void LightLinkTable::enableForAll(LightId light, std::span<const NodeId> meshes)
{
    for (NodeId mesh : meshes)
        setEnabled(light, mesh, true);
}

void LightLinkTable::disableForAll(LightId light, std::span<const NodeId> meshes)
{
    for (NodeId mesh : meshes)
        setEnabled(light, mesh, false);
}

void LightLinkTable::enableAllLights(NodeId mesh, std::span<const LightId> lights)
{
    for (LightId light : lights)
        setEnabled(light, mesh, true);
}

void LightLinkTable::disableAllLights(NodeId mesh, std::span<const LightId> lights)
{
    for (LightId light : lights)
        setEnabled(light, mesh, false);
}

std::size_t LightLinkTable::removeLight(LightId light)
{
    return std::erase_if(m_links, [light](const auto& kv) { return kv.first.first == light; });
}

std::size_t LightLinkTable::removeMesh(NodeId mesh)
{
    return std::erase_if(m_links, [mesh](const auto& kv) { return kv.first.second == mesh; });
}

bool LightLinkTable::affects(LightId light, NodeId mesh) const
{
    const auto link = get(light, mesh);
    if (!link)
        return true;
    return link->enabled && link->influence > 0.0f;
}

std::vector<LightLinkEntry> LightLinkTable::all() const
{
    std::vector<LightLinkEntry> out;
    out.reserve(m_links.size());
    for (const auto& [key, link] : m_links)
        out.push_back(LightLinkEntry{key.first, key.second, link});
    return out;
}
