//============================================================
// CleanRender.cpp
//============================================================
#include "CleanRender.hpp"

#include <exception>
#include <iostream>
#include <unordered_set>

#include "SceneFilter.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"

CleanRenderScope::CleanRenderScope(SysNodeGraph& graph) : m_graph{graph}
{
    std::unordered_set<NodeId> exported;
    for (const FilteredNode& f : filter::applyToScene(graph, filter::exportVisible()))
        exported.insert(f.id);

    for (NodeId id : graph.traverse())
    {
        SysNode* n = graph.node(id);
        if (!n || !n->visible())
            continue;

        const NodeAttributes& attrs = n->attributes();
        if (attrs.flag(tags::kKeepInRender))
            continue;

        if (exported.contains(id) && !attrs.flag(tags::kHideInRender))
            continue;

        n->visible(false);
        m_hidden.push_back(id);
    }
}

CleanRenderScope::~CleanRenderScope()
{
    for (NodeId id : m_hidden)
    {
        if (SysNode* n = m_graph.node(id))
            n->visible(true);
    }
}

bool renderClean(SysNodeGraph& graph, const std::function<void(const SysNodeGraph&)>& render)
{
    if (!render)
        return false;

    CleanRenderScope clean(graph);
    try
    {
        render(graph);
    }
    catch (const std::exception& e)
    {
        std::cerr << "CleanRender: render callback failed: " << e.what() << "\n";
        return false;
    }
    return true;
}
