#include "Scene.hpp"

#include "CleanRender.hpp"

#ifdef SCENERIG_WITH_EMBREE
#include "SceneQueryEmbree.hpp"
#else
#include "SceneQueryCpu.hpp"
#endif

namespace
{
    std::unique_ptr<SceneQuery> makeSceneQuery()
    {
#ifdef SCENERIG_WITH_EMBREE
        return std::make_unique<SceneQueryEmbree>();
#else
        return std::make_unique<SceneQueryCpu>();
#endif
    }
} // namespace

Scene::Scene(const LightVisualSettings& lightSettings, const SelectionSettings& selectionSettings) :
    m_sceneChangeCounter{std::make_shared<SysCounter>()},
    m_graph{std::make_unique<SysNodeGraph>()},
    m_sceneQuery{makeSceneQuery()},
    m_lightHandler{std::make_unique<LightHandler>(*m_graph, lightSettings)},
    m_selection{std::make_unique<SelectionResolver>(*m_graph, *m_sceneQuery, selectionSettings)}
{
    m_graph->changeCounter()->addParent(m_sceneChangeCounter);
    m_lightHandler->changeCounter()->addParent(m_sceneChangeCounter);
}

void Scene::clear()
{
    m_lightHandler->clear();
    m_graph->clear();
    m_selection->pointerCancel();
    m_selection->clear();
    m_sceneQuery->invalidate();
    m_sceneChangeCounter->change();
}

bool Scene::removeNode(NodeId id)
{
    if (!m_graph->valid(id))
        return false;

    const std::vector<NodeId> doomed = m_graph->subtree(id);

    if (const LightId light = m_lightHandler->lightIdForNode(id); light != kInvalidLightId)
    {
        m_lightHandler->remove(light);
    }
    else
    {
        // Managed lights parented under the subtree go with it.
        for (NodeId n : doomed)
        {
            const LightId owned = m_lightHandler->lightIdForNode(n);
            if (owned != kInvalidLightId)
                m_lightHandler->remove(owned);
        }

        if (m_graph->valid(id))
            m_graph->destroyNode(id);
    }

    for (NodeId n : doomed)
        m_lightHandler->links().removeMesh(n);

    const Selection& sel = m_selection->selection();
    if (sel.kind == Selection::Kind::Light && !m_lightHandler->contains(sel.light))
        m_selection->clear();
    else if (sel.kind == Selection::Kind::Node && !m_graph->valid(sel.node))
        m_selection->clear();

    return true;
}

std::vector<OutlinerRow> Scene::outlinerRows(bool showSystemHelpers) const
{
    return filter::outlinerRows(*m_graph, showSystemHelpers);
}

bool Scene::renderClean(const std::function<void(const SysNodeGraph&)>& render)
{
    return ::renderClean(*m_graph, render);
}
