//=============================================================================
// Scene.hpp
//=============================================================================
#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "LightHandler.hpp"
#include "LightVisualSettings.hpp"
#include "SceneFilter.hpp"
#include "SceneQuery.hpp"
#include "SelectionResolver.hpp"
#include "SelectionSettings.hpp"
#include "SysCounter.hpp"
#include "SysNodeGraph.hpp"

/**
 * @brief Scene-level container and coordinator.
 *
 * Scene owns the node graph and everything that works on it for one session.
 * There are no globals: hosts construct one Scene and pass it by reference.
 *
 * Responsibilities:
 * - Own the SysNodeGraph
 * - Own the light registry (LightHandler) and its link table
 * - Provide the picking backend (Embree when built with it, CPU otherwise)
 * - Own pointer selection state (SelectionResolver)
 * - Track a scene-wide change counter
 */
class Scene
{
public:
    /** @brief Construct an empty scene. */
    explicit Scene(const LightVisualSettings& lightSettings = {}, const SelectionSettings& selectionSettings = {});

    ~Scene() = default;

    Scene(const Scene&)            = delete;
    Scene& operator=(const Scene&) = delete;

    /**
     * @brief Remove every node and managed light.
     *
     * Light IDs keep counting up; the selection is cleared.
     */
    void clear();

    /**
     * @brief Remove a node and everything below it.
     *
     * Any member of a managed light removes the whole light. Light links of
     * removed meshes are dropped and a selection of a removed node is cleared.
     *
     * @return False if @p id is not alive.
     */
    bool removeNode(NodeId id);

    [[nodiscard]] SysNodeGraph&       graph() noexcept { return *m_graph; }
    [[nodiscard]] const SysNodeGraph& graph() const noexcept { return *m_graph; }

    [[nodiscard]] LightHandler&       lightHandler() noexcept { return *m_lightHandler; }
    [[nodiscard]] const LightHandler& lightHandler() const noexcept { return *m_lightHandler; }

    /**
     * @brief Access active scene query system.
     * @return Pointer to SceneQuery
     */
    [[nodiscard]] SceneQuery* sceneQuery() noexcept { return m_sceneQuery.get(); }

    [[nodiscard]] SelectionResolver&       selection() noexcept { return *m_selection; }
    [[nodiscard]] const SelectionResolver& selection() const noexcept { return *m_selection; }

    /// Rows of the outliner view.
    [[nodiscard]] std::vector<OutlinerRow> outlinerRows(bool showSystemHelpers = false) const;

    /// Runs @p render with everything but exported content hidden. See renderClean().
    bool renderClean(const std::function<void(const SysNodeGraph&)>& render);

    /** @brief Scene change counter (graph and light registry). */
    [[nodiscard]] SysCounterPtr changeCounter() const noexcept { return m_sceneChangeCounter; }

private:
    SysCounterPtr m_sceneChangeCounter;

    std::unique_ptr<SysNodeGraph>      m_graph;
    std::unique_ptr<SceneQuery>        m_sceneQuery;
    std::unique_ptr<LightHandler>      m_lightHandler;
    std::unique_ptr<SelectionResolver> m_selection;
};
