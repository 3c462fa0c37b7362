#pragma once

#include <memory>
#include <vector>

#include "SceneQuery.hpp"
#include "SysCounter.hpp"
#include "embree4/rtcore.h" // RTCDevice, RTCScene, etc.

/**
 * @brief Embree-backed SceneQuery.
 *
 * Builds one RTCScene per candidate node holding its triangles baked to world
 * space, so each node reports its own nearest hit even where surfaces of
 * different nodes coincide. Scenes are rebuilt when the graph changes (change
 * counter), when a different graph is queried or when the candidate list
 * differs from the one they were built for.
 */
class SceneQueryEmbree final : public SceneQuery
{
public:
    SceneQueryEmbree();
    ~SceneQueryEmbree() override;

    SceneQueryEmbree(const SceneQueryEmbree&)            = delete;
    SceneQueryEmbree& operator=(const SceneQueryEmbree&) = delete;

    [[nodiscard]] std::vector<NodeHit> queryNodes(const SysNodeGraph&     graph,
                                                  std::span<const NodeId> candidates,
                                                  const un::ray&          ray) override;

    void invalidate() noexcept override;

    /// False when the Embree device could not be created. Queries then return no hits.
    [[nodiscard]] bool ready() const noexcept;

private:
    struct NodeScene
    {
        NodeId   node  = kInvalidNodeId;
        RTCScene scene = nullptr;
    };

    void buildForCandidates(const SysNodeGraph& graph, std::span<const NodeId> candidates);
    bool needsRebuild(const SysNodeGraph& graph, std::span<const NodeId> candidates);
    void releaseScenes() noexcept;

    RTCDevice m_device = nullptr;

    std::vector<NodeScene>      m_scenes; // candidate order, nodes without triangles skipped
    std::vector<NodeId>         m_builtFor;
    bool                        m_built = false;
    const SysNodeGraph*         m_graph = nullptr;
    std::unique_ptr<SysMonitor> m_monitor;
};
