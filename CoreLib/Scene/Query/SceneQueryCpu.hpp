#pragma once

#include <vector>

#include "SceneQuery.hpp"

/**
 * @brief Brute-force CPU implementation of SceneQuery.
 *
 * Transforms every candidate triangle to world space and runs a ray/triangle
 * test. Fine for the handful of meshes and light selectors of a typical
 * configurator scene; keeps no state.
 */
class SceneQueryCpu final : public SceneQuery
{
public:
    SceneQueryCpu()           = default;
    ~SceneQueryCpu() override = default;

    [[nodiscard]] std::vector<NodeHit> queryNodes(const SysNodeGraph&     graph,
                                                  std::span<const NodeId> candidates,
                                                  const un::ray&          ray) override;

    void invalidate() noexcept override {}
};
