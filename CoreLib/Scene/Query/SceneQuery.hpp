#pragma once

#include <limits>
#include <span>
#include <vector>

#include "NodeTypes.hpp"

class SysNodeGraph;
namespace un
{
    struct ray;
} // namespace un

/**
 * @brief Nearest ray hit on one node.
 */
struct NodeHit
{
    NodeId node = kInvalidNodeId;                  ///< Node that was hit
    float  t    = std::numeric_limits<float>::max(); ///< Ray parameter (world units for a unit ray)

    [[nodiscard]] bool valid() const noexcept
    {
        return node != kInvalidNodeId;
    }
};

/**
 * @brief Abstract base class for node hit-testing.
 *
 * Only triangle geometry is hit-tested; line-only nodes are never hit.
 * Implementations may cache acceleration data keyed on the graph change
 * counter and the candidate list, so queries are non-const.
 */
class SceneQuery
{
public:
    virtual ~SceneQuery() = default;

    /**
     * @brief All candidates hit by @p ray, one entry per node.
     *
     * Each entry carries that node's nearest hit. Entries follow the order of
     * @p candidates.
     */
    [[nodiscard]] virtual std::vector<NodeHit> queryNodes(const SysNodeGraph&     graph,
                                                          std::span<const NodeId> candidates,
                                                          const un::ray&          ray) = 0;

    /**
     * @brief The hit with the smallest ray parameter.
     *
     * Ties keep the candidate that comes first. Invalid hit when nothing is hit.
     */
    [[nodiscard]] NodeHit queryNearest(const SysNodeGraph&     graph,
                                       std::span<const NodeId> candidates,
                                       const un::ray&          ray)
    {
        NodeHit best;
        for (const NodeHit& h : queryNodes(graph, candidates, ray))
        {
            if (h.t < best.t)
                best = h;
        }
        return best;
    }

    /// Drop cached acceleration data.
    virtual void invalidate() noexcept = 0;

protected:
    SceneQuery() = default;
};
