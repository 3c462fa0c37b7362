#include "SceneQueryCpu.hpp"

#include <glm/glm.hpp>

#include "CoreUtilities.hpp"
#include "SysNodeGraph.hpp"

namespace
{
    NodeHit hitNode(const SysNodeGraph& graph, NodeId id, const un::ray& ray)
    {
        NodeHit best;

        const SysNode* n = graph.node(id);
        if (!n)
            return best;

        const NodeGeometry* geo = n->geometry();
        if (!geo || geo->primitive != PrimitiveType::Triangles)
            return best;

        const glm::mat4 world = graph.worldMatrix(id);

        std::vector<glm::vec3> pts;
        pts.reserve(geo->positions.size());
        for (const glm::vec3& p : geo->positions)
            pts.push_back(glm::vec3(world * glm::vec4(p, 1.0f)));

        const std::size_t vertCount = pts.size();
        for (std::size_t i = 0; i + 2 < geo->indices.size(); i += 3)
        {
            const uint32_t a = geo->indices[i];
            const uint32_t b = geo->indices[i + 1];
            const uint32_t c = geo->indices[i + 2];
            if (a >= vertCount || b >= vertCount || c >= vertCount)
                continue;

            float t = 0.0f;
            if (un::ray_triangle_intersect(ray, pts[a], pts[b], pts[c], t) && t < best.t)
            {
                best.node = id;
                best.t    = t;
            }
        }

        return best;
    }
} // namespace

std::vector<NodeHit> SceneQueryCpu::queryNodes(const SysNodeGraph&     graph,
                                               std::span<const NodeId> candidates,
                                               const un::ray&          ray)
{
    std::vector<NodeHit> hits;
    for (NodeId id : candidates)
    {
        NodeHit h = hitNode(graph, id, ray);
        if (h.valid())
            hits.push_back(h);
    }
    return hits;
}
