#include "SceneQueryEmbree.hpp"

#include <algorithm>
#include <embree4/rtcore.h>
#include <embree4/rtcore_ray.h>
#include <glm/glm.hpp>
#include <iostream>
#include <limits>

#include "CoreUtilities.hpp"
#include "SysNodeGraph.hpp"

namespace
{
    struct RTCFloat3
    {
        float x, y, z;
    };

    struct RTCTri
    {
        unsigned int v0, v1, v2;
    };

    void errorCallback(void* /*userPtr*/, RTCError code, const char* str)
    {
        std::cerr << "SceneQueryEmbree: error " << static_cast<int>(code) << ": " << (str ? str : "") << "\n";
    }

    RTCRayHit fromRay(const un::ray& ray, float tnear)
    {
        RTCRayHit rh{};
        rh.ray.org_x = ray.org.x;
        rh.ray.org_y = ray.org.y;
        rh.ray.org_z = ray.org.z;

        rh.ray.dir_x = ray.dir.x;
        rh.ray.dir_y = ray.dir.y;
        rh.ray.dir_z = ray.dir.z;

        rh.ray.tnear = tnear;
        rh.ray.tfar  = std::numeric_limits<float>::max();
        rh.ray.mask  = 0xFFFFFFFFu;
        rh.ray.flags = 0;

        rh.hit.geomID = RTC_INVALID_GEOMETRY_ID;
        rh.hit.primID = RTC_INVALID_GEOMETRY_ID;
        return rh;
    }
} // namespace

SceneQueryEmbree::SceneQueryEmbree()
{
    m_device = rtcNewDevice(nullptr); // nullptr = default config

    if (!m_device)
    {
        std::cerr << "SceneQueryEmbree: rtcNewDevice failed, picking disabled\n";
        return;
    }

    rtcSetDeviceErrorFunction(m_device, errorCallback, nullptr);
}

SceneQueryEmbree::~SceneQueryEmbree()
{
    releaseScenes();

    if (m_device)
        rtcReleaseDevice(m_device);
}

void SceneQueryEmbree::releaseScenes() noexcept
{
    for (NodeScene& ns : m_scenes)
        rtcReleaseScene(ns.scene);
    m_scenes.clear();
    m_built = false;
}

bool SceneQueryEmbree::ready() const noexcept
{
    return m_device != nullptr;
}

void SceneQueryEmbree::invalidate() noexcept
{
    m_graph = nullptr;
    m_monitor.reset();
    m_builtFor.clear();
    releaseScenes();
}

bool SceneQueryEmbree::needsRebuild(const SysNodeGraph& graph, std::span<const NodeId> candidates)
{
    if (m_graph != &graph || !m_monitor)
    {
        m_graph   = &graph;
        m_monitor = std::make_unique<SysMonitor>(graph.changeCounter());
    }

    // changed() must run every time to keep the monitor in step.
    const bool graphChanged = m_monitor->changed();
    const bool sameSet      = std::equal(candidates.begin(), candidates.end(), m_builtFor.begin(), m_builtFor.end());

    return graphChanged || !sameSet || !m_built;
}

void SceneQueryEmbree::buildForCandidates(const SysNodeGraph& graph, std::span<const NodeId> candidates)
{
    releaseScenes();
    m_builtFor.assign(candidates.begin(), candidates.end());

    if (!m_device)
        return;

    for (NodeId id : candidates)
    {
        const SysNode* n = graph.node(id);
        if (!n)
            continue;

        const NodeGeometry* geo = n->geometry();
        if (!geo || geo->primitive != PrimitiveType::Triangles || geo->empty())
            continue;

        const std::size_t vertCount = geo->positions.size();

        // Drop triangles with out-of-range indices up front; Embree does not check.
        std::vector<RTCTri> tris;
        tris.reserve(geo->indices.size() / 3);
        for (std::size_t i = 0; i + 2 < geo->indices.size(); i += 3)
        {
            const uint32_t a = geo->indices[i];
            const uint32_t b = geo->indices[i + 1];
            const uint32_t c = geo->indices[i + 2];
            if (a < vertCount && b < vertCount && c < vertCount)
                tris.push_back(RTCTri{a, b, c});
        }
        if (tris.empty())
            continue;

        RTCGeometry rtcGeom = rtcNewGeometry(m_device, RTC_GEOMETRY_TYPE_TRIANGLE);
        rtcSetGeometryBuildQuality(rtcGeom, RTC_BUILD_QUALITY_MEDIUM);

        auto* vbuf = reinterpret_cast<RTCFloat3*>(
            rtcSetNewGeometryBuffer(rtcGeom,
                                    RTC_BUFFER_TYPE_VERTEX,
                                    0,
                                    RTC_FORMAT_FLOAT3,
                                    sizeof(RTCFloat3),
                                    vertCount));

        auto* ibuf = reinterpret_cast<RTCTri*>(
            rtcSetNewGeometryBuffer(rtcGeom,
                                    RTC_BUFFER_TYPE_INDEX,
                                    0,
                                    RTC_FORMAT_UINT3,
                                    sizeof(RTCTri),
                                    tris.size()));

        if (!vbuf || !ibuf)
        {
            rtcReleaseGeometry(rtcGeom);
            continue;
        }

        const glm::mat4 world = graph.worldMatrix(id);
        for (std::size_t vi = 0; vi < vertCount; ++vi)
        {
            const glm::vec3 p = glm::vec3(world * glm::vec4(geo->positions[vi], 1.0f));
            vbuf[vi]          = RTCFloat3{p.x, p.y, p.z};
        }
        std::copy(tris.begin(), tris.end(), ibuf);

        rtcCommitGeometry(rtcGeom);

        RTCScene scene = rtcNewScene(m_device);
        rtcSetSceneBuildQuality(scene, RTC_BUILD_QUALITY_MEDIUM);
        rtcAttachGeometry(scene, rtcGeom);
        rtcReleaseGeometry(rtcGeom);
        rtcCommitScene(scene);

        m_scenes.push_back(NodeScene{id, scene});
    }

    m_built = true;
}

std::vector<NodeHit> SceneQueryEmbree::queryNodes(const SysNodeGraph&     graph,
                                                  std::span<const NodeId> candidates,
                                                  const un::ray&          ray)
{
    std::vector<NodeHit> hits;
    if (!m_device)
        return hits;

    if (needsRebuild(graph, candidates))
        buildForCandidates(graph, candidates);

    for (const NodeScene& ns : m_scenes)
    {
        RTCRayHit rh = fromRay(ray, 0.0f);

        RTCIntersectArguments args;
        rtcInitIntersectArguments(&args);
        rtcIntersect1(ns.scene, &rh, &args);

        if (rh.hit.geomID != RTC_INVALID_GEOMETRY_ID)
            hits.push_back(NodeHit{ns.node, rh.ray.tfar});
    }

    return hits;
}
