#include "CoreUtilities.hpp"
#include "SceneQueryCpu.hpp"
#include "SysNodeGraph.hpp"
#include <gtest/gtest.h>

namespace
{
    // Unit quad in local XY, facing +Z.
    NodeGeometry quad()
    {
        NodeGeometry geo;
        geo.positions = {{-0.5f, -0.5f, 0.0f}, {0.5f, -0.5f, 0.0f}, {0.5f, 0.5f, 0.0f}, {-0.5f, 0.5f, 0.0f}};
        geo.indices   = {0, 1, 2, 0, 2, 3};
        return geo;
    }
} // namespace

class SceneQueryCpuTest : public ::testing::Test {
protected:
    NodeId addQuad(std::string_view name, float z) {
        const NodeId id = graph.createNode(name, NodeKind::Mesh);
        graph.setGeometry(id, quad());
        graph.node(id)->position(glm::vec3(0.0f, 0.0f, z));
        return id;
    }

    SysNodeGraph  graph;
    SceneQueryCpu query;
    un::ray       down = un::make_ray(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f, 0.0f, -1.0f));
};

TEST_F(SceneQueryCpuTest, NearestHitWins) {
    const NodeId back  = addQuad("Back", -2.0f);
    const NodeId front = addQuad("Front", 1.0f);
    const std::vector<NodeId> candidates = {back, front};

    const auto hits = query.queryNodes(graph, candidates, down);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].node, back);
    EXPECT_NEAR(hits[0].t, 12.0f, 1e-4f);

    const NodeHit nearest = query.queryNearest(graph, candidates, down);
    EXPECT_EQ(nearest.node, front);
    EXPECT_NEAR(nearest.t, 9.0f, 1e-4f);
}

TEST_F(SceneQueryCpuTest, TiesKeepFirstCandidate) {
    const NodeId a = addQuad("A", 0.0f);
    const NodeId b = addQuad("B", 0.0f);

    EXPECT_EQ(query.queryNearest(graph, std::vector<NodeId>{a, b}, down).node, a);
    EXPECT_EQ(query.queryNearest(graph, std::vector<NodeId>{b, a}, down).node, b);
}

TEST_F(SceneQueryCpuTest, OnlyCandidatesAreTested) {
    const NodeId a = addQuad("A", 0.0f);
    addQuad("B", 1.0f);

    EXPECT_EQ(query.queryNearest(graph, std::vector<NodeId>{a}, down).node, a);
    EXPECT_FALSE(query.queryNearest(graph, std::vector<NodeId>{}, down).valid());
}

TEST_F(SceneQueryCpuTest, LineGeometryIsNeverHit) {
    const NodeId id = graph.createNode("Wire", NodeKind::Mesh);
    NodeGeometry lines = quad();
    lines.primitive    = PrimitiveType::Lines;
    lines.indices      = {0, 1, 1, 2, 2, 3, 3, 0};
    ASSERT_TRUE(graph.setGeometry(id, lines));

    EXPECT_TRUE(query.queryNodes(graph, std::vector<NodeId>{id}, down).empty());
}

TEST_F(SceneQueryCpuTest, ParentTransformMovesTarget) {
    const NodeId parent = graph.createNode("Rig", NodeKind::Group);
    const NodeId child  = graph.createNode("Panel", NodeKind::Mesh, parent);
    graph.setGeometry(child, quad());
    graph.node(parent)->position(glm::vec3(5.0f, 0.0f, 0.0f));

    EXPECT_FALSE(query.queryNearest(graph, std::vector<NodeId>{child}, down).valid());

    const un::ray shifted = un::make_ray(glm::vec3(5.0f, 0.0f, 10.0f), glm::vec3(0.0f, 0.0f, -1.0f));
    const NodeHit hit     = query.queryNearest(graph, std::vector<NodeId>{child}, shifted);
    EXPECT_EQ(hit.node, child);
    EXPECT_NEAR(hit.t, 10.0f, 1e-4f);
}

TEST_F(SceneQueryCpuTest, MissAndDeadIds) {
    const NodeId a = addQuad("A", 0.0f);
    const un::ray away = un::make_ray(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f, 0.0f, 1.0f));

    EXPECT_FALSE(query.queryNearest(graph, std::vector<NodeId>{a}, away).valid());
    EXPECT_FALSE(query.queryNearest(graph, std::vector<NodeId>{1234}, down).valid());
}
