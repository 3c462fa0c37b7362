#include "SceneFilter.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"
#include <algorithm>
#include <gtest/gtest.h>

namespace
{
    bool hasCategory(const std::vector<FilteredNode>& nodes, ObjectCategory c)
    {
        return std::any_of(nodes.begin(), nodes.end(), [c](const FilteredNode& n) { return n.category == c; });
    }

    bool hasNode(const std::vector<FilteredNode>& nodes, NodeId id)
    {
        return std::any_of(nodes.begin(), nodes.end(), [id](const FilteredNode& n) { return n.id == id; });
    }
} // namespace

class SceneFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        group = graph.createNode("Furniture", NodeKind::Group);
        chair = graph.createNode("Chair", NodeKind::Mesh, group);
        lamp  = graph.createNode("Desk Lamp", NodeKind::Light);
        grid  = graph.createNode("Grid", NodeKind::Mesh);
        arrow = graph.createNode("Arrow", NodeKind::Mesh);
        axisX = graph.createNode("X", NodeKind::Mesh);

        controls = graph.createNode("Controls", NodeKind::Group);
        graph.node(controls)->typeName("TransformControls");
        graph.createNode("Picker", NodeKind::Mesh, controls);

        helper = graph.createNode("Bounds", NodeKind::Other);
        graph.node(helper)->typeName("BoxHelper");

        selector = graph.createNode("Lamp Selector", NodeKind::Mesh);
        graph.node(selector)->editAttributes().set(std::string(tags::kIsLightSelector), true);
        graph.node(selector)->editAttributes().set(std::string(tags::kLightId), int64_t{1});

        stray = graph.createNode("", NodeKind::Unknown);
    }

    SysNodeGraph graph;
    NodeId       group    = kInvalidNodeId;
    NodeId       chair    = kInvalidNodeId;
    NodeId       lamp     = kInvalidNodeId;
    NodeId       grid     = kInvalidNodeId;
    NodeId       arrow    = kInvalidNodeId;
    NodeId       axisX    = kInvalidNodeId;
    NodeId       controls = kInvalidNodeId;
    NodeId       helper   = kInvalidNodeId;
    NodeId       selector = kInvalidNodeId;
    NodeId       stray    = kInvalidNodeId;
};

TEST_F(SceneFilterTest, OutlinerListsOnlyUserContentByDefault) {
    const auto listed = filter::applyToScene(graph, filter::outliner());

    std::vector<NodeId> ids;
    for (const FilteredNode& n : listed)
        ids.push_back(n.id);

    EXPECT_EQ(ids, (std::vector<NodeId>{group, chair, lamp}));
}

TEST_F(SceneFilterTest, OutlinerNeverListsGizmosOrTransformParts) {
    const auto listed = filter::applyToScene(graph, filter::outliner(true));

    EXPECT_TRUE(hasNode(listed, grid));
    EXPECT_TRUE(hasNode(listed, helper));
    EXPECT_TRUE(hasNode(listed, selector));

    EXPECT_FALSE(hasCategory(listed, ObjectCategory::SystemGizmo));
    EXPECT_FALSE(hasCategory(listed, ObjectCategory::TransformControl));
    EXPECT_FALSE(hasCategory(listed, ObjectCategory::TransformHandle));
    EXPECT_FALSE(hasNode(listed, arrow));
    EXPECT_FALSE(hasNode(listed, axisX));
}

TEST_F(SceneFilterTest, OutlinerHonorsHideInOutliner) {
    graph.node(chair)->editAttributes().set(std::string(tags::kHideInOutliner), true);
    graph.node(grid)->editAttributes().set(std::string(tags::kHideInOutliner), true);

    EXPECT_FALSE(hasNode(filter::applyToScene(graph, filter::outliner()), chair));
    EXPECT_FALSE(hasNode(filter::applyToScene(graph, filter::outliner(true)), grid));
}

TEST_F(SceneFilterTest, PickableRequiresVisibilityAndAcceptsSelectors) {
    auto picked = filter::applyToScene(graph, filter::pickable());
    EXPECT_TRUE(hasNode(picked, chair));
    EXPECT_TRUE(hasNode(picked, selector));
    EXPECT_FALSE(hasNode(picked, lamp));
    EXPECT_FALSE(hasNode(picked, grid));

    graph.node(group)->visible(false);
    graph.node(selector)->visible(false);

    picked = filter::applyToScene(graph, filter::pickable());
    EXPECT_FALSE(hasNode(picked, chair));
    EXPECT_FALSE(hasNode(picked, selector));
}

TEST_F(SceneFilterTest, ExportKeepsUnknownButDropsTooling) {
    const auto exported = filter::applyToScene(graph, filter::exportVisible());

    EXPECT_TRUE(hasNode(exported, chair));
    EXPECT_TRUE(hasNode(exported, lamp));
    EXPECT_TRUE(hasNode(exported, stray));
    EXPECT_FALSE(hasNode(exported, grid));
    EXPECT_FALSE(hasNode(exported, selector));
    EXPECT_FALSE(hasNode(exported, controls));
}

TEST_F(SceneFilterTest, ApplyPreservesInputOrderAndSkipsDeadIds) {
    const NodeId other = graph.createNode("Table", NodeKind::Mesh);
    const std::vector<NodeId> input = {other, 777, chair};

    const auto meshes = filter::apply(graph, input, filter::userMeshes());
    ASSERT_EQ(meshes.size(), 2u);
    EXPECT_EQ(meshes[0].id, other);
    EXPECT_EQ(meshes[1].id, chair);
    EXPECT_EQ(meshes[1].category, ObjectCategory::UserMesh);
}

TEST_F(SceneFilterTest, DisplayNameFallsBackToKindAndId) {
    EXPECT_EQ(filter::displayName(graph, chair), "Chair");
    EXPECT_EQ(filter::displayName(graph, stray), "Object " + std::to_string(stray));
    EXPECT_EQ(filter::displayName(graph, 999), "");
}

TEST_F(SceneFilterTest, OutlinerRowsIndentUnderListedAncestors) {
    const NodeId hidden = graph.createNode("Hidden Group", NodeKind::Group, group);
    graph.node(hidden)->editAttributes().set(std::string(tags::kHideInOutliner), true);
    const NodeId leg = graph.createNode("Leg", NodeKind::Mesh, hidden);

    const auto rows = filter::outlinerRows(graph);
    ASSERT_EQ(rows.size(), 4u);

    EXPECT_EQ(rows[0].id, group);
    EXPECT_EQ(rows[0].depth, 0);
    EXPECT_EQ(rows[0].category, ObjectCategory::UserGroup);

    EXPECT_EQ(rows[1].id, chair);
    EXPECT_EQ(rows[1].depth, 1);

    // Skipped parents do not add indentation.
    EXPECT_EQ(rows[2].id, leg);
    EXPECT_EQ(rows[2].depth, 1);
    EXPECT_EQ(rows[2].label, "Leg");

    EXPECT_EQ(rows[3].id, lamp);
    EXPECT_EQ(rows[3].depth, 0);
}
