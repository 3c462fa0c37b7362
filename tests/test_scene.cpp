#include "Scene.hpp"
#include "SceneTags.hpp"
#include <gtest/gtest.h>

class SceneTest : public ::testing::Test {
protected:
    Scene scene;
};

TEST_F(SceneTest, OutlinerShowsUserContentOnly) {
    const NodeId  mesh  = scene.graph().createNode("Chair", NodeKind::Mesh);
    const LightId light = scene.lightHandler().create(LightKind::Area);
    const NodeId  grid  = scene.graph().createNode("Grid", NodeKind::Mesh);

    const auto rows = scene.outlinerRows();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].id, mesh);
    EXPECT_EQ(rows[1].id, scene.lightHandler().get(light)->lightNode);
    EXPECT_EQ(rows[1].category, ObjectCategory::UserLight);

    // System helpers are listed on request; light bundle members never are.
    const auto all = scene.outlinerRows(true);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[2].id, grid);
    EXPECT_EQ(all[2].category, ObjectCategory::SystemGrid);
}

TEST_F(SceneTest, RemovingAnyBundleMemberRemovesTheLight) {
    const LightId light  = scene.lightHandler().create(LightKind::Point);
    const NodeId  helper = scene.lightHandler().get(light)->helperNode;
    const NodeId  part   = scene.graph().node(helper)->children().front();

    EXPECT_TRUE(scene.removeNode(part));
    EXPECT_FALSE(scene.lightHandler().contains(light));
    EXPECT_EQ(scene.graph().size(), 0);
    EXPECT_FALSE(scene.removeNode(part));
}

TEST_F(SceneTest, RemovingParentTakesReparentedLight) {
    const NodeId  group = scene.graph().createNode("Rig", NodeKind::Group);
    const LightId light = scene.lightHandler().create(LightKind::Spot);
    ASSERT_TRUE(scene.graph().reparent(scene.lightHandler().get(light)->lightNode, group));

    EXPECT_TRUE(scene.removeNode(group));
    EXPECT_FALSE(scene.graph().valid(group));
    EXPECT_EQ(scene.lightHandler().count(), 0u);
    EXPECT_EQ(scene.graph().size(), 0);
}

TEST_F(SceneTest, RemovingMeshDropsLinksAndSelection) {
    const NodeId  mesh  = scene.graph().createNode("Chair", NodeKind::Mesh);
    const NodeId  other = scene.graph().createNode("Table", NodeKind::Mesh);
    const LightId light = scene.lightHandler().create(LightKind::Point);

    scene.lightHandler().links().set(light, mesh, LightLink{false, 1.0f});
    scene.lightHandler().links().set(light, other, LightLink{false, 1.0f});
    scene.selection().select(Selection::ofNode(mesh));

    EXPECT_TRUE(scene.removeNode(mesh));
    EXPECT_TRUE(scene.selection().selection().empty());
    EXPECT_FALSE(scene.lightHandler().links().get(light, mesh).has_value());
    EXPECT_TRUE(scene.lightHandler().links().get(light, other).has_value());
}

TEST_F(SceneTest, RemovingSelectedLightClearsSelection) {
    const LightId light = scene.lightHandler().create(LightKind::Area);
    const NodeId  proxy = scene.lightHandler().get(light)->proxyNode;
    scene.selection().select(Selection::ofLight(light, proxy));

    EXPECT_TRUE(scene.removeNode(scene.lightHandler().get(light)->lightNode));
    EXPECT_TRUE(scene.selection().selection().empty());
}

TEST_F(SceneTest, ClearKeepsIdsCounting) {
    const LightId first = scene.lightHandler().create(LightKind::Point);
    scene.graph().createNode("Chair", NodeKind::Mesh);

    scene.clear();
    EXPECT_EQ(scene.graph().size(), 0);
    EXPECT_EQ(scene.lightHandler().count(), 0u);

    EXPECT_GT(scene.lightHandler().create(LightKind::Point), first);
}

TEST_F(SceneTest, RenderCleanRunsThroughScene) {
    scene.graph().createNode("Grid", NodeKind::Mesh);
    scene.lightHandler().createDefaultRig();

    int visibleDuringRender = 0;
    EXPECT_TRUE(scene.renderClean([&](const SysNodeGraph& g) {
        for (NodeId id : g.traverse()) {
            if (g.node(id)->visible())
                ++visibleDuringRender;
        }
    }));

    // Three light nodes; the grid and the directional helpers are hidden.
    EXPECT_EQ(visibleDuringRender, 3);
}

TEST_F(SceneTest, ChangeCounterTracksGraphAndLights) {
    SysMonitor monitor(scene.changeCounter());
    EXPECT_TRUE(monitor.changed());
    EXPECT_FALSE(monitor.changed());

    const LightId light = scene.lightHandler().create(LightKind::Point);
    EXPECT_TRUE(monitor.changed());

    scene.lightHandler().updateProperty(light, "intensity", 2.0);
    EXPECT_TRUE(monitor.changed());

    scene.graph().createNode("Chair", NodeKind::Mesh);
    EXPECT_TRUE(monitor.changed());

    ASSERT_NE(scene.sceneQuery(), nullptr);
}
