#include "LightHandler.hpp"
#include "SceneQueryCpu.hpp"
#include "SelectionResolver.hpp"
#include "SysNodeGraph.hpp"
#include "Viewport.hpp"
#include <cmath>
#include <gtest/gtest.h>

namespace
{
    NodeGeometry quad(float size)
    {
        const float h = size * 0.5f;

        NodeGeometry geo;
        geo.positions = {{-h, -h, 0.0f}, {h, -h, 0.0f}, {h, h, 0.0f}, {-h, h, 0.0f}};
        geo.indices   = {0, 1, 2, 0, 2, 3};
        return geo;
    }

    CoreEvent at(const glm::vec3& screen)
    {
        CoreEvent e;
        e.x = screen.x;
        e.y = screen.y;
        return e;
    }

    CoreEvent offset(const CoreEvent& e, float dx, float dy)
    {
        CoreEvent moved = e;
        moved.x += dx;
        moved.y += dy;
        return moved;
    }
} // namespace

class SelectionResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        vp.resize(800, 600);
        vp.apply();

        meshA = addQuad("A", glm::vec3(-2.0f, 0.0f, 0.0f));
        meshB = addQuad("B", glm::vec3(2.0f, 0.0f, 0.0f));

        LightInit pointInit;
        pointInit.position = glm::vec3(0.0f, -2.0f, 0.0f);
        point              = lights.create(LightKind::Point, pointInit);

        LightInit areaInit;
        areaInit.position = glm::vec3(0.0f, 2.0f, 0.0f);
        area              = lights.create(LightKind::Area, areaInit);
    }

    NodeId addQuad(std::string_view name, const glm::vec3& pos) {
        const NodeId id = graph.createNode(name, NodeKind::Mesh);
        graph.setGeometry(id, quad(1.0f));
        graph.node(id)->position(pos);
        return id;
    }

    SelectionChange click(const glm::vec3& world) {
        const CoreEvent e = at(vp.project(world));
        resolver.pointerDown(e);
        return resolver.pointerUp(vp, e);
    }

    glm::vec3 pan{0.0f};
    glm::vec3 rot{0.0f};
    float     dist = -10.0f;
    Viewport  vp{pan, rot, dist};

    SysNodeGraph      graph;
    SceneQueryCpu     query;
    LightHandler      lights{graph};
    SelectionResolver resolver{graph, query};

    NodeId  meshA = kInvalidNodeId;
    NodeId  meshB = kInvalidNodeId;
    LightId point = kInvalidLightId;
    LightId area  = kInvalidLightId;
};

TEST_F(SelectionResolverTest, ClickSelectsMeshUnderPointer) {
    const SelectionChange change = click(glm::vec3(-2.0f, 0.0f, 0.0f));

    EXPECT_TRUE(change.changed);
    EXPECT_TRUE(change.previous.empty());
    EXPECT_EQ(change.current.kind, Selection::Kind::Node);
    EXPECT_EQ(change.current.node, meshA);
    EXPECT_EQ(resolver.selection().node, meshA);
    EXPECT_EQ(resolver.state(), PointerState::Idle);

    EXPECT_EQ(click(glm::vec3(2.0f, 0.0f, 0.0f)).current.node, meshB);
}

TEST_F(SelectionResolverTest, ClickingSameTargetReportsNoChange) {
    click(glm::vec3(-2.0f, 0.0f, 0.0f));
    const SelectionChange again = click(glm::vec3(-1.9f, 0.1f, 0.0f));

    EXPECT_FALSE(again.changed);
    EXPECT_EQ(resolver.selection().node, meshA);
}

TEST_F(SelectionResolverTest, DragNeverChangesSelection) {
    click(glm::vec3(-2.0f, 0.0f, 0.0f));

    const CoreEvent down = at(vp.project(glm::vec3(2.0f, 0.0f, 0.0f)));
    resolver.pointerDown(down);
    EXPECT_EQ(resolver.state(), PointerState::Pressed);

    resolver.pointerMove(offset(down, 10.0f, 0.0f));
    EXPECT_EQ(resolver.state(), PointerState::Dragging);

    // Coming back over the start point does not turn a drag into a click.
    resolver.pointerMove(down);
    const SelectionChange change = resolver.pointerUp(vp, down);

    EXPECT_FALSE(change.changed);
    EXPECT_EQ(resolver.selection().node, meshA);
    EXPECT_EQ(resolver.state(), PointerState::Idle);
}

TEST_F(SelectionResolverTest, JitterBelowThresholdStillClicks) {
    const CoreEvent down = at(vp.project(glm::vec3(2.0f, 0.0f, 0.0f)));
    resolver.pointerDown(down);
    resolver.pointerMove(offset(down, 2.0f, 2.0f));
    EXPECT_EQ(resolver.state(), PointerState::Pressed);

    const SelectionChange change = resolver.pointerUp(vp, offset(down, 2.0f, 2.0f));
    EXPECT_EQ(change.current.node, meshB);
}

TEST_F(SelectionResolverTest, ClickOnEmptySpaceClears) {
    click(glm::vec3(-2.0f, 0.0f, 0.0f));

    CoreEvent corner;
    corner.x = 5.0f;
    corner.y = 5.0f;
    resolver.pointerDown(corner);
    const SelectionChange change = resolver.pointerUp(vp, corner);

    EXPECT_TRUE(change.changed);
    EXPECT_TRUE(resolver.selection().empty());
}

TEST_F(SelectionResolverTest, LightSelectorsResolveToTheirLight) {
    const SelectionChange pointPick = click(glm::vec3(0.0f, -2.0f, 0.0f));
    EXPECT_EQ(pointPick.current.kind, Selection::Kind::Light);
    EXPECT_EQ(pointPick.current.light, point);
    EXPECT_EQ(lights.lightIdForNode(pointPick.current.node), point);

    const SelectionChange areaPick = click(glm::vec3(0.0f, 2.0f, 0.0f));
    EXPECT_EQ(areaPick.current.kind, Selection::Kind::Light);
    EXPECT_EQ(areaPick.current.light, area);
    EXPECT_EQ(areaPick.current.node, lights.get(area)->proxyNode);
}

TEST_F(SelectionResolverTest, HiddenNodesAreNotPickable) {
    graph.node(meshA)->visible(false);
    EXPECT_TRUE(click(glm::vec3(-2.0f, 0.0f, 0.0f)).current.empty());

    lights.setVisible(point, false);
    EXPECT_TRUE(click(glm::vec3(0.0f, -2.0f, 0.0f)).current.empty());
}

TEST_F(SelectionResolverTest, ReleaseWithoutPressIsIgnored) {
    click(glm::vec3(2.0f, 0.0f, 0.0f));

    const CoreEvent e = at(vp.project(glm::vec3(-2.0f, 0.0f, 0.0f)));
    resolver.pointerMove(e);
    EXPECT_EQ(resolver.state(), PointerState::Idle);
    EXPECT_FALSE(resolver.pointerUp(vp, e).changed);

    resolver.pointerDown(e);
    resolver.pointerCancel();
    EXPECT_FALSE(resolver.pointerUp(vp, e).changed);
    EXPECT_EQ(resolver.selection().node, meshB);
}

TEST_F(SelectionResolverTest, ResolveHonorsCandidateOrderOnTies) {
    const NodeId twin = addQuad("A Twin", glm::vec3(-2.0f, 0.0f, 0.0f));
    const un::ray ray = un::make_ray(glm::vec3(-2.0f, 0.0f, 10.0f), glm::vec3(0.0f, 0.0f, -1.0f));

    EXPECT_EQ(resolver.resolve(ray, std::vector<NodeId>{twin, meshA}).node, twin);
    EXPECT_EQ(resolver.resolve(ray, std::vector<NodeId>{meshA, twin}).node, meshA);

    // resolve() does not select.
    EXPECT_TRUE(resolver.selection().empty());
}

TEST(SelectionTest, LightTargetIgnoresWhichSelectorWasHit) {
    EXPECT_TRUE(Selection::ofLight(3, 10).sameTarget(Selection::ofLight(3, 11)));
    EXPECT_FALSE(Selection::ofLight(3, 10).sameTarget(Selection::ofLight(4, 10)));
    EXPECT_FALSE(Selection::ofNode(10).sameTarget(Selection::ofLight(3, 10)));
    EXPECT_TRUE(Selection::none().sameTarget(Selection::none()));
}

TEST(ViewportTest, CenterRayLooksDownTheOrbitAxis) {
    glm::vec3 pan(0.0f);
    glm::vec3 rot(0.0f);
    float     dist = -10.0f;
    Viewport  vp(pan, rot, dist);
    vp.resize(800, 600);
    vp.apply();

    const glm::vec3 cam = vp.cameraPosition();
    EXPECT_NEAR(cam.z, 10.0f, 1e-4f);

    const un::ray r = vp.ray(400.0f, 300.0f);
    EXPECT_NEAR(r.dir.z, -1.0f, 1e-4f);
    EXPECT_NEAR(r.org.x, 0.0f, 1e-4f);

    const glm::vec3 screen = vp.project(glm::vec3(1.0f, 1.0f, 0.0f));
    EXPECT_GT(screen.x, 400.0f);
    EXPECT_LT(screen.y, 300.0f); // y down

    const glm::vec3 back = vp.unproject(screen);
    EXPECT_NEAR(back.x, 1.0f, 1e-2f);
    EXPECT_NEAR(back.y, 1.0f, 1e-2f);
    EXPECT_NEAR(back.z, 0.0f, 1e-2f);

    // Depth 0 is the near plane in front of the camera.
    EXPECT_NEAR(vp.unproject(glm::vec3(400.0f, 300.0f, 0.0f)).z, 9.9f, 1e-3f);
}

TEST(ViewportTest, OrbitMovesCameraAroundAnchor) {
    glm::vec3 pan(0.0f);
    glm::vec3 rot(0.0f);
    float     dist = -10.0f;
    Viewport  vp(pan, rot, dist);
    vp.resize(800, 600);

    SysMonitor monitor(vp.changeCounter());
    EXPECT_TRUE(monitor.changed());

    vp.rotate(-90.0f, 0.0f);
    EXPECT_TRUE(monitor.changed());
    vp.apply();

    const glm::vec3 cam = vp.cameraPosition();
    EXPECT_NEAR(glm::length(cam), 10.0f, 1e-3f);
    EXPECT_NEAR(std::abs(cam.x), 10.0f, 1e-3f);

    EXPECT_EQ(vp.width(), 800);
    EXPECT_EQ(vp.height(), 600);
}
