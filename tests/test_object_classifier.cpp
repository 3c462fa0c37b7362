#include "ObjectClassifier.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"
#include <gtest/gtest.h>

class ObjectClassifierTest : public ::testing::Test {
protected:
    NodeId add(std::string_view name, NodeKind kind, NodeId parent = kInvalidNodeId) {
        return graph.createNode(name, kind, parent);
    }

    ObjectCategory classify(NodeId id) const {
        return classifier::classify(graph, id);
    }

    SysNodeGraph graph;
};

TEST_F(ObjectClassifierTest, KindTagDecidesPlainContent) {
    EXPECT_EQ(classify(add("Chair", NodeKind::Mesh)), ObjectCategory::UserMesh);
    EXPECT_EQ(classify(add("Sun", NodeKind::Light)), ObjectCategory::UserLight);
    EXPECT_EQ(classify(add("Shot 1", NodeKind::Camera)), ObjectCategory::UserCamera);

    const NodeId group = add("Furniture", NodeKind::Group);
    add("Table", NodeKind::Mesh, group);
    EXPECT_EQ(classify(group), ObjectCategory::UserGroup);

    // An empty group carries nothing to show.
    EXPECT_EQ(classify(add("Empty", NodeKind::Group)), ObjectCategory::Unknown);
}

TEST_F(ObjectClassifierTest, AttributesBeatNamesAndKind) {
    const NodeId helper = add("Chair", NodeKind::Mesh);
    graph.node(helper)->editAttributes().set(std::string(tags::kIsHelper), true);
    EXPECT_EQ(classify(helper), ObjectCategory::SystemHelper);

    const NodeId lightPart = add("Chair", NodeKind::Mesh);
    graph.node(lightPart)->editAttributes().set(std::string(tags::kLightId), int64_t{3});
    EXPECT_EQ(classify(lightPart), ObjectCategory::SystemLightHelper);

    const NodeId handle = add("Grid", NodeKind::Mesh);
    graph.node(handle)->editAttributes().set(std::string(tags::kIsTransformHandle), true);
    EXPECT_EQ(classify(handle), ObjectCategory::TransformHandle);

    const NodeId gizmo = add("Cube", NodeKind::Mesh);
    graph.node(gizmo)->editAttributes().set(std::string(tags::kIsGizmo), true);
    EXPECT_EQ(classify(gizmo), ObjectCategory::TransformControl);

    // Generic system tags outrank the light-helper tags.
    const NodeId both = add("Rig Part", NodeKind::Mesh);
    graph.node(both)->editAttributes().set(std::string(tags::kIsSystemObject), true);
    graph.node(both)->editAttributes().set(std::string(tags::kLightId), int64_t{3});
    EXPECT_EQ(classify(both), ObjectCategory::SystemHelper);

    // A false flag is not a hint.
    const NodeId falseFlag = add("Cube", NodeKind::Mesh);
    graph.node(falseFlag)->editAttributes().set(std::string(tags::kIsHelper), false);
    EXPECT_EQ(classify(falseFlag), ObjectCategory::UserMesh);
}

TEST_F(ObjectClassifierTest, TransformControlAncestorClaimsDescendants) {
    const NodeId controls = add("Controls", NodeKind::Group);
    graph.node(controls)->typeName("TransformControls");
    const NodeId plane = add("Plane", NodeKind::Group, controls);
    const NodeId picker = add("Picker", NodeKind::Mesh, plane);

    EXPECT_EQ(classify(controls), ObjectCategory::TransformControl);
    EXPECT_EQ(classify(picker), ObjectCategory::TransformControl);

    const NodeId byName = add("MyTransformControlRoot", NodeKind::Group);
    const NodeId child = add("Cube", NodeKind::Mesh, byName);
    EXPECT_EQ(classify(child), ObjectCategory::TransformControl);
}

TEST_F(ObjectClassifierTest, HelperTypeNames) {
    const NodeId grid = add("Floor", NodeKind::Other);
    graph.node(grid)->typeName("GridHelper");
    EXPECT_EQ(classify(grid), ObjectCategory::SystemGrid);

    const NodeId cam = add("Frustum", NodeKind::Other);
    graph.node(cam)->typeName("CameraHelper");
    EXPECT_EQ(classify(cam), ObjectCategory::SystemCameraHelper);

    const NodeId spot = add("Cone", NodeKind::Other);
    graph.node(spot)->typeName("SpotLightHelper");
    EXPECT_EQ(classify(spot), ObjectCategory::SystemLightHelper);

    const NodeId box = add("Bounds", NodeKind::Other);
    graph.node(box)->typeName("Box3Helper");
    EXPECT_EQ(classify(box), ObjectCategory::SystemHelper);
}

TEST_F(ObjectClassifierTest, AxisCodesAreTransformHandles) {
    for (const char* name : {"x", "Y", "xyz", "ZX", "e", "START", "end"})
        EXPECT_EQ(classify(add(name, NodeKind::Mesh)), ObjectCategory::TransformHandle) << name;

    EXPECT_EQ(classify(add("xyzw", NodeKind::Mesh)), ObjectCategory::UserMesh);
    EXPECT_EQ(classify(add("Box", NodeKind::Mesh)), ObjectCategory::UserMesh);
}

TEST_F(ObjectClassifierTest, NamePatternsMostSpecificFirst) {
    EXPECT_EQ(classify(add("PointLightHelper", NodeKind::Mesh)), ObjectCategory::SystemLightHelper);
    EXPECT_EQ(classify(add("camera_helper", NodeKind::Mesh)), ObjectCategory::SystemCameraHelper);
    EXPECT_EQ(classify(add("Grid", NodeKind::Mesh)), ObjectCategory::SystemGrid);
    EXPECT_EQ(classify(add("my helpers", NodeKind::Mesh)), ObjectCategory::SystemGizmo);
    EXPECT_EQ(classify(add("RotateGizmo", NodeKind::Mesh)), ObjectCategory::SystemGizmo);
    EXPECT_EQ(classify(add("Arrow2", NodeKind::Mesh)), ObjectCategory::SystemGizmo);
    EXPECT_EQ(classify(add("Axes", NodeKind::Mesh)), ObjectCategory::SystemGizmo);

    // Substrings inside a word are not patterns.
    EXPECT_EQ(classify(add("Ungridded", NodeKind::Mesh)), ObjectCategory::UserMesh);
    EXPECT_EQ(classify(add("Spotlight", NodeKind::Light)), ObjectCategory::UserLight);
}

TEST_F(ObjectClassifierTest, UntaggedNodesAreInspected) {
    const NodeId light = add("", NodeKind::Unknown);
    graph.node(light)->light(NodeLightData{});
    EXPECT_EQ(classify(light), ObjectCategory::UserLight);

    const NodeId mesh = add("", NodeKind::Unknown);
    NodeGeometry geo;
    geo.positions = {glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
    geo.indices = {0, 1, 2};
    ASSERT_TRUE(graph.setGeometry(mesh, geo));
    EXPECT_EQ(classify(mesh), ObjectCategory::UserMesh);

    const NodeId group = add("", NodeKind::Unknown);
    add("", NodeKind::Mesh, group);
    EXPECT_EQ(classify(group), ObjectCategory::UserGroup);

    EXPECT_EQ(classify(add("", NodeKind::Unknown)), ObjectCategory::Unknown);
}

TEST_F(ObjectClassifierTest, TotalAndDeterministicForAdversarialInput) {
    const std::vector<std::string> names = {"", "xyz", "helper", "HELPER", "__", "light helper camera", std::string(4096, 'x'), "\xff\xfe", "123"};

    for (const std::string& name : names) {
        for (NodeKind kind : {NodeKind::Unknown, NodeKind::Mesh, NodeKind::Group, NodeKind::Other}) {
            const NodeId id = add(name, kind);
            const ObjectCategory first = classify(id);
            EXPECT_EQ(classify(id), first);
            EXPECT_EQ(classify(id), first);
        }
    }

    EXPECT_EQ(classify(kInvalidNodeId), ObjectCategory::Unknown);
    EXPECT_EQ(classify(9999), ObjectCategory::Unknown);
}

TEST_F(ObjectClassifierTest, UserAndSystemPredicates) {
    const NodeId mesh = add("Chair", NodeKind::Mesh);
    const NodeId grid = add("Grid", NodeKind::Mesh);
    const NodeId empty = add("Empty", NodeKind::Group);

    EXPECT_TRUE(classifier::isUserContent(graph, mesh));
    EXPECT_FALSE(classifier::isSystemObject(graph, mesh));
    EXPECT_TRUE(classifier::isSystemObject(graph, grid));
    EXPECT_FALSE(classifier::isUserContent(graph, empty));
    EXPECT_FALSE(classifier::isSystemObject(graph, empty));
}
