#include "LightLinks.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

class LightLinkTableTest : public ::testing::Test {
protected:
    LightLinkTable table;
};

TEST_F(LightLinkTableTest, MissingEntryMeansFullyLinked) {
    EXPECT_FALSE(table.get(1, 10).has_value());
    EXPECT_TRUE(table.affects(1, 10));
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(LightLinkTableTest, SetClampsInfluence) {
    EXPECT_TRUE(table.set(1, 10, LightLink{true, 3.0f}));
    EXPECT_FLOAT_EQ(table.get(1, 10)->influence, 1.0f);

    EXPECT_TRUE(table.set(1, 11, LightLink{true, -2.0f}));
    EXPECT_FLOAT_EQ(table.get(1, 11)->influence, 0.0f);
    EXPECT_FALSE(table.affects(1, 11));

    EXPECT_TRUE(table.set(1, 12, LightLink{true, std::numeric_limits<float>::quiet_NaN()}));
    EXPECT_FLOAT_EQ(table.get(1, 12)->influence, 1.0f);

    EXPECT_FALSE(table.set(kInvalidLightId, 10, LightLink{}));
    EXPECT_FALSE(table.set(1, kInvalidNodeId, LightLink{}));
    EXPECT_EQ(table.size(), 3u);
}

TEST_F(LightLinkTableTest, BulkToggleByLightAndByMesh) {
    const std::vector<NodeId>  meshes = {10, 11, 12};
    const std::vector<LightId> lights = {1, 2};

    table.disableForAll(1, meshes);
    for (NodeId m : meshes)
        EXPECT_FALSE(table.affects(1, m));
    EXPECT_TRUE(table.affects(2, 10));

    table.disableAllLights(20, lights);
    EXPECT_FALSE(table.affects(1, 20));
    EXPECT_FALSE(table.affects(2, 20));

    table.enableForAll(1, meshes);
    EXPECT_TRUE(table.affects(1, 11));

    // Enabling keeps a previously set influence.
    ASSERT_TRUE(table.set(2, 20, LightLink{false, 0.25f}));
    table.enableAllLights(20, lights);
    EXPECT_TRUE(table.get(2, 20)->enabled);
    EXPECT_FLOAT_EQ(table.get(2, 20)->influence, 0.25f);
}

TEST_F(LightLinkTableTest, RemoveByLightOrMesh) {
    table.set(1, 10, LightLink{false, 1.0f});
    table.set(1, 11, LightLink{false, 1.0f});
    table.set(2, 10, LightLink{false, 1.0f});

    EXPECT_EQ(table.removeMesh(10), 2u);
    EXPECT_EQ(table.removeLight(1), 1u);
    EXPECT_EQ(table.size(), 0u);

    table.set(3, 30, LightLink{});
    EXPECT_TRUE(table.remove(3, 30));
    EXPECT_FALSE(table.remove(3, 30));
}

TEST_F(LightLinkTableTest, AllIsOrderedByLightThenMesh) {
    table.set(2, 5, LightLink{});
    table.set(1, 9, LightLink{});
    table.set(1, 3, LightLink{false, 0.5f});

    const auto entries = table.all();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].light, 1);
    EXPECT_EQ(entries[0].mesh, 3);
    EXPECT_FALSE(entries[0].link.enabled);
    EXPECT_EQ(entries[1].mesh, 9);
    EXPECT_EQ(entries[2].light, 2);

    table.clear();
    EXPECT_TRUE(table.all().empty());
}
