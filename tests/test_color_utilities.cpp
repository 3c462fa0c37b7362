#include "ColorUtilities.hpp"
#include "CoreUtilities.hpp"
#include "NodeTypes.hpp"
#include <gtest/gtest.h>

TEST(ColorUtilitiesTest, ParsesLongAndShortHex) {
    const auto red = color::parseHex("#ff0000");
    ASSERT_TRUE(red.has_value());
    EXPECT_FLOAT_EQ(red->x, 1.0f);
    EXPECT_FLOAT_EQ(red->y, 0.0f);
    EXPECT_FLOAT_EQ(red->z, 0.0f);

    const auto shortForm = color::parseHex("#0F0");
    ASSERT_TRUE(shortForm.has_value());
    EXPECT_FLOAT_EQ(shortForm->y, 1.0f);

    const auto noHash = color::parseHex("404040");
    ASSERT_TRUE(noHash.has_value());
    EXPECT_NEAR(noHash->x, 64.0f / 255.0f, 1e-6f);
}

TEST(ColorUtilitiesTest, RejectsMalformedHex) {
    EXPECT_FALSE(color::parseHex("").has_value());
    EXPECT_FALSE(color::parseHex("#").has_value());
    EXPECT_FALSE(color::parseHex("#12345").has_value());
    EXPECT_FALSE(color::parseHex("#gg0000").has_value());
    EXPECT_FALSE(color::parseHex("red").has_value());
}

TEST(ColorUtilitiesTest, ToHexClampsAndFormats) {
    EXPECT_EQ(color::toHex(glm::vec3(1.0f, 0.0f, 0.0f)), "#ff0000");
    EXPECT_EQ(color::toHex(glm::vec3(2.0f, -1.0f, 0.5f)), "#ff0080");
    EXPECT_EQ(color::toHex(color::fromInt(0x404040)), "#404040");
}

TEST(CoreUtilitiesTest, NameTokensSplitCamelCaseDigitsAndSeparators) {
    EXPECT_EQ(un::name_tokens("PointLightHelper"), (std::vector<std::string>{"point", "light", "helper"}));
    EXPECT_EQ(un::name_tokens("my_grid-2"), (std::vector<std::string>{"my", "grid", "2"}));
    EXPECT_EQ(un::name_tokens("GLTFMesh01"), (std::vector<std::string>{"gltf", "mesh", "01"}));
    EXPECT_TRUE(un::name_tokens("").empty());
}

TEST(CoreUtilitiesTest, AimRotationPointsLocalMinusZAlongDirection) {
    NodeTransform xf;
    xf.rotation = un::aim_rotation(glm::vec3(-10.0f, -10.0f, -5.0f));

    const glm::vec3 forward = glm::vec3(xf.matrix() * glm::vec4(0.0f, 0.0f, -1.0f, 0.0f));
    const glm::vec3 expected = glm::normalize(glm::vec3(-10.0f, -10.0f, -5.0f));
    EXPECT_NEAR(forward.x, expected.x, 1e-5f);
    EXPECT_NEAR(forward.y, expected.y, 1e-5f);
    EXPECT_NEAR(forward.z, expected.z, 1e-5f);
}

TEST(CoreUtilitiesTest, RayTriangleReportsDistance) {
    const un::ray r = un::make_ray(glm::vec3(0.2f, 0.2f, 5.0f), glm::vec3(0.0f, 0.0f, -1.0f));

    float t = 0.0f;
    EXPECT_TRUE(un::ray_triangle_intersect(r, glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), t));
    EXPECT_NEAR(t, 5.0f, 1e-5f);

    const un::ray away = un::make_ray(glm::vec3(0.2f, 0.2f, 5.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    EXPECT_FALSE(un::ray_triangle_intersect(away, glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), t));
}
