#include <gtest/gtest.h>
#include "loft/OutlineNormalizer.hpp"
#include <cmath>

TEST(OutlineNormalizer, SquareAtCardinalAngles) {
    Polyline square = {
        glm::vec2(90.0f, 90.0f), glm::vec2(110.0f, 90.0f),
        glm::vec2(110.0f, 110.0f), glm::vec2(90.0f, 110.0f)
    };
    std::optional<std::vector<glm::vec2>> shape = OutlineNormalizer::normalize(square, 100.0f, 100.0f, 4);
    ASSERT_TRUE(shape.has_value());
    ASSERT_EQ(shape->size(), 4u);

    glm::vec2 expected[4] = {{0, 1}, {1, 0}, {0, -1}, {-1, 0}};
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR((*shape)[i].x, expected[i].x, 1e-5f) << "slot " << i;
        EXPECT_NEAR((*shape)[i].y, expected[i].y, 1e-5f) << "slot " << i;
    }
}

TEST(OutlineNormalizer, DiamondPullsDiagonalsInward) {
    Polyline diamond = {
        glm::vec2(100.0f, 90.0f), glm::vec2(110.0f, 100.0f),
        glm::vec2(100.0f, 110.0f), glm::vec2(90.0f, 100.0f)
    };
    std::optional<std::vector<glm::vec2>> shape = OutlineNormalizer::normalize(diamond, 100.0f, 100.0f, 8);
    ASSERT_TRUE(shape.has_value());
    ASSERT_EQ(shape->size(), 8u);
    EXPECT_NEAR((*shape)[1].x, 0.5f, 1e-5f);
    EXPECT_NEAR((*shape)[1].y, 0.5f, 1e-5f);
    EXPECT_NEAR((*shape)[0].y, 1.0f, 1e-5f);
}

TEST(OutlineNormalizer, MissedRayKeepsUnitLength) {
    Polyline square = {
        glm::vec2(-1.0f, -1.0f), glm::vec2(1.0f, -1.0f),
        glm::vec2(1.0f, 1.0f), glm::vec2(-1.0f, 1.0f)
    };
    std::optional<std::vector<glm::vec2>> shape = OutlineNormalizer::normalize(square, 0.0f, 0.0f, 8);
    ASSERT_TRUE(shape.has_value());
    // The corner lies beyond t = 1, so the diagonal slot stays on the unit circle
    EXPECT_NEAR(glm::length((*shape)[1]), 1.0f, 1e-5f);
}

TEST(OutlineNormalizer, CastRay) {
    Polyline halfSquare = {
        glm::vec2(-0.5f, -0.5f), glm::vec2(0.5f, -0.5f),
        glm::vec2(0.5f, 0.5f), glm::vec2(-0.5f, 0.5f)
    };
    EXPECT_NEAR(OutlineNormalizer::castRay(halfSquare, glm::vec2(1.0f, 0.0f)), 0.5f, 1e-6f);
    EXPECT_NEAR(OutlineNormalizer::castRay(halfSquare, glm::vec2(0.0f, -1.0f)), 0.5f, 1e-6f);
}

TEST(OutlineNormalizer, RejectsDegenerateOutlines) {
    Polyline line = {glm::vec2(90.0f, 100.0f), glm::vec2(110.0f, 100.0f), glm::vec2(100.0f, 100.0f)};
    EXPECT_FALSE(OutlineNormalizer::normalize(line, 100.0f, 100.0f, 8).has_value());

    Polyline two = {glm::vec2(90.0f, 90.0f), glm::vec2(110.0f, 110.0f)};
    EXPECT_FALSE(OutlineNormalizer::normalize(two, 100.0f, 100.0f, 8).has_value());
}
