#include <gtest/gtest.h>
#include "loft/SkinWeights.hpp"
#include "loft/Skeleton.hpp"
#include <cmath>

TEST(SkinWeights, JointRegionBlendsTwoBones) {
    std::vector<glm::vec3> bones = {glm::vec3(0.0f), glm::vec3(0.0f, 0.2f, 0.0f)};
    SkinBinding binding = SkinWeightAssigner::assign(glm::vec3(0.0f, 0.05f, 0.0f), bones);

    EXPECT_EQ(binding.joints, glm::ivec2(0, 1));
    EXPECT_NEAR(binding.weights.x, 0.75f, 1e-5f);
    EXPECT_NEAR(binding.weights.y, 0.25f, 1e-5f);
    EXPECT_EQ(binding.influenceCount(), 2);
}

TEST(SkinWeights, FarFromJointsBindsToNearestBone) {
    std::vector<glm::vec3> bones = {glm::vec3(0.0f), glm::vec3(0.0f, 0.2f, 0.0f), glm::vec3(0.0f, 3.0f, 0.0f)};
    SkinBinding binding = SkinWeightAssigner::assign(glm::vec3(0.5f, 3.0f, 0.0f), bones);
    EXPECT_EQ(binding.joints.x, 2);
    EXPECT_FLOAT_EQ(binding.weights.x, 1.0f);
    EXPECT_FLOAT_EQ(binding.weights.y, 0.0f);
    EXPECT_EQ(binding.influenceCount(), 1);
}

TEST(SkinWeights, ThresholdIsConfigurable) {
    std::vector<glm::vec3> bones = {glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f)};
    glm::vec3 p(0.3f, 0.0f, 0.0f);
    EXPECT_EQ(SkinWeightAssigner::assign(p, bones).influenceCount(), 1);
    EXPECT_EQ(SkinWeightAssigner::assign(p, bones, 0.5f).influenceCount(), 2);
}

TEST(SkinWeights, WeightsSumToOneOverHumanoid) {
    Skeleton skeleton = Skeleton::humanoid();
    std::vector<Vertex> vertices;
    for (int x = -6; x <= 6; ++x) {
        for (int y = 0; y <= 20; ++y) {
            for (int z = -2; z <= 2; ++z) {
                vertices.emplace_back(glm::vec3(x * 0.07f, y * 0.09f, z * 0.05f));
            }
        }
    }
    for (const glm::vec3 &bone : skeleton.bindWorldPositions) {
        vertices.emplace_back(bone);
    }

    std::vector<SkinBinding> bindings = SkinWeightAssigner::assign(vertices, skeleton.bindWorldPositions);
    ASSERT_EQ(bindings.size(), vertices.size());

    int blended = 0;
    for (const SkinBinding &binding : bindings) {
        EXPECT_LT(std::fabs(binding.weights.x + binding.weights.y - 1.0f), 1e-5f);
        int nonzero = (binding.weights.x > 0.0f ? 1 : 0) + (binding.weights.y > 0.0f ? 1 : 0);
        EXPECT_GE(nonzero, 1);
        EXPECT_LE(nonzero, 2);
        EXPECT_GE(binding.joints.x, 0);
        EXPECT_LT(binding.joints.x, static_cast<int>(skeleton.size()));
        if (nonzero == 2) {
            EXPECT_NE(binding.joints.x, binding.joints.y);
            ++blended;
        }
    }
    EXPECT_GT(blended, 0);
}
