#include <gtest/gtest.h>
#include "loft/Skeleton.hpp"
#include <stdexcept>

namespace {
    void expectPosition(const Skeleton &skeleton, const std::string &bone, glm::vec3 expected) {
        int index = skeleton.indexOf(bone);
        ASSERT_GE(index, 0) << bone;
        glm::vec3 actual = skeleton.bindWorldPositions[index];
        EXPECT_NEAR(actual.x, expected.x, 1e-5f) << bone;
        EXPECT_NEAR(actual.y, expected.y, 1e-5f) << bone;
        EXPECT_NEAR(actual.z, expected.z, 1e-5f) << bone;
    }
}

TEST(Skeleton, HumanoidTable) {
    Skeleton skeleton = Skeleton::humanoid();
    ASSERT_EQ(skeleton.size(), 16u);
    ASSERT_EQ(skeleton.bindWorldPositions.size(), 16u);
    EXPECT_EQ(skeleton.bones[0].name, "Root");
    EXPECT_EQ(skeleton.bones[0].parent, -1);
    for (size_t i = 1; i < skeleton.size(); ++i) {
        EXPECT_LT(skeleton.bones[i].parent, static_cast<int>(i));
        EXPECT_GE(skeleton.bones[i].parent, 0);
    }
}

TEST(Skeleton, BindPoseAccumulatesThroughParents) {
    Skeleton skeleton = Skeleton::humanoid();
    expectPosition(skeleton, "Root", glm::vec3(0.0f, 0.95f, 0.0f));
    expectPosition(skeleton, "Chest", glm::vec3(0.0f, 1.35f, 0.0f));
    expectPosition(skeleton, "Head", glm::vec3(0.0f, 1.65f, 0.0f));
    expectPosition(skeleton, "L_Hand", glm::vec3(-0.38f, 0.75f, 0.0f));
    expectPosition(skeleton, "R_Elbow", glm::vec3(0.38f, 1.05f, 0.0f));
    expectPosition(skeleton, "L_Foot", glm::vec3(-0.12f, 0.15f, 0.0f));
    expectPosition(skeleton, "R_Knee", glm::vec3(0.12f, 0.55f, 0.0f));
}

TEST(Skeleton, RejectsForwardParents) {
    std::vector<BoneDef> bones = {
        {"A", -1, glm::vec3(0.0f)},
        {"B", 2, glm::vec3(0.0f)},
        {"C", 0, glm::vec3(0.0f)},
    };
    EXPECT_THROW(Skeleton{bones}, std::invalid_argument);

    std::vector<BoneDef> twoRoots = {
        {"A", -1, glm::vec3(0.0f)},
        {"B", -1, glm::vec3(0.0f)},
    };
    EXPECT_THROW(Skeleton{twoRoots}, std::invalid_argument);
}

TEST(Skeleton, IndexOf) {
    Skeleton skeleton = Skeleton::humanoid();
    EXPECT_EQ(skeleton.indexOf("Chest"), 2);
    EXPECT_EQ(skeleton.indexOf("R_Foot"), 15);
    EXPECT_EQ(skeleton.indexOf("Tail"), -1);
}
