#include <gtest/gtest.h>
#include "loft/MeshMerger.hpp"
#include "math/BoxGeometry.hpp"

namespace {
    Geometry triangle(glm::vec3 offset) {
        Geometry g;
        g.vertices.emplace_back(offset + glm::vec3(0.0f, 0.0f, 0.0f));
        g.vertices.emplace_back(offset + glm::vec3(1.0f, 0.0f, 0.0f));
        g.vertices.emplace_back(offset + glm::vec3(0.0f, 1.0f, 0.0f));
        g.indices = {0, 1, 2};
        return g;
    }
}

TEST(MeshMerger, CountsAndIndexOffsets) {
    Geometry a = triangle(glm::vec3(0.0f));
    Geometry b = BoxGeometry(glm::vec3(1.0f));
    Geometry c = triangle(glm::vec3(5.0f));

    Geometry merged = MeshMerger::merge({&a, &b, &c});
    size_t total = a.vertices.size() + b.vertices.size() + c.vertices.size();
    ASSERT_EQ(merged.vertices.size(), total);
    ASSERT_EQ(merged.indices.size(), a.indices.size() + b.indices.size() + c.indices.size());
    for (uint index : merged.indices) {
        EXPECT_LT(index, total);
    }

    uint offset = static_cast<uint>(a.vertices.size() + b.vertices.size());
    std::vector<uint> tail(merged.indices.end() - 3, merged.indices.end());
    EXPECT_EQ(tail, (std::vector<uint>{offset, offset + 1, offset + 2}));
    EXPECT_EQ(merged.vertices[offset].position, glm::vec3(5.0f));
}

TEST(MeshMerger, MissingAttributesAreZeroFilled) {
    Geometry colored = triangle(glm::vec3(0.0f));
    colored.setColor(glm::vec3(1.0f, 0.0f, 0.0f));
    Geometry plain = triangle(glm::vec3(2.0f));
    for (Vertex &v : plain.vertices) {
        v.color = glm::vec3(0.5f);
        v.texCoord = glm::vec2(0.5f);
    }

    Geometry merged = MeshMerger::merge({&colored, &plain});
    EXPECT_TRUE(merged.hasColors);
    EXPECT_EQ(merged.vertices[0].color, glm::vec3(1.0f, 0.0f, 0.0f));
    for (size_t i = 3; i < 6; ++i) {
        EXPECT_EQ(merged.vertices[i].color, glm::vec3(0.0f));
        EXPECT_EQ(merged.vertices[i].texCoord, glm::vec2(0.0f));
    }
}

TEST(MeshMerger, NormalsAreRecomputed) {
    Geometry a = triangle(glm::vec3(0.0f));
    for (Vertex &v : a.vertices) {
        v.normal = glm::vec3(1.0f, 0.0f, 0.0f);
    }
    Geometry merged = MeshMerger::merge({&a});
    for (const Vertex &v : merged.vertices) {
        EXPECT_NEAR(v.normal.z, 1.0f, 1e-6f);
    }
}

TEST(MeshMerger, EmptyInput) {
    Geometry merged = MeshMerger::merge({});
    EXPECT_TRUE(merged.empty());
}
