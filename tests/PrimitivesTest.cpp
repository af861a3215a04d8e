#include <gtest/gtest.h>
#include "loft/Primitives.hpp"
#include "loft/VertexColorizer.hpp"
#include "math/Math.hpp"
#include <glm/gtc/constants.hpp>

namespace {
    AddonSpec addon(const std::string &type) {
        AddonSpec spec;
        spec.id = type;
        spec.type = type;
        return spec;
    }

    void expectVec(const glm::vec3 &actual, const glm::vec3 &expected, float eps = 1e-4f) {
        EXPECT_NEAR(actual.x, expected.x, eps);
        EXPECT_NEAR(actual.y, expected.y, eps);
        EXPECT_NEAR(actual.z, expected.z, eps);
    }
}

TEST(Primitives, BoxAddonIsTranslatedAndColored) {
    AddonSpec spec = addon("box");
    spec.size = glm::vec3(2.0f, 4.0f, 6.0f);
    spec.position = glm::vec3(1.0f, 0.0f, 0.0f);
    spec.color = glm::vec3(1.0f, 0.0f, 0.0f);

    std::optional<Geometry> geometry = Primitives::buildAddon(spec);
    ASSERT_TRUE(geometry.has_value());
    expectVec(geometry->getMin(), glm::vec3(0.0f, -2.0f, -3.0f));
    expectVec(geometry->getMax(), glm::vec3(2.0f, 2.0f, 3.0f));
    EXPECT_EQ(geometry->triangleCount(), 12u);
    EXPECT_TRUE(geometry->hasColors);
    for (const Vertex &v : geometry->vertices) {
        EXPECT_EQ(v.color, glm::vec3(1.0f, 0.0f, 0.0f));
    }
}

TEST(Primitives, AddonRotatesBeforeTranslating) {
    AddonSpec spec = addon("box");
    spec.size = glm::vec3(2.0f, 4.0f, 6.0f);
    spec.rotation = glm::vec3(0.0f, 0.0f, glm::half_pi<float>());
    spec.position = glm::vec3(10.0f, 0.0f, 0.0f);

    std::optional<Geometry> geometry = Primitives::buildAddon(spec);
    ASSERT_TRUE(geometry.has_value());
    expectVec(geometry->getMin(), glm::vec3(8.0f, -1.0f, -3.0f));
    expectVec(geometry->getMax(), glm::vec3(12.0f, 1.0f, 3.0f));
    for (const Vertex &v : geometry->vertices) {
        EXPECT_EQ(v.color, Math::hexToRgb(0xcccccc));
    }
}

TEST(Primitives, CylinderAndSphereDefaults) {
    AddonSpec cylinder = addon("cylinder");
    cylinder.radius = 0.5f;
    cylinder.height = 2.0f;
    std::optional<Geometry> c = Primitives::buildAddon(cylinder);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->triangleCount(), 8u * 4u);
    EXPECT_NEAR(c->getMax().y, 1.0f, 1e-5f);

    AddonSpec cone = addon("cylinder");
    cone.radiusTop = 0.0f;
    cone.radiusBottom = 1.0f;
    cone.segments = 6;
    std::optional<Geometry> k = Primitives::buildAddon(cone);
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->triangleCount(), 6u * 2u);

    AddonSpec sphere = addon("sphere");
    sphere.radius = 1.0f;
    std::optional<Geometry> s = Primitives::buildAddon(sphere);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->triangleCount(), 6u * 6u);
    for (const Vertex &v : s->vertices) {
        EXPECT_NEAR(glm::length(v.position), 1.0f, 1e-5f);
    }
}

TEST(Primitives, UnknownAddonTypeIsSkipped) {
    EXPECT_FALSE(Primitives::buildAddon(addon("torus")).has_value());
}

TEST(Primitives, WheelAssembly) {
    float r = 0.25f;
    float w = 0.14f;
    std::vector<MeshPart> right = Primitives::wheel(r, w, true);
    ASSERT_EQ(right.size(), 2u);
    const MeshPart &tire = right[0];
    const MeshPart &hub = right[1];

    // Tire and hub cap are 4 triangles per segment, each spoke a 12-triangle box
    EXPECT_EQ(tire.geometry.triangleCount(), 14u * 4u);
    EXPECT_EQ(hub.geometry.triangleCount(), 10u * 4u + 5u * 12u);
    EXPECT_NEAR(hub.geometry.getMax().x, w * 0.5f + 0.02f, 1e-4f);
    EXPECT_NEAR(tire.geometry.getMin().x, -w * 0.5f, 1e-4f);
    EXPECT_NEAR(tire.geometry.getMax().z, r, 1e-4f);

    std::vector<Geometry> left;
    for (const MeshPart &part : Primitives::wheel(r, w, false)) {
        left.push_back(part.geometry);
    }
    EXPECT_NEAR(left[1].getMin().x, -(w * 0.5f + 0.02f), 1e-4f);

    EXPECT_EQ(Math::rgbToHex(tire.material.color), Primitives::TIRE_COLOR);
    EXPECT_FLOAT_EQ(tire.material.roughness, 0.95f);
    EXPECT_FLOAT_EQ(tire.material.metalness, 0.0f);
    EXPECT_EQ(Math::rgbToHex(hub.material.color), Primitives::HUB_COLOR);
    EXPECT_FLOAT_EQ(hub.material.roughness, 0.2f);
    EXPECT_FLOAT_EQ(hub.material.metalness, 0.8f);
    for (const Vertex &v : tire.geometry.vertices) {
        EXPECT_EQ(Math::rgbToHex(v.color), Primitives::TIRE_COLOR);
    }
}

TEST(Primitives, ChildObjects) {
    ChildSpec wheel;
    wheel.name = "wheel_fr";
    wheel.type = "wheel";
    wheel.radius = Primitives::WHEEL_RADIUS;
    wheel.position = glm::vec3(0.5f, 0.25f, 1.0f);
    std::optional<ChildObject> w = Primitives::buildChild(wheel);
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->name, "wheel_fr");
    EXPECT_EQ(w->transform.translate, wheel.position);
    ASSERT_EQ(w->parts.size(), 2u);
    EXPECT_GT(w->parts[1].geometry.getMax().x, 0.085f);

    ChildSpec light;
    light.name = "headlight";
    light.type = "cylinder";
    light.radius = 0.05f;
    light.height = 0.2f;
    light.rotateX = glm::half_pi<float>();
    light.color = glm::vec3(1.0f, 1.0f, 0.0f);
    light.material.emissive = glm::vec3(1.0f, 1.0f, 0.0f);
    light.material.emissiveIntensity = 1.5f;
    std::optional<ChildObject> l = Primitives::buildChild(light);
    ASSERT_TRUE(l.has_value());
    ASSERT_EQ(l->parts.size(), 1u);
    const MeshPart &part = l->parts[0];
    // The axis now runs along Z
    EXPECT_NEAR(part.geometry.getMax().z, 0.1f, 1e-4f);
    EXPECT_NEAR(part.geometry.getMax().y, 0.05f, 1e-4f);
    EXPECT_EQ(part.material.color, glm::vec3(1.0f, 1.0f, 0.0f));
    EXPECT_FLOAT_EQ(part.material.emissiveIntensity, 1.5f);
    EXPECT_FLOAT_EQ(part.material.roughness, Material::CHILD_ROUGHNESS);
    EXPECT_FLOAT_EQ(part.material.metalness, Material::CHILD_METALNESS);
    for (const Vertex &v : part.geometry.vertices) {
        EXPECT_EQ(v.color, glm::vec3(1.0f, 1.0f, 0.0f));
    }

    ChildSpec box;
    box.type = "box";
    std::optional<ChildObject> b = Primitives::buildChild(box);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(Math::rgbToHex(b->parts[0].material.color), VertexColorizer::DEFAULT_COLOR);

    ChildSpec unknown;
    unknown.type = "exhaust";
    EXPECT_FALSE(Primitives::buildChild(unknown).has_value());
}
