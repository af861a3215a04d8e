#include "Primitives.hpp"
#include "MeshMerger.hpp"
#include "VertexColorizer.hpp"
#include "../math/BoxGeometry.hpp"
#include "../math/CylinderGeometry.hpp"
#include "../math/SphereGeometry.hpp"
#include "../math/Math.hpp"
#include <glm/gtc/constants.hpp>
#include <iostream>

std::optional<Geometry> Primitives::buildAddon(const AddonSpec &spec) {
    Geometry geometry;
    if (spec.type == "box") {
        geometry = BoxGeometry(spec.size);
    } else if (spec.type == "cylinder") {
        geometry = CylinderGeometry(spec.radiusTop.value_or(spec.radius), spec.radiusBottom.value_or(spec.radius), spec.height, spec.segments.value_or(8));
    } else if (spec.type == "sphere") {
        int segments = spec.segments.value_or(0);
        geometry = SphereGeometry(spec.radius, segments > 0 ? segments : 6, segments > 0 ? segments : 4);
    } else {
        std::cerr << "    Unknown addon type: " << spec.type << std::endl;
        return std::nullopt;
    }

    geometry.transform(Transformation(spec.position, spec.rotation));
    geometry.setColor(spec.color.value_or(Math::hexToRgb(VertexColorizer::DEFAULT_COLOR)));
    return geometry;
}

std::vector<MeshPart> Primitives::wheel(float radius, float width, bool rightSide) {
    float PI = glm::pi<float>();

    MeshPart tire;
    tire.material.color = Math::hexToRgb(TIRE_COLOR);
    tire.material.roughness = TIRE_ROUGHNESS;
    tire.material.metalness = TIRE_METALNESS;
    tire.geometry = CylinderGeometry(radius, radius, width, 14);
    tire.geometry.transform(Transformation(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, PI * 0.5f)));
    tire.geometry.setColor(tire.material.color);

    MeshPart hub;
    hub.material.color = Math::hexToRgb(HUB_COLOR);
    hub.material.roughness = HUB_ROUGHNESS;
    hub.material.metalness = HUB_METALNESS;

    Geometry cap = CylinderGeometry(radius * 0.6f, radius * 0.6f, width + 0.02f, 10);
    cap.transform(Transformation(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, PI * 0.5f)));
    cap.setColor(hub.material.color);

    std::vector<Geometry> spokes;
    spokes.reserve(5);
    float side = rightSide ? 1.0f : -1.0f;
    for (int i = 0; i < 5; ++i) {
        float angle = i / 5.0f * 2.0f * PI;
        Geometry spoke = BoxGeometry(glm::vec3(0.02f, radius * 0.35f, 0.025f));
        glm::vec3 position(side * (width * 0.5f + 0.01f), std::sin(angle) * radius * 0.35f, std::cos(angle) * radius * 0.35f);
        spoke.transform(Transformation(position, glm::vec3(angle, 0.0f, 0.0f)));
        spoke.setColor(hub.material.color);
        spokes.push_back(std::move(spoke));
    }

    std::vector<const Geometry*> hubParts = {&cap};
    for (const Geometry &spoke : spokes) {
        hubParts.push_back(&spoke);
    }
    hub.geometry = MeshMerger::merge(hubParts);

    return {std::move(tire), std::move(hub)};
}

std::optional<ChildObject> Primitives::buildChild(const ChildSpec &spec) {
    ChildObject child;
    child.name = spec.name;
    child.transform = Transformation(spec.position, spec.rotation);

    MeshPart part;
    part.material = spec.material;
    part.material.color = spec.color.value_or(Math::hexToRgb(VertexColorizer::DEFAULT_COLOR));

    if (spec.type == "wheel") {
        child.parts = wheel(spec.radius, spec.width, spec.position.x > 0.0f);
        return child;
    } else if (spec.type == "box") {
        part.geometry = BoxGeometry(spec.size);
    } else if (spec.type == "cylinder") {
        part.geometry = CylinderGeometry(spec.radius, spec.radius, spec.height, spec.segments);
        part.geometry.transform(Transformation(glm::vec3(0.0f), glm::vec3(spec.rotateX, 0.0f, 0.0f)));
        part.geometry.transform(Transformation(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, spec.rotateZ)));
    } else {
        std::cerr << "    Unknown child type: " << spec.type << std::endl;
        return std::nullopt;
    }
    part.geometry.setColor(part.material.color);
    child.parts.push_back(std::move(part));
    return child;
}
