#include "Lofter.hpp"
#include <glm/gtc/constants.hpp>
#include <sstream>
#include <cmath>

Ring Lofter::generateRing(float y, float halfWidth, float halfDepth, const LoftOptions &options) {
    float PI = glm::pi<float>();
    int vpr = options.vertsPerRing;
    bool shaped = options.topShape && static_cast<int>(options.topShape->size()) >= vpr;

    Ring ring;
    ring.reserve(vpr);
    for (int i = 0; i < vpr; ++i) {
        if (shaped) {
            const glm::vec2 &s = (*options.topShape)[i];
            ring.emplace_back(s.x * halfWidth, y, s.y * halfDepth);
        } else {
            float angle = 2.0f * PI * i / vpr;
            ring.emplace_back(halfWidth * std::sin(angle), y, halfDepth * std::cos(angle));
        }
    }
    return ring;
}

std::optional<ComponentMesh> Lofter::loft(const SilhouetteSampleMap &front, const SilhouetteSampleMap &side, const LoftOptions &options, std::string *reason) {
    if (options.vertsPerRing < 3) {
        if (reason != nullptr) {
            *reason = "vertsPerRing must be at least 3, got " + std::to_string(options.vertsPerRing);
        }
        return std::nullopt;
    }

    ComponentMesh mesh;
    mesh.vertsPerRing = options.vertsPerRing;

    // std::map keeps the levels ascending
    for (auto it = front.lower_bound(options.yMin); it != front.end() && it->first <= options.yMax; ++it) {
        float y = it->first;
        auto s = side.find(y);
        if (s == side.end()) {
            continue;
        }
        const SilhouetteBounds &f = it->second;
        const SilhouetteBounds &d = s->second;

        float halfWidth = (f.right - f.left) * 0.5f;
        float halfDepth = (d.right - d.left) * 0.5f;
        if (halfWidth <= 0.0f || halfDepth <= 0.0f) {
            continue;
        }

        glm::vec3 center((f.right + f.left) * 0.5f + options.offset.x, 0.0f, (d.right + d.left) * 0.5f + options.offset.z);
        Ring ring = generateRing(y + options.offset.y, halfWidth, halfDepth, options);
        for (glm::vec3 &v : ring) {
            v += center;
        }
        mesh.rings.push_back(std::move(ring));
    }

    if (mesh.rings.size() < 2) {
        if (reason != nullptr) {
            std::ostringstream text;
            text << "fewer than 2 valid rings between " << options.yMin << " and " << options.yMax;
            *reason = text.str();
        }
        return std::nullopt;
    }

    uint vpr = static_cast<uint>(options.vertsPerRing);
    uint nr = static_cast<uint>(mesh.rings.size());
    Geometry &geometry = mesh.geometry;
    geometry.vertices.reserve(nr * vpr + 2);
    for (const Ring &ring : mesh.rings) {
        for (const glm::vec3 &p : ring) {
            geometry.vertices.emplace_back(p);
        }
    }

    geometry.indices.reserve((nr - 1) * vpr * 6);
    for (uint r = 0; r + 1 < nr; ++r) {
        for (uint v = 0; v < vpr; ++v) {
            uint a = r * vpr + v;
            uint b = r * vpr + (v + 1) % vpr;
            uint c = (r + 1) * vpr + v;
            uint d = (r + 1) * vpr + (v + 1) % vpr;
            geometry.indices.insert(geometry.indices.end(), {a, c, b});
            geometry.indices.insert(geometry.indices.end(), {b, c, d});
        }
    }

    if (options.capBottom) {
        addCap(mesh, 0, false);
    }
    if (options.capTop) {
        addCap(mesh, nr - 1, true);
    }

    geometry.calculateNormals();
    return mesh;
}

void Lofter::addCap(ComponentMesh &mesh, size_t ringIndex, bool top) {
    const Ring &ring = mesh.rings[ringIndex];
    glm::vec3 centroid(0.0f, ring[0].y, 0.0f);
    for (const glm::vec3 &p : ring) {
        centroid.x += p.x;
        centroid.z += p.z;
    }
    centroid.x /= ring.size();
    centroid.z /= ring.size();

    Geometry &geometry = mesh.geometry;
    uint capIdx = static_cast<uint>(geometry.vertices.size());
    geometry.vertices.emplace_back(centroid);

    uint vpr = static_cast<uint>(mesh.vertsPerRing);
    uint base = top ? static_cast<uint>(ringIndex) * vpr : 0;
    for (uint v = 0; v < vpr; ++v) {
        geometry.indices.insert(geometry.indices.end(), {base + v, capIdx, base + (v + 1) % vpr});
    }
}
