#pragma once
#include <glm/glm.hpp>
#include <bit>
#include <cstdint>
#include <functional>

inline uint64_t murmurMix(uint64_t k) {
	k ^= k >> 33;
	k *= 0xff51afd7ed558ccdULL;
	k ^= k >> 33;
	k *= 0xc4ceb9fe1a85ec53ULL;
	k ^= k >> 33;
	return k;
}

inline uint64_t hashCombine(uint64_t h, uint64_t v) {
	return h ^ murmurMix(v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

inline uint64_t pack2(float a, float b) {
	struct Pair { float x; float y; };
	static_assert(sizeof(Pair) == sizeof(uint64_t));
	return std::bit_cast<uint64_t>(Pair{a, b});
}

inline bool sameBits(float a, float b) {
    return std::bit_cast<uint32_t>(a) == std::bit_cast<uint32_t>(b);
}

struct Vertex {
public:
    glm::vec3 position;
    glm::vec3 color;
    glm::vec2 texCoord;
    glm::vec3 normal;

    Vertex(glm::vec3 pos, glm::vec3 normal, glm::vec2 texCoord, glm::vec3 color)
        : position(pos), color(color), texCoord(texCoord), normal(normal) {
    }

    Vertex(glm::vec3 pos, glm::vec3 normal, glm::vec2 texCoord)
        : position(pos), color(glm::vec3(0.0f)), texCoord(texCoord), normal(normal) {
    }

    Vertex() : position(glm::vec3(0.0f)), color(glm::vec3(0.0f)), texCoord(glm::vec2(0.0f)), normal(glm::vec3(0.0f)) {}

    Vertex(glm::vec3 pos) : position(pos), color(glm::vec3(0.0f)), texCoord(glm::vec2(0.0f)), normal(glm::vec3(0.0f)) {}

    // Bitwise comparison so that the de-duplication map never merges -0.0f with 0.0f
    bool operator==(const Vertex& o) const {
        return pack2(position.x, position.y) == pack2(o.position.x, o.position.y) &&
               sameBits(position.z, o.position.z) &&

               pack2(normal.x, normal.y) == pack2(o.normal.x, o.normal.y) &&
               sameBits(normal.z, o.normal.z) &&

               pack2(texCoord.x, texCoord.y) == pack2(o.texCoord.x, o.texCoord.y) &&

               pack2(color.x, color.y) == pack2(o.color.x, o.color.y) &&
               sameBits(color.z, o.color.z);
    }

    bool operator!=(const Vertex& other) const {
        return !(*this == other);
    }
};

namespace std {

template<> struct hash<glm::vec3> {
    uint64_t operator()(const glm::vec3& v) const noexcept {
        uint64_t h = 0;
        h = hashCombine(h, pack2(v.x, v.y));
        uint64_t zbits = std::bit_cast<uint32_t>(v.z);
        h = hashCombine(h, zbits);
        return h;
    }
};

template<> struct hash<glm::vec2> {
    uint64_t operator()(const glm::vec2& v) const noexcept {
        uint64_t k = pack2(v.x, v.y);
        return murmurMix(k);
    }
};

} // namespace std

struct VertexHasher {
    uint64_t operator()(const Vertex& v) const noexcept {
        uint64_t h = 0;
        h = hashCombine(h, std::hash<glm::vec3>{}(v.position));
        h = hashCombine(h, std::hash<glm::vec3>{}(v.normal));
        h = hashCombine(h, std::hash<glm::vec2>{}(v.texCoord));
        h = hashCombine(h, std::hash<glm::vec3>{}(v.color));
        return h;
    }
};
