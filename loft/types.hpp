#ifndef LOFT_TYPES_HPP
#define LOFT_TYPES_HPP

#include <glm/glm.hpp>
#include <map>
#include <vector>

typedef std::vector<glm::vec2> Polyline;

// Horizontal extent of a silhouette at one height level
struct SilhouetteBounds {
    float left;
    float right;
};

// Keyed by height level; levels without geometry are absent, never zero-width
typedef std::map<float, SilhouetteBounds> SilhouetteSampleMap;

typedef std::vector<glm::vec3> Ring;

#endif
