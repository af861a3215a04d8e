#pragma once
#include <glm/glm.hpp>
#include <string>
#include <vector>

struct BoneDef {
    std::string name;
    int parent;
    glm::vec3 offset;
};

class Skeleton {
public:
    std::vector<BoneDef> bones;
    std::vector<glm::vec3> bindWorldPositions;

    // Throws std::invalid_argument unless every bone's parent precedes it
    explicit Skeleton(std::vector<BoneDef> bones);

    static Skeleton humanoid();
    static const std::vector<BoneDef>& humanoidBones();

    int indexOf(const std::string &name) const;
    size_t size() const;
};
