#include "Skeleton.hpp"
#include <stdexcept>

Skeleton::Skeleton(std::vector<BoneDef> bones) : bones(std::move(bones)) {
    bindWorldPositions.reserve(this->bones.size());
    for (size_t i = 0; i < this->bones.size(); ++i) {
        const BoneDef &bone = this->bones[i];
        if (bone.parent >= static_cast<int>(i) || (i == 0) != (bone.parent < 0)) {
            throw std::invalid_argument("bone '" + bone.name + "' has invalid parent " + std::to_string(bone.parent));
        }
        glm::vec3 base = bone.parent < 0 ? glm::vec3(0.0f) : bindWorldPositions[bone.parent];
        bindWorldPositions.push_back(base + bone.offset);
    }
}

const std::vector<BoneDef>& Skeleton::humanoidBones() {
    static const std::vector<BoneDef> table = {
        {"Root",       -1, glm::vec3( 0.00f,  0.95f, 0.0f)},
        {"Spine",       0, glm::vec3( 0.00f,  0.20f, 0.0f)},
        {"Chest",       1, glm::vec3( 0.00f,  0.20f, 0.0f)},
        {"Head",        2, glm::vec3( 0.00f,  0.30f, 0.0f)},
        {"L_Shoulder",  2, glm::vec3(-0.38f,  0.00f, 0.0f)},
        {"L_Elbow",     4, glm::vec3( 0.00f, -0.30f, 0.0f)},
        {"L_Hand",      5, glm::vec3( 0.00f, -0.30f, 0.0f)},
        {"R_Shoulder",  2, glm::vec3( 0.38f,  0.00f, 0.0f)},
        {"R_Elbow",     7, glm::vec3( 0.00f, -0.30f, 0.0f)},
        {"R_Hand",      8, glm::vec3( 0.00f, -0.30f, 0.0f)},
        {"L_Hip",       0, glm::vec3(-0.12f,  0.00f, 0.0f)},
        {"L_Knee",     10, glm::vec3( 0.00f, -0.40f, 0.0f)},
        {"L_Foot",     11, glm::vec3( 0.00f, -0.40f, 0.0f)},
        {"R_Hip",       0, glm::vec3( 0.12f,  0.00f, 0.0f)},
        {"R_Knee",     13, glm::vec3( 0.00f, -0.40f, 0.0f)},
        {"R_Foot",     14, glm::vec3( 0.00f, -0.40f, 0.0f)},
    };
    return table;
}

Skeleton Skeleton::humanoid() {
    return Skeleton(humanoidBones());
}

int Skeleton::indexOf(const std::string &name) const {
    for (size_t i = 0; i < bones.size(); ++i) {
        if (bones[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

size_t Skeleton::size() const {
    return bones.size();
}
