#pragma once
#include "Skeleton.hpp"
#include "SkinWeights.hpp"
#include "AnimationClip.hpp"
#include "Primitives.hpp"
#include <optional>
#include <string>
#include <vector>

// Everything a run hands to an exporter. Skin bindings and animations are
// only filled for skeleton runs, children only for static runs.
struct LoftResult {
    std::string name;
    Geometry mesh;
    Material material = Material::model();
    std::optional<Skeleton> skeleton;
    std::vector<SkinBinding> skin;
    std::vector<AnimationClip> animations;
    std::vector<ChildObject> children;
};

class AssetExporter {
public:
    virtual ~AssetExporter() = default;
    virtual void exportAsset(const LoftResult &result, const std::string &path) = 0;
};
