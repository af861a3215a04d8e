#pragma once
#include "VertexColorizer.hpp"
#include "Primitives.hpp"
#include "AnimationClip.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ComponentSpec {
    std::string id;
    std::string frontPath;
    std::string sidePath;
    std::string topPath;
    std::optional<float> yMin;
    std::optional<float> yMax;
    glm::vec3 offset = glm::vec3(0.0f);
    bool capTop = false;
    bool capBottom = false;
    std::optional<glm::vec3> color;
    // Present but empty still takes precedence over the component color
    std::optional<std::vector<ColorZone>> yRanges;
    std::optional<int> vertsPerRing;
};

class LoftSettings {
public:
    LoftSettings() { resetToDefaults(); }

    void resetToDefaults() {
        svgHeight = 200.0f;
        svgCenterX = 100.0f;
        sideCenterX.reset();
        topCenterX.reset();
        topCenterY = 100.0f;
        scale = 1.0f;
        vertsPerRing = 10;
        samplesPerUnit = 40.0f;
        threads = 1;
        jointThreshold = 0.15f;
    }

    // SVG frame
    float svgHeight = 200.0f;
    float svgCenterX = 100.0f;
    std::optional<float> sideCenterX;
    std::optional<float> topCenterX;
    float topCenterY = 100.0f;
    float scale = 1.0f;

    // Sampling
    int vertsPerRing = 10;
    float samplesPerUnit = 40.0f;

    // Worker threads for lofting; 1 or less runs on the caller
    int threads = 1;

    // Skinning
    float jointThreshold = 0.15f;

    float getSideCenterX() const { return sideCenterX.value_or(svgCenterX); }
    float getTopCenterX() const { return topCenterX.value_or(svgCenterX); }
};

class LoftConfig {
public:
    std::string name;
    std::string baseDir;
    std::string svgFront;
    std::string svgSide;
    std::string svgTop;
    LoftSettings settings;
    std::vector<ComponentSpec> components;
    std::vector<ColorZone> yRanges;
    Material material = Material::model();
    std::vector<AddonSpec> addons;
    std::vector<ChildSpec> children;
    bool skeleton = false;
    std::string animations;
    std::string output = "output.mesh.gz";

    // Throws std::runtime_error naming the offending key on malformed input
    static LoftConfig parse(const nlohmann::json &json, const std::string &baseDir);
    static LoftConfig load(const std::string &filename);

    // Relative paths resolve against the config file's directory
    std::string resolve(const std::string &path) const;

    // "0xRRGGBB", "#RRGGBB", "RRGGBB" or a non-negative integer
    static glm::vec3 parseColor(const nlohmann::json &value);

    static std::vector<ColorZone> parseZones(const nlohmann::json &value);
    static std::vector<AnimationClip> parseAnimations(const nlohmann::json &value);
    static std::vector<AnimationClip> loadAnimations(const std::string &filename);
};
