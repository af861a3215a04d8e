#include "LoftConfig.hpp"
#include "../math/Math.hpp"
#include "../utils/FileReader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

namespace {
    template<typename T>
    T read(const json &j, const std::string &key, T fallback) {
        if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
            return fallback;
        }
        try {
            return j[key].get<T>();
        } catch (const json::exception &e) {
            throw std::runtime_error("invalid value for '" + key + "': " + e.what());
        }
    }

    template<typename T>
    std::optional<T> readOptional(const json &j, const std::string &key) {
        if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
            return std::nullopt;
        }
        return read<T>(j, key, T());
    }

    glm::vec3 readVec3(const json &j, const std::string &key, glm::vec3 fallback) {
        if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
            return fallback;
        }
        std::vector<float> v = read<std::vector<float>>(j, key, {});
        if (v.size() != 3) {
            throw std::runtime_error("invalid value for '" + key + "': expected 3 numbers");
        }
        return glm::vec3(v[0], v[1], v[2]);
    }

    std::optional<glm::vec3> readColor(const json &j, const std::string &key) {
        if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
            return std::nullopt;
        }
        return LoftConfig::parseColor(j[key]);
    }

    ComponentSpec parseComponent(const json &j) {
        ComponentSpec c;
        c.id = read<std::string>(j, "id", "");
        if (c.id.empty()) {
            throw std::runtime_error("component without 'id'");
        }
        c.frontPath = read<std::string>(j, "frontPath", c.id);
        c.sidePath = read<std::string>(j, "sidePath", c.id);
        c.topPath = read<std::string>(j, "topPath", c.id);
        c.yMin = readOptional<float>(j, "yMin");
        c.yMax = readOptional<float>(j, "yMax");
        c.offset = glm::vec3(read<float>(j, "offsetX", 0.0f), read<float>(j, "offsetY", 0.0f), read<float>(j, "offsetZ", 0.0f));
        c.capTop = read<bool>(j, "capTop", false);
        c.capBottom = read<bool>(j, "capBottom", false);
        c.color = readColor(j, "color");
        if (j.contains("yRanges") && !j["yRanges"].is_null()) {
            c.yRanges = LoftConfig::parseZones(j["yRanges"]);
        }
        c.vertsPerRing = readOptional<int>(j, "vertsPerRing");
        return c;
    }

    AddonSpec parseAddon(const json &j) {
        AddonSpec a;
        a.type = read<std::string>(j, "type", "");
        a.id = read<std::string>(j, "id", a.type);
        a.size = readVec3(j, "size", a.size);
        a.radius = read<float>(j, "radius", a.radius);
        a.radiusTop = readOptional<float>(j, "radiusTop");
        a.radiusBottom = readOptional<float>(j, "radiusBottom");
        a.height = read<float>(j, "height", a.height);
        a.segments = readOptional<int>(j, "segments");
        a.position = readVec3(j, "position", a.position);
        a.rotation = readVec3(j, "rotation", a.rotation);
        a.color = readColor(j, "color");
        return a;
    }

    Material parseMaterial(const json &j, Material material) {
        material.roughness = read<float>(j, "roughness", material.roughness);
        material.metalness = read<float>(j, "metalness", material.metalness);
        material.emissive = readColor(j, "emissive").value_or(material.emissive);
        material.emissiveIntensity = read<float>(j, "emissiveIntensity", material.emissiveIntensity);
        material.transparent = read<bool>(j, "transparent", material.transparent);
        material.opacity = read<float>(j, "opacity", material.opacity);
        return material;
    }

    ChildSpec parseChild(const json &j) {
        ChildSpec c;
        c.type = read<std::string>(j, "type", "");
        c.name = read<std::string>(j, "name", c.type);
        c.radius = read<float>(j, "radius", c.type == "wheel" ? Primitives::WHEEL_RADIUS : c.radius);
        c.width = read<float>(j, "width", c.width);
        c.height = read<float>(j, "height", c.height);
        c.size = readVec3(j, "size", c.size);
        c.segments = read<int>(j, "segments", c.segments);
        c.rotateX = read<float>(j, "rotateX", 0.0f);
        c.rotateZ = read<float>(j, "rotateZ", 0.0f);
        c.position = readVec3(j, "position", c.position);
        c.rotation = readVec3(j, "rotation", c.rotation);
        c.color = readColor(j, "color");
        c.material = parseMaterial(j, c.material);
        return c;
    }

    TrackProperty parseProperty(const std::string &name) {
        if (name == "position") return TRACK_POSITION;
        if (name == "quaternion") return TRACK_QUATERNION;
        if (name == "scale") return TRACK_SCALE;
        throw std::runtime_error("unknown track property '" + name + "'");
    }
}

glm::vec3 LoftConfig::parseColor(const json &value) {
    if (value.is_number_integer()) {
        int64_t hex = value.get<int64_t>();
        if (hex < 0 || hex > 0xffffffffLL) {
            throw std::runtime_error("invalid color: " + value.dump());
        }
        return Math::hexToRgb(static_cast<uint32_t>(hex));
    }
    if (!value.is_string()) {
        throw std::runtime_error("invalid color: " + value.dump());
    }
    std::string text = value.get<std::string>();
    std::string digits = text;
    if (digits.rfind("0x", 0) == 0 || digits.rfind("0X", 0) == 0) {
        digits = digits.substr(2);
    } else if (digits.rfind("#", 0) == 0) {
        digits = digits.substr(1);
    }
    if (digits.empty() || digits.size() > 8 || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::runtime_error("invalid color: " + text);
    }
    return Math::hexToRgb(static_cast<uint32_t>(std::stoul(digits, nullptr, 16)));
}

std::vector<ColorZone> LoftConfig::parseZones(const json &value) {
    if (!value.is_array()) {
        throw std::runtime_error("invalid value for 'yRanges': expected an array");
    }
    std::vector<ColorZone> zones;
    for (const json &z : value) {
        ColorZone zone;
        zone.yMin = read<float>(z, "yMin", 0.0f);
        zone.yMax = read<float>(z, "yMax", 0.0f);
        zone.color = readColor(z, "color").value_or(Math::hexToRgb(VertexColorizer::DEFAULT_COLOR));
        zones.push_back(zone);
    }
    return zones;
}

std::vector<AnimationClip> LoftConfig::parseAnimations(const json &value) {
    const json &clips = value.is_object() && value.contains("animations") ? value["animations"] : value;
    if (!clips.is_array()) {
        throw std::runtime_error("invalid animation table: expected an array of clips");
    }
    std::vector<AnimationClip> result;
    for (const json &c : clips) {
        AnimationClip clip;
        clip.name = read<std::string>(c, "name", "");
        clip.duration = read<float>(c, "duration", 0.0f);
        if (c.contains("tracks")) {
            for (const json &t : c["tracks"]) {
                AnimationTrack track;
                track.bone = read<std::string>(t, "bone", "");
                track.property = parseProperty(read<std::string>(t, "property", "quaternion"));
                track.times = read<std::vector<float>>(t, "times", {});
                track.values = read<std::vector<float>>(t, "values", {});
                if (track.values.size() != track.times.size() * track.components()) {
                    throw std::runtime_error("track '" + track.bone + "' of clip '" + clip.name + "' has mismatched keyframes");
                }
                clip.tracks.push_back(std::move(track));
            }
        }
        result.push_back(std::move(clip));
    }
    return result;
}

std::vector<AnimationClip> LoftConfig::loadAnimations(const std::string &filename) {
    std::string text = FileReader::readText(filename);
    try {
        return parseAnimations(json::parse(text));
    } catch (const json::exception &e) {
        throw std::runtime_error("failed to parse " + filename + ": " + e.what());
    }
}

LoftConfig LoftConfig::parse(const json &j, const std::string &baseDir) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }
    LoftConfig config;
    config.baseDir = baseDir;
    config.name = read<std::string>(j, "name", "model");
    config.svgFront = read<std::string>(j, "svgFront", "");
    config.svgSide = read<std::string>(j, "svgSide", "");
    config.svgTop = read<std::string>(j, "svgTop", "");
    if (config.svgFront.empty() || config.svgSide.empty()) {
        throw std::runtime_error("config requires 'svgFront' and 'svgSide'");
    }

    LoftSettings &s = config.settings;
    s.svgHeight = read<float>(j, "svgHeight", s.svgHeight);
    s.svgCenterX = read<float>(j, "svgCenterX", s.svgCenterX);
    s.sideCenterX = readOptional<float>(j, "sideCenterX");
    s.topCenterX = readOptional<float>(j, "topCenterX");
    s.topCenterY = read<float>(j, "topCenterY", s.topCenterY);
    s.scale = read<float>(j, "scale", s.scale);
    s.vertsPerRing = read<int>(j, "vertsPerRing", s.vertsPerRing);
    s.samplesPerUnit = read<float>(j, "samplesPerUnit", s.samplesPerUnit);
    s.threads = read<int>(j, "threads", s.threads);
    s.jointThreshold = read<float>(j, "jointThreshold", s.jointThreshold);

    config.material = Material::model(read<float>(j, "roughness", Material::MODEL_ROUGHNESS),
                                      read<float>(j, "metalness", Material::MODEL_METALNESS));

    if (j.contains("components")) {
        for (const json &c : j["components"]) {
            config.components.push_back(parseComponent(c));
        }
    }
    if (j.contains("yRanges")) {
        config.yRanges = parseZones(j["yRanges"]);
    }
    if (j.contains("addons")) {
        for (const json &a : j["addons"]) {
            config.addons.push_back(parseAddon(a));
        }
    }
    if (j.contains("children")) {
        for (const json &c : j["children"]) {
            config.children.push_back(parseChild(c));
        }
    }
    config.skeleton = read<bool>(j, "skeleton", false);
    config.animations = read<std::string>(j, "animations", "");
    config.output = read<std::string>(j, "output", config.output);
    return config;
}

LoftConfig LoftConfig::load(const std::string &filename) {
    std::string text = FileReader::readText(filename);
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception &e) {
        throw std::runtime_error("failed to parse " + filename + ": " + e.what());
    }
    std::string baseDir = std::filesystem::path(filename).parent_path().string();
    return parse(j, baseDir);
}

std::string LoftConfig::resolve(const std::string &path) const {
    std::filesystem::path p(path);
    if (p.is_absolute() || baseDir.empty()) {
        return p.string();
    }
    return (std::filesystem::path(baseDir) / p).lexically_normal().string();
}
