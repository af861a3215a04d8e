#include "LoftPipeline.hpp"
#include "SilhouetteSampler.hpp"
#include "OutlineNormalizer.hpp"
#include "MeshMerger.hpp"
#include "../utils/ThreadPool.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
    std::string available(const PathLibrary &library) {
        if (library.ids().empty()) {
            return " (the view has no paths)";
        }
        std::string text = " (available:";
        for (const std::string &id : library.ids()) {
            text += " " + id;
        }
        return text + ")";
    }
}

LoftPipeline::LoftPipeline(const LoftConfig &config) : config(config) {
}

int LoftPipeline::sampleCount(float yMin, float yMax, float samplesPerUnit) {
    float samples = std::ceil((yMax - yMin) * samplesPerUnit);
    if (!(samples > 4.0f)) {
        return 4;
    }
    return static_cast<int>(std::min(samples, static_cast<float>(MAX_SAMPLES)));
}

ComponentResult LoftPipeline::loftComponent(const ComponentSpec &spec, const PathLibrary &front, const PathLibrary &side, const PathLibrary &top) const {
    const LoftSettings &s = config.settings;
    ComponentResult result;
    result.id = spec.id;
    std::ostringstream log;
    std::ostringstream warnings;
    log << std::fixed << std::setprecision(3);
    log << "  Lofting component: " << spec.id << std::endl;

    const Polyline *frontPoints = front.find(spec.frontPath);
    const Polyline *sidePoints = side.find(spec.sidePath);
    if (frontPoints == nullptr || frontPoints->empty()) {
        warnings << "    WARNING: No front path found for \"" << spec.frontPath << "\"" << available(front) << std::endl;
    } else if (sidePoints == nullptr || sidePoints->empty()) {
        warnings << "    WARNING: No side path found for \"" << spec.sidePath << "\"" << available(side) << std::endl;
    } else {
        LoftOptions options;
        options.vertsPerRing = spec.vertsPerRing.value_or(s.vertsPerRing);
        options.offset = spec.offset;
        options.capTop = spec.capTop;
        options.capBottom = spec.capBottom;

        const Polyline *topPoints = top.find(spec.topPath);
        if (topPoints != nullptr && topPoints->size() >= 3) {
            options.topShape = OutlineNormalizer::normalize(*topPoints, s.getTopCenterX(), s.topCenterY, options.vertsPerRing);
            if (options.topShape) {
                log << "    Top outline: " << topPoints->size() << " points -> " << options.topShape->size() << " shape vertices" << std::endl;
            } else {
                warnings << "    WARNING: Top outline \"" << spec.topPath << "\" is degenerate, using an ellipse" << std::endl;
            }
        }

        Polyline fPts = PathLibrary::toWorld(*frontPoints, s.svgCenterX, s.svgHeight, s.scale);
        Polyline sPts = PathLibrary::toWorld(*sidePoints, s.getSideCenterX(), s.svgHeight, s.scale);
        log << "    Front points: " << fPts.size() << ", side points: " << sPts.size() << std::endl;

        float lowest = fPts[0].y;
        float highest = fPts[0].y;
        for (const Polyline *points : {&fPts, &sPts}) {
            for (const glm::vec2 &p : *points) {
                lowest = std::min(lowest, p.y);
                highest = std::max(highest, p.y);
            }
        }
        options.yMin = spec.yMin.value_or(lowest);
        options.yMax = spec.yMax.value_or(highest);

        int numSamples = sampleCount(options.yMin, options.yMax, s.samplesPerUnit);
        SilhouetteSampleMap frontSamples = SilhouetteSampler::sample(fPts, options.yMin, options.yMax, numSamples);
        SilhouetteSampleMap sideSamples = SilhouetteSampler::sample(sPts, options.yMin, options.yMax, numSamples);
        log << "    Y range: " << options.yMin << " - " << options.yMax << ", " << frontSamples.size() << "/" << sideSamples.size() << " samples" << std::endl;

        std::string reason;
        result.mesh = Lofter::loft(frontSamples, sideSamples, options, &reason);
        if (!result.mesh) {
            warnings << "    Lofter: " << reason << std::endl;
            warnings << "    FAILED to generate geometry for " << spec.id << std::endl;
        } else {
            Geometry &geometry = result.mesh->geometry;
            VertexColorizer::apply(geometry, spec.yRanges, spec.color, config.yRanges);
            log << "    OK: " << geometry.vertices.size() << " verts, " << geometry.triangleCount() << " tris" << std::endl;
        }
    }

    result.log = log.str();
    result.warnings = warnings.str();
    return result;
}

LoftResult LoftPipeline::run() const {
    std::cout << std::endl << "Processing: " << config.name << std::endl;
    std::cout << std::string(50, '=') << std::endl;

    PathLibrary front = PathLibrary::load(config.resolve(config.svgFront));
    PathLibrary side = PathLibrary::load(config.resolve(config.svgSide));
    PathLibrary top = config.svgTop.empty() ? PathLibrary() : PathLibrary::load(config.resolve(config.svgTop));

    std::cout << "  Front SVG: " << front.size() << " paths" << std::endl;
    std::cout << "  Side SVG: " << side.size() << " paths" << std::endl;
    if (!config.svgTop.empty()) {
        std::cout << "  Top SVG: " << top.size() << " paths" << std::endl;
    }
    return run(front, side, top);
}

LoftResult LoftPipeline::run(const PathLibrary &front, const PathLibrary &side, const PathLibrary &top) const {
    std::vector<ComponentResult> lofted;
    {
        int threads = config.settings.threads;
        ThreadPool pool(threads > 1 ? static_cast<size_t>(threads) : 0);
        if (pool.threadCount() > 0) {
            std::cout << "  Lofting " << config.components.size() << " components on " << pool.threadCount() << " threads" << std::endl;
        }
        lofted = pool.mapOrdered(config.components, [&](const ComponentSpec &spec) {
            return loftComponent(spec, front, side, top);
        });
    }

    std::vector<Geometry> parts;
    for (const ComponentResult &component : lofted) {
        std::cout << component.log;
        std::cerr << component.warnings;
        if (component.mesh) {
            parts.push_back(component.mesh->geometry);
        }
    }

    for (const AddonSpec &addon : config.addons) {
        std::cout << "  Adding primitive: " << addon.id << std::endl;
        std::optional<Geometry> geometry = Primitives::buildAddon(addon);
        if (geometry) {
            std::cout << "    OK: " << geometry->vertices.size() << " verts, " << geometry->triangleCount() << " tris" << std::endl;
            parts.push_back(std::move(*geometry));
        }
    }

    if (parts.empty()) {
        throw std::runtime_error("no geometries generated");
    }

    std::vector<const Geometry*> pointers;
    for (const Geometry &part : parts) {
        pointers.push_back(&part);
    }

    LoftResult result;
    result.name = config.name;
    result.mesh = MeshMerger::merge(pointers);
    result.material = config.material;
    std::cout << "  Merged: " << result.mesh.vertices.size() << " verts, " << result.mesh.triangleCount() << " tris" << std::endl;

    if (config.skeleton) {
        Skeleton skeleton = Skeleton::humanoid();
        std::cout << "  Computing skin weights..." << std::endl;
        result.skin = SkinWeightAssigner::assign(result.mesh.vertices, skeleton.bindWorldPositions, config.settings.jointThreshold);
        result.skeleton = std::move(skeleton);
        if (!config.animations.empty()) {
            result.animations = LoftConfig::loadAnimations(config.resolve(config.animations));
            for (const AnimationClip &clip : result.animations) {
                for (const AnimationTrack &track : clip.tracks) {
                    if (result.skeleton->indexOf(track.bone) < 0) {
                        std::cerr << "  WARNING: clip \"" << clip.name << "\" animates unknown bone \"" << track.bone << "\"" << std::endl;
                    }
                }
            }
        }
        std::cout << "  Skeleton: " << result.skeleton->size() << " bones, " << result.animations.size() << " animations" << std::endl;
        if (!config.children.empty()) {
            std::cerr << "  WARNING: children are ignored for skinned models" << std::endl;
        }
    } else {
        for (const ChildSpec &spec : config.children) {
            std::optional<ChildObject> child = Primitives::buildChild(spec);
            if (child) {
                std::cout << "  Child: " << child->name << " (" << spec.type << ")" << std::endl;
                result.children.push_back(std::move(*child));
            }
        }
    }
    return result;
}
