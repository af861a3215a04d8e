#pragma once
#include "LoftConfig.hpp"
#include "PathLibrary.hpp"
#include "Lofter.hpp"
#include "AssetExporter.hpp"
#include <string>

// Outcome of lofting one component; log lines are buffered so that runs on
// worker threads print in declared order
struct ComponentResult {
    std::string id;
    std::optional<ComponentMesh> mesh;
    std::string log;
    std::string warnings;
};

class LoftPipeline {
    const LoftConfig &config;
public:
    explicit LoftPipeline(const LoftConfig &config);

    // Reads the configured SVG views and runs the whole pipeline.
    // Throws std::runtime_error when nothing survives.
    LoftResult run() const;
    LoftResult run(const PathLibrary &front, const PathLibrary &side, const PathLibrary &top) const;

    ComponentResult loftComponent(const ComponentSpec &spec, const PathLibrary &front, const PathLibrary &side, const PathLibrary &top) const;

    static constexpr int MAX_SAMPLES = 100000;

    // At least 4, at most MAX_SAMPLES scanlines
    static int sampleCount(float yMin, float yMax, float samplesPerUnit);
};
