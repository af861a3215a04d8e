#pragma once
#include "AssetExporter.hpp"
#include <cstdint>

// Gzip-compressed binary container for a LoftResult
class MeshFile : public AssetExporter {
public:
    static constexpr char MAGIC[4] = {'S', 'L', 'M', 'F'};
    static constexpr uint32_t VERSION = 2;

    void exportAsset(const LoftResult &result, const std::string &path) override;

    // Throws std::runtime_error on a missing, truncated or foreign file
    static LoftResult load(const std::string &path);
};
