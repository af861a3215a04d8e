#include <gtest/gtest.h>
#include "loft/MeshFile.hpp"
#include "loft/MeshMerger.hpp"
#include "math/BoxGeometry.hpp"
#include "math/Math.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
    std::filesystem::path scratch(const std::string &name) {
        std::filesystem::path dir = std::filesystem::temp_directory_path() / "loft_meshfile_test";
        std::filesystem::create_directories(dir);
        return dir / name;
    }

    LoftResult skinnedResult() {
        LoftResult result;
        result.name = "runner";
        BoxGeometry box(glm::vec3(0.4f, 1.8f, 0.3f));
        box.setColor(glm::vec3(0.2f, 0.4f, 0.6f));
        result.mesh = MeshMerger::merge({&box});
        result.skeleton = Skeleton::humanoid();
        result.skin = SkinWeightAssigner::assign(result.mesh.vertices, result.skeleton->bindWorldPositions);

        AnimationClip clip;
        clip.name = "wave";
        clip.duration = 1.0f;
        clip.tracks.push_back(AnimationTrack{"R_Shoulder", TRACK_QUATERNION, {0.0f, 1.0f}, {0, 0, 0, 1, 0, 0, 0.7071f, 0.7071f}});
        result.animations.push_back(clip);
        return result;
    }
}

TEST(MeshFile, SkinnedRoundTrip) {
    std::filesystem::path path = scratch("runner.mesh.gz");
    LoftResult original = skinnedResult();
    MeshFile exporter;
    exporter.exportAsset(original, path.string());

    LoftResult loaded = MeshFile::load(path.string());
    EXPECT_EQ(loaded.name, "runner");
    ASSERT_EQ(loaded.mesh.vertices.size(), original.mesh.vertices.size());
    EXPECT_EQ(loaded.mesh.indices, original.mesh.indices);
    EXPECT_TRUE(loaded.mesh.hasColors);
    for (size_t i = 0; i < loaded.mesh.vertices.size(); ++i) {
        EXPECT_EQ(loaded.mesh.vertices[i], original.mesh.vertices[i]);
    }

    ASSERT_TRUE(loaded.skeleton.has_value());
    EXPECT_EQ(loaded.skeleton->size(), 16u);
    EXPECT_EQ(loaded.skeleton->bones[3].name, "Head");
    ASSERT_EQ(loaded.skin.size(), original.skin.size());
    EXPECT_EQ(loaded.skin[0].joints, original.skin[0].joints);
    EXPECT_EQ(loaded.skin[0].weights, original.skin[0].weights);

    ASSERT_EQ(loaded.animations.size(), 1u);
    EXPECT_EQ(loaded.animations[0].name, "wave");
    ASSERT_EQ(loaded.animations[0].tracks.size(), 1u);
    EXPECT_EQ(loaded.animations[0].tracks[0].bone, "R_Shoulder");
    EXPECT_EQ(loaded.animations[0].tracks[0].values, original.animations[0].tracks[0].values);
    EXPECT_TRUE(loaded.children.empty());
}

TEST(MeshFile, StaticModelWithChildren) {
    std::filesystem::path path = scratch("nested/dir/car.mesh.gz");
    LoftResult result;
    result.name = "car";
    result.mesh = BoxGeometry(glm::vec3(1.0f));

    ChildSpec spec;
    spec.name = "wheel_rl";
    spec.type = "wheel";
    spec.radius = 0.25f;
    spec.position = glm::vec3(-0.5f, 0.25f, -1.0f);
    result.children.push_back(*Primitives::buildChild(spec));

    MeshFile().exportAsset(result, path.string());
    LoftResult loaded = MeshFile::load(path.string());

    EXPECT_FALSE(loaded.skeleton.has_value());
    EXPECT_TRUE(loaded.skin.empty());
    ASSERT_EQ(loaded.children.size(), 1u);
    EXPECT_EQ(loaded.children[0].name, "wheel_rl");
    EXPECT_EQ(loaded.children[0].transform.translate, spec.position);
    ASSERT_EQ(loaded.children[0].parts.size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(loaded.children[0].parts[i].geometry.triangleCount(), result.children[0].parts[i].geometry.triangleCount());
        EXPECT_EQ(loaded.children[0].parts[i].material, result.children[0].parts[i].material);
    }
}

TEST(MeshFile, MaterialsRoundTrip) {
    std::filesystem::path path = scratch("lamp.mesh.gz");
    LoftResult result;
    result.name = "lamp";
    result.mesh = BoxGeometry(glm::vec3(1.0f));
    result.material = Material::model(0.4f, 0.6f);

    ChildSpec spec;
    spec.name = "bulb";
    spec.type = "box";
    spec.color = glm::vec3(1.0f, 1.0f, 0.8f);
    spec.material.roughness = 0.1f;
    spec.material.metalness = 0.0f;
    spec.material.emissive = glm::vec3(1.0f, 1.0f, 0.0f);
    spec.material.emissiveIntensity = 2.0f;
    spec.material.transparent = true;
    spec.material.opacity = 0.5f;
    result.children.push_back(*Primitives::buildChild(spec));

    MeshFile().exportAsset(result, path.string());
    LoftResult loaded = MeshFile::load(path.string());

    EXPECT_EQ(loaded.material, result.material);
    EXPECT_TRUE(loaded.material.vertexColors);
    EXPECT_TRUE(loaded.material.flatShading);
    EXPECT_FLOAT_EQ(loaded.material.roughness, 0.4f);

    ASSERT_EQ(loaded.children.size(), 1u);
    ASSERT_EQ(loaded.children[0].parts.size(), 1u);
    const Material &bulb = loaded.children[0].parts[0].material;
    EXPECT_EQ(bulb, result.children[0].parts[0].material);
    EXPECT_EQ(bulb.color, glm::vec3(1.0f, 1.0f, 0.8f));
    EXPECT_EQ(bulb.emissive, glm::vec3(1.0f, 1.0f, 0.0f));
    EXPECT_FLOAT_EQ(bulb.emissiveIntensity, 2.0f);
    EXPECT_TRUE(bulb.transparent);
    EXPECT_FLOAT_EQ(bulb.opacity, 0.5f);
    EXPECT_FALSE(bulb.vertexColors);
}

TEST(MeshFile, CorruptCountsAreRuntimeErrors) {
    std::filesystem::path path = scratch("corrupt.mesh.gz");
    {
        std::ostringstream decompressed;
        decompressed.write(MeshFile::MAGIC, sizeof(MeshFile::MAGIC));
        uint32_t version = MeshFile::VERSION;
        decompressed.write(reinterpret_cast<const char*>(&version), sizeof(version));
        // Name length far beyond what the file holds
        uint64_t length = uint64_t(1) << 60;
        decompressed.write(reinterpret_cast<const char*>(&length), sizeof(length));
        decompressed << "abc";

        std::ofstream file(path, std::ios::binary);
        std::istringstream input(decompressed.str());
        gzipCompressToOfstream(input, file);
    }
    EXPECT_THROW(MeshFile::load(path.string()), std::runtime_error);

    std::filesystem::path truncated = scratch("truncated.mesh.gz");
    {
        LoftResult result = skinnedResult();
        std::filesystem::path full = scratch("full.mesh.gz");
        MeshFile().exportAsset(result, full.string());
        std::ifstream in(full, std::ios::binary);
        std::string bytes = gzipDecompressFromIfstream(in).str();

        std::ofstream file(truncated, std::ios::binary);
        std::istringstream input(bytes.substr(0, bytes.size() / 2));
        gzipCompressToOfstream(input, file);
    }
    EXPECT_THROW(MeshFile::load(truncated.string()), std::runtime_error);
}

TEST(MeshFile, RejectsForeignFiles) {
    EXPECT_THROW(MeshFile::load("/nonexistent/model.mesh.gz"), std::runtime_error);

    std::filesystem::path path = scratch("plain.txt");
    {
        std::ofstream out(path);
        out << "hello, not a mesh";
    }
    EXPECT_THROW(MeshFile::load(path.string()), std::runtime_error);
}
