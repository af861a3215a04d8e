#include "MeshFile.hpp"
#include "../math/Math.hpp"
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace {
    template<typename T>
    void write(std::ostream &out, const T &value) {
        out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    template<typename T>
    void writeVector(std::ostream &out, const std::vector<T> &values) {
        uint64_t size = values.size();
        write(out, size);
        out.write(reinterpret_cast<const char*>(values.data()), size * sizeof(T));
    }

    void writeString(std::ostream &out, const std::string &value) {
        uint64_t size = value.size();
        write(out, size);
        out.write(value.data(), size);
    }

    void writeGeometry(std::ostream &out, const Geometry &geometry) {
        uint8_t flags = (geometry.hasColors ? 1 : 0) | (geometry.hasTexCoords ? 2 : 0);
        write(out, flags);
        uint64_t count = geometry.vertices.size();
        write(out, count);
        for (const Vertex &v : geometry.vertices) {
            write(out, v.position);
            write(out, v.normal);
            write(out, v.color);
            write(out, v.texCoord);
        }
        writeVector(out, geometry.indices);
    }

    void writeMaterial(std::ostream &out, const Material &material) {
        write(out, material.color);
        write(out, material.roughness);
        write(out, material.metalness);
        write(out, material.emissive);
        write(out, material.emissiveIntensity);
        uint8_t flags = (material.transparent ? 1 : 0) | (material.vertexColors ? 2 : 0) | (material.flatShading ? 4 : 0);
        write(out, flags);
        write(out, material.opacity);
    }

    template<typename T>
    T read(std::istream &in) {
        T value;
        if (!in.read(reinterpret_cast<char*>(&value), sizeof(T))) {
            throw std::runtime_error("truncated mesh file");
        }
        return value;
    }

    uint64_t remaining(std::istream &in) {
        std::streamoff current = in.tellg();
        in.seekg(0, std::ios::end);
        std::streamoff end = in.tellg();
        in.seekg(current, std::ios::beg);
        if (current < 0 || end < current) {
            throw std::runtime_error("unreadable mesh file");
        }
        return static_cast<uint64_t>(end - current);
    }

    // Element count that the rest of the stream can actually hold
    uint64_t readCount(std::istream &in, size_t elementSize) {
        uint64_t count = read<uint64_t>(in);
        if (count > remaining(in) / elementSize) {
            throw std::runtime_error("truncated mesh file");
        }
        return count;
    }

    template<typename T>
    std::vector<T> readVector(std::istream &in) {
        uint64_t size = readCount(in, sizeof(T));
        std::vector<T> values(size);
        if (size > 0 && !in.read(reinterpret_cast<char*>(values.data()), size * sizeof(T))) {
            throw std::runtime_error("truncated mesh file");
        }
        return values;
    }

    std::string readString(std::istream &in) {
        std::vector<char> chars = readVector<char>(in);
        return std::string(chars.begin(), chars.end());
    }

    Geometry readGeometry(std::istream &in) {
        Geometry geometry;
        uint8_t flags = read<uint8_t>(in);
        geometry.hasColors = (flags & 1) != 0;
        geometry.hasTexCoords = (flags & 2) != 0;
        uint64_t count = readCount(in, 3 * sizeof(glm::vec3) + sizeof(glm::vec2));
        geometry.vertices.reserve(count);
        for (uint64_t i = 0; i < count; ++i) {
            Vertex v;
            v.position = read<glm::vec3>(in);
            v.normal = read<glm::vec3>(in);
            v.color = read<glm::vec3>(in);
            v.texCoord = read<glm::vec2>(in);
            geometry.vertices.push_back(v);
        }
        geometry.indices = readVector<uint>(in);
        for (uint index : geometry.indices) {
            if (index >= geometry.vertices.size()) {
                throw std::runtime_error("mesh file index out of range");
            }
        }
        return geometry;
    }

    Material readMaterial(std::istream &in) {
        Material material;
        material.color = read<glm::vec3>(in);
        material.roughness = read<float>(in);
        material.metalness = read<float>(in);
        material.emissive = read<glm::vec3>(in);
        material.emissiveIntensity = read<float>(in);
        uint8_t flags = read<uint8_t>(in);
        material.transparent = (flags & 1) != 0;
        material.vertexColors = (flags & 2) != 0;
        material.flatShading = (flags & 4) != 0;
        material.opacity = read<float>(in);
        return material;
    }
}

void MeshFile::exportAsset(const LoftResult &result, const std::string &path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    ensureFolderExists(parent.string());

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("failed to open file for writing: " + path);
    }

    std::ostringstream decompressed;
    decompressed.write(MAGIC, sizeof(MAGIC));
    write(decompressed, VERSION);
    writeString(decompressed, result.name);
    writeGeometry(decompressed, result.mesh);
    writeMaterial(decompressed, result.material);

    uint8_t skinned = result.skeleton ? 1 : 0;
    write(decompressed, skinned);
    if (result.skeleton) {
        uint64_t bones = result.skeleton->bones.size();
        write(decompressed, bones);
        for (const BoneDef &bone : result.skeleton->bones) {
            writeString(decompressed, bone.name);
            write(decompressed, static_cast<int32_t>(bone.parent));
            write(decompressed, bone.offset);
        }
        writeVector(decompressed, result.skin);

        uint64_t clips = result.animations.size();
        write(decompressed, clips);
        for (const AnimationClip &clip : result.animations) {
            writeString(decompressed, clip.name);
            write(decompressed, clip.duration);
            uint64_t tracks = clip.tracks.size();
            write(decompressed, tracks);
            for (const AnimationTrack &track : clip.tracks) {
                writeString(decompressed, track.bone);
                write(decompressed, static_cast<int32_t>(track.property));
                writeVector(decompressed, track.times);
                writeVector(decompressed, track.values);
            }
        }
    }

    uint64_t children = result.children.size();
    write(decompressed, children);
    for (const ChildObject &child : result.children) {
        writeString(decompressed, child.name);
        write(decompressed, child.transform.scale);
        write(decompressed, child.transform.translate);
        write(decompressed, child.transform.quaternion);
        uint64_t parts = child.parts.size();
        write(decompressed, parts);
        for (const MeshPart &part : child.parts) {
            writeMaterial(decompressed, part.material);
            writeGeometry(decompressed, part.geometry);
        }
    }

    std::istringstream inputStream(decompressed.str());
    gzipCompressToOfstream(inputStream, file);
    file.close();

    std::cout << "MeshFile::exportAsset('" << path << "') Ok!" << std::endl;
}

LoftResult MeshFile::load(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("failed to open file for reading: " + path);
    }
    std::stringstream in = gzipDecompressFromIfstream(file);

    char magic[4];
    if (!in.read(magic, sizeof(magic)) || std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
        throw std::runtime_error("not a mesh file: " + path);
    }
    uint32_t version = read<uint32_t>(in);
    if (version != VERSION) {
        throw std::runtime_error("unsupported mesh file version " + std::to_string(version));
    }

    LoftResult result;
    result.name = readString(in);
    result.mesh = readGeometry(in);
    result.material = readMaterial(in);

    if (read<uint8_t>(in) != 0) {
        uint64_t bones = readCount(in, sizeof(uint64_t));
        std::vector<BoneDef> defs;
        defs.reserve(bones);
        for (uint64_t i = 0; i < bones; ++i) {
            BoneDef bone;
            bone.name = readString(in);
            bone.parent = read<int32_t>(in);
            bone.offset = read<glm::vec3>(in);
            defs.push_back(bone);
        }
        try {
            result.skeleton = Skeleton(std::move(defs));
        } catch (const std::invalid_argument &e) {
            throw std::runtime_error(std::string("corrupt skeleton in mesh file: ") + e.what());
        }
        result.skin = readVector<SkinBinding>(in);

        uint64_t clips = readCount(in, sizeof(uint64_t));
        for (uint64_t i = 0; i < clips; ++i) {
            AnimationClip clip;
            clip.name = readString(in);
            clip.duration = read<float>(in);
            uint64_t tracks = readCount(in, sizeof(uint64_t));
            for (uint64_t t = 0; t < tracks; ++t) {
                AnimationTrack track;
                track.bone = readString(in);
                int32_t property = read<int32_t>(in);
                if (property < TRACK_POSITION || property > TRACK_SCALE) {
                    throw std::runtime_error("unknown track property in mesh file");
                }
                track.property = static_cast<TrackProperty>(property);
                track.times = readVector<float>(in);
                track.values = readVector<float>(in);
                clip.tracks.push_back(std::move(track));
            }
            result.animations.push_back(std::move(clip));
        }
    }

    uint64_t children = readCount(in, sizeof(uint64_t));
    for (uint64_t i = 0; i < children; ++i) {
        ChildObject child;
        child.name = readString(in);
        child.transform.scale = read<glm::vec3>(in);
        child.transform.translate = read<glm::vec3>(in);
        child.transform.quaternion = read<glm::quat>(in);
        uint64_t parts = readCount(in, sizeof(uint64_t));
        for (uint64_t p = 0; p < parts; ++p) {
            MeshPart part;
            part.material = readMaterial(in);
            part.geometry = readGeometry(in);
            child.parts.push_back(std::move(part));
        }
        result.children.push_back(std::move(child));
    }
    return result;
}
