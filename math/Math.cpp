#include "Math.hpp"
#include <zlib.h>
#include <vector>
#include <stdexcept>

float Math::clamp(float val, float min, float max) {
	return val < min ? min : val > max ? max : val;
}

glm::vec3 Math::hexToRgb(uint32_t hex) {
    return glm::vec3(
        ((hex >> 16) & 0xff) / 255.0f,
        ((hex >> 8) & 0xff) / 255.0f,
        (hex & 0xff) / 255.0f
    );
}

uint32_t Math::rgbToHex(const glm::vec3 &rgb) {
    uint32_t r = static_cast<uint32_t>(std::lround(clamp(rgb.r, 0.0f, 1.0f) * 255.0f));
    uint32_t g = static_cast<uint32_t>(std::lround(clamp(rgb.g, 0.0f, 1.0f) * 255.0f));
    uint32_t b = static_cast<uint32_t>(std::lround(clamp(rgb.b, 0.0f, 1.0f) * 255.0f));
    return (r << 16) | (g << 8) | b;
}

void ensureFolderExists(const std::string& folder) {
    if (!folder.empty() && !std::filesystem::exists(folder)) {
        std::filesystem::create_directories(folder);
    }
}

std::stringstream gzipDecompressFromIfstream(std::ifstream& inputFile) {
    if (!inputFile) {
        throw std::runtime_error("Failed to open input file.");
    }

    z_stream strm = {};
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib for decompression.");
    }

    std::stringstream decompressedStream;
    std::vector<char> inBuffer(1024);
    std::vector<char> outBuffer(1024);

    int ret = 0;
    do {
        inputFile.read(inBuffer.data(), inBuffer.size());
        strm.next_in = reinterpret_cast<Bytef*>(inBuffer.data());
        strm.avail_in = static_cast<uInt>(inputFile.gcount());

        if (strm.avail_in == 0) {
            break;
        }

        do {
            strm.next_out = reinterpret_cast<Bytef*>(outBuffer.data());
            strm.avail_out = outBuffer.size();

            ret = inflate(&strm, Z_NO_FLUSH);

            if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
                inflateEnd(&strm);
                throw std::runtime_error("Decompression failed: inflate() error " + std::to_string(ret));
            }

            decompressedStream.write(outBuffer.data(), outBuffer.size() - strm.avail_out);
        } while (strm.avail_out == 0);

    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Decompression finished unexpectedly. inflate() error " + std::to_string(ret));
    }

    return decompressedStream;
}

void gzipCompressToOfstream(std::istream& inputStream, std::ofstream& outputFile) {
    if (!outputFile) {
        throw std::runtime_error("Failed to open output file.");
    }

    z_stream strm = {};
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib for compression.");
    }

    std::vector<char> inBuffer(1024);
    std::vector<char> outBuffer(1024);

    int ret;
    do {
        inputStream.read(inBuffer.data(), inBuffer.size());
        strm.next_in = reinterpret_cast<Bytef*>(inBuffer.data());
        strm.avail_in = static_cast<uInt>(inputStream.gcount());

        int flush = inputStream.eof() ? Z_FINISH : Z_NO_FLUSH;

        do {
            strm.next_out = reinterpret_cast<Bytef*>(outBuffer.data());
            strm.avail_out = outBuffer.size();

            ret = deflate(&strm, flush);

            if (ret < 0 && ret != Z_BUF_ERROR) {
                deflateEnd(&strm);
                throw std::runtime_error("Compression failed: deflate() error " + std::to_string(ret));
            }

            outputFile.write(outBuffer.data(), outBuffer.size() - strm.avail_out);
        } while (strm.avail_out == 0);

    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
}
