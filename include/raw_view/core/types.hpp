#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace raw_view {

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix4f = Eigen::Matrix4f;
using Vector2f = Eigen::Vector2f;

// Bayer pattern enumeration
enum class BayerPattern {
    UNKNOWN,
    RGGB,
    BGGR,
    GRBG,
    GBRG
};

inline std::string bayer_pattern_to_string(BayerPattern pattern) {
    switch (pattern) {
        case BayerPattern::RGGB: return "RGGB";
        case BayerPattern::BGGR: return "BGGR";
        case BayerPattern::GRBG: return "GRBG";
        case BayerPattern::GBRG: return "GBRG";
        default: return "UNKNOWN";
    }
}

inline BayerPattern string_to_bayer_pattern(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (norm == "RGGB") return BayerPattern::RGGB;
    if (norm == "BGGR") return BayerPattern::BGGR;
    if (norm == "GRBG") return BayerPattern::GRBG;
    if (norm == "GBRG") return BayerPattern::GBRG;
    return BayerPattern::UNKNOWN;
}

// Colour channel measured by a photosite. Also the index into the
// per-channel calibration arrays.
enum class Channel : uint8_t {
    R = 0,
    G = 1,
    B = 2
};

inline int channel_index(Channel c) {
    return static_cast<int>(c);
}

inline std::string channel_to_string(Channel c) {
    switch (c) {
        case Channel::R: return "R";
        case Channel::G: return "G";
        case Channel::B: return "B";
    }
    return "?";
}

// Raw sensor capture with its calibration, as handed over by the decoder.
struct SensorFrame {
    std::vector<uint16_t> samples;           // row-major, one per photosite
    int width = 0;
    int height = 0;
    BayerPattern bayer_pattern = BayerPattern::UNKNOWN;
    std::array<float, 4> black_levels{0.0f, 0.0f, 0.0f, 0.0f};   // R, G, B, (unused)
    std::array<float, 4> white_levels{0.0f, 0.0f, 0.0f, 0.0f};   // R, G, B, (unused)
    std::array<float, 3> wb_coeffs{1.0f, 1.0f, 1.0f};            // R, G, B

    std::string make;
    std::string model;
};

// Interleaved 8-bit RGB, tightly packed, rows top to bottom.
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    size_t byte_size() const { return pixels.size(); }

    const uint8_t* pixel(int x, int y) const {
        return pixels.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) +
                                static_cast<size_t>(x)) * 3;
    }
};

// Per-frame output of the view transform
struct ViewMatrices {
    Matrix4f transform;   // column-major, ready for upload
    Vector2f scale;       // aspect correction applied to the unit quad
};

using Metadata = std::map<std::string, std::string>;

} // namespace raw_view
