#include "raw_view/synthetic/synthetic.hpp"
#include "raw_view/image/cfa_processing.hpp"

#include <algorithm>
#include <cmath>

namespace raw_view::synthetic {

namespace {

SensorFrame blank(int width, int height, BayerPattern pattern, float white_level) {
    SensorFrame frame;
    frame.width = std::max(0, width);
    frame.height = std::max(0, height);
    frame.bayer_pattern = pattern;
    frame.black_levels = {0.0f, 0.0f, 0.0f, 0.0f};
    frame.white_levels = {white_level, white_level, white_level, white_level};
    frame.wb_coeffs = {1.0f, 1.0f, 1.0f};
    frame.samples.assign(static_cast<size_t>(frame.width) * static_cast<size_t>(frame.height), 0);
    return frame;
}

} // namespace

SensorFrame flat_field(int width, int height, BayerPattern pattern,
                       uint16_t value, float white_level) {
    SensorFrame frame = blank(width, height, pattern, white_level);
    std::fill(frame.samples.begin(), frame.samples.end(), value);
    return frame;
}

SensorFrame color_patch(int width, int height, BayerPattern pattern,
                        uint16_t r, uint16_t g, uint16_t b, float white_level) {
    SensorFrame frame = blank(width, height, pattern, white_level);
    const uint16_t values[3] = {r, g, b};
    for (int y = 0; y < frame.height; ++y) {
        for (int x = 0; x < frame.width; ++x) {
            const Channel c = image::bayer_site_channel(pattern, y, x);
            frame.samples[static_cast<size_t>(y) * static_cast<size_t>(frame.width) +
                          static_cast<size_t>(x)] = values[channel_index(c)];
        }
    }
    return frame;
}

SensorFrame ramp(int width, int height, BayerPattern pattern, float white_level) {
    SensorFrame frame = blank(width, height, pattern, white_level);
    const float denom = static_cast<float>(std::max(1, frame.width - 1));
    for (int y = 0; y < frame.height; ++y) {
        for (int x = 0; x < frame.width; ++x) {
            const float v = white_level * static_cast<float>(x) / denom;
            frame.samples[static_cast<size_t>(y) * static_cast<size_t>(frame.width) +
                          static_cast<size_t>(x)] =
                static_cast<uint16_t>(std::clamp(std::lround(v), 0L, 65535L));
        }
    }
    return frame;
}

} // namespace raw_view::synthetic
