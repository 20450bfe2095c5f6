#pragma once

#include "raw_view/core/types.hpp"

#include <string>

namespace raw_view::image {

/**
 * Channel measured by the photosite at (x, y) for a Bayer layout.
 * Pure table lookup keyed by (pattern, y & 1, x & 1).
 * Throws UnsupportedPatternError for BayerPattern::UNKNOWN.
 */
Channel bayer_site_channel(BayerPattern pattern, int y, int x);

bool is_supported_pattern(BayerPattern pattern);

// Which same-channel neighbours feed the estimate of a channel at a site.
enum class NeighborSet {
    NATIVE,      // measured directly
    ORTHOGONAL,  // up, down, left, right
    HORIZONTAL,  // left, right
    VERTICAL,    // up, down
    DIAGONAL     // the four corners
};

NeighborSet bayer_neighbor_set(BayerPattern pattern, int y, int x, Channel channel);

/**
 * Per-pixel bilinear reconstruction over raw sensor samples with black
 * levels subtracted (and clamped at zero) on read. Missing channels are the
 * mean of the same-channel neighbours inside the frame; neighbours past the
 * border are left out of the mean rather than clamped or mirrored.
 * Used by the single-pass reconstruction so no intermediate planes are
 * allocated.
 */
class BayerSampler {
public:
    BayerSampler(const uint16_t* samples, int width, int height,
                 BayerPattern pattern, const std::array<float, 3>& black_levels);

    // Black-subtracted value of the photosite at (x, y).
    float linear(int x, int y) const;

    // Linear R, G, B estimate at (x, y).
    Eigen::Array3f rgb_at(int x, int y) const;

    int width() const { return width_; }
    int height() const { return height_; }

private:
    const uint16_t* samples_;
    int width_;
    int height_;
    BayerPattern pattern_;
    std::array<float, 3> black_;
};

} // namespace raw_view::image
