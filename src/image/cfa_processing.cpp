#include "raw_view/image/cfa_processing.hpp"
#include "raw_view/core/errors.hpp"

#include <algorithm>

namespace raw_view::image {

namespace {

constexpr Channel R = Channel::R;
constexpr Channel G = Channel::G;
constexpr Channel B = Channel::B;

// [pattern][y & 1][x & 1]
const Channel kSiteTable[4][2][2] = {
    {{R, G}, {G, B}},   // RGGB
    {{B, G}, {G, R}},   // BGGR
    {{G, R}, {B, G}},   // GRBG
    {{G, B}, {R, G}},   // GBRG
};

int pattern_slot(BayerPattern pattern) {
    switch (pattern) {
        case BayerPattern::RGGB: return 0;
        case BayerPattern::BGGR: return 1;
        case BayerPattern::GRBG: return 2;
        case BayerPattern::GBRG: return 3;
        default: return -1;
    }
}

// {dx, dy}
const int kOrthogonal[4][2] = {{0, -1}, {0, 1}, {-1, 0}, {1, 0}};
const int kHorizontal[2][2] = {{-1, 0}, {1, 0}};
const int kVertical[2][2] = {{0, -1}, {0, 1}};
const int kDiagonal[4][2] = {{-1, -1}, {1, -1}, {-1, 1}, {1, 1}};

template <typename SampleFn>
float average_neighbors(const SampleFn& sample, int w, int h, int x, int y,
                        NeighborSet set) {
    const int (*offsets)[2] = nullptr;
    int n = 0;
    switch (set) {
        case NeighborSet::ORTHOGONAL: offsets = kOrthogonal; n = 4; break;
        case NeighborSet::HORIZONTAL: offsets = kHorizontal; n = 2; break;
        case NeighborSet::VERTICAL: offsets = kVertical; n = 2; break;
        case NeighborSet::DIAGONAL: offsets = kDiagonal; n = 4; break;
        case NeighborSet::NATIVE: return sample(x, y);
    }

    float sum = 0.0f;
    int cnt = 0;
    for (int i = 0; i < n; ++i) {
        const int xx = x + offsets[i][0];
        const int yy = y + offsets[i][1];
        if (xx < 0 || yy < 0 || xx >= w || yy >= h) continue;
        sum += sample(xx, yy);
        ++cnt;
    }
    // Frames narrower than two photosites have no neighbour of some channels.
    return (cnt > 0) ? (sum / static_cast<float>(cnt)) : sample(x, y);
}

template <typename SampleFn>
Eigen::Array3f bilinear_rgb(const SampleFn& sample, int w, int h,
                            BayerPattern pattern, int x, int y) {
    Eigen::Array3f rgb;
    for (Channel c : {R, G, B}) {
        const NeighborSet set = bayer_neighbor_set(pattern, y, x, c);
        rgb[channel_index(c)] = average_neighbors(sample, w, h, x, y, set);
    }
    return rgb;
}

} // namespace

bool is_supported_pattern(BayerPattern pattern) {
    return pattern_slot(pattern) >= 0;
}

Channel bayer_site_channel(BayerPattern pattern, int y, int x) {
    const int slot = pattern_slot(pattern);
    if (slot < 0) {
        throw UnsupportedPatternError(bayer_pattern_to_string(pattern));
    }
    return kSiteTable[slot][y & 1][x & 1];
}

NeighborSet bayer_neighbor_set(BayerPattern pattern, int y, int x, Channel channel) {
    const Channel native = bayer_site_channel(pattern, y, x);
    if (native == channel) {
        return NeighborSet::NATIVE;
    }
    if (channel == G) {
        return NeighborSet::ORTHOGONAL;
    }
    if (native == G) {
        return (bayer_site_channel(pattern, y, x ^ 1) == channel)
                   ? NeighborSet::HORIZONTAL
                   : NeighborSet::VERTICAL;
    }
    return NeighborSet::DIAGONAL;
}

BayerSampler::BayerSampler(const uint16_t* samples, int width, int height,
                           BayerPattern pattern, const std::array<float, 3>& black_levels)
    : samples_(samples), width_(width), height_(height), pattern_(pattern),
      black_(black_levels) {
    if (!is_supported_pattern(pattern_)) {
        throw UnsupportedPatternError(bayer_pattern_to_string(pattern_));
    }
}

float BayerSampler::linear(int x, int y) const {
    const Channel c = bayer_site_channel(pattern_, y, x);
    const float raw = static_cast<float>(
        samples_[static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)]);
    return std::max(0.0f, raw - black_[channel_index(c)]);
}

Eigen::Array3f BayerSampler::rgb_at(int x, int y) const {
    auto sample = [this](int xx, int yy) -> float { return linear(xx, yy); };
    return bilinear_rgb(sample, width_, height_, pattern_, x, y);
}

} // namespace raw_view::image
