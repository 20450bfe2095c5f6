#pragma once

#include "raw_view/core/types.hpp"

#include <functional>

namespace raw_view::image {

// Display transfer exponent; values are encoded as v^(1/kDisplayGamma).
constexpr float kDisplayGamma = 2.2f;

struct ReconstructOptions {
    int parallel_workers = 1;
    // Called with (rows_done, rows_total) from the worker threads, serialized.
    std::function<void(int, int)> progress;
    int progress_every_rows = 256;
};

/**
 * Linear sensor-referred RGB to display bytes:
 * white balance, normalize by (white - black), clamp to [0,1], gamma, round.
 * Input values are expected to be black-subtracted already.
 */
class ColorTransform {
public:
    ColorTransform(const std::array<float, 4>& black_levels,
                   const std::array<float, 4>& white_levels,
                   const std::array<float, 3>& wb_coeffs);

    explicit ColorTransform(const SensorFrame& frame);

    void apply(const Eigen::Array3f& linear_rgb, uint8_t* out_rgb) const;

    const Eigen::Array3f& gains() const { return gains_; }
    const Eigen::Array3f& ranges() const { return ranges_; }

private:
    Eigen::Array3f gains_;
    Eigen::Array3f ranges_;
};

/**
 * Check geometry, pattern and calibration of a frame.
 * Throws InvalidGeometryError or UnsupportedPatternError.
 */
void validate_frame(const SensorFrame& frame);

/**
 * Reconstruct a displayable RGB image from a Bayer mosaic.
 * The frame is validated before the output buffer is allocated.
 */
RgbImage reconstruct(const SensorFrame& frame);
RgbImage reconstruct(const SensorFrame& frame, const ReconstructOptions& options);

} // namespace raw_view::image
