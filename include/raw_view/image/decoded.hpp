#pragma once

#include "raw_view/core/types.hpp"

#include <opencv2/core.hpp>

namespace raw_view::image {

/**
 * Convert a buffer produced by the standard-format decoder into an RgbImage,
 * bypassing demosaicing. Accepts 8- or 16-bit depth with 1 (gray),
 * 3 (BGR, OpenCV order) or 4 (BGRA) channels. 16-bit data is scaled to 8 bit.
 * Throws DecodeError for anything else.
 */
RgbImage from_decoded(const cv::Mat& decoded);

// RGB bytes as a 3-channel BGR cv::Mat (deep copy), e.g. for cv::imwrite.
cv::Mat to_bgr_mat(const RgbImage& image);

/**
 * Mosaic from a single-channel 16-bit (or 8-bit) decoder buffer.
 * Geometry comes from the Mat; calibration is left to the caller.
 */
SensorFrame sensor_frame_from_mosaic(const cv::Mat& mosaic, BayerPattern pattern);

} // namespace raw_view::image
