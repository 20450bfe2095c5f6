#include "raw_view/image/decoded.hpp"
#include "raw_view/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>

namespace raw_view::image {

RgbImage from_decoded(const cv::Mat& decoded) {
    if (decoded.empty()) {
        throw DecodeError("empty decoded buffer");
    }
    if (decoded.dims != 2) {
        throw DecodeError("expected a 2D buffer, got " + std::to_string(decoded.dims) + " dims");
    }

    cv::Mat src8;
    switch (decoded.depth()) {
        case CV_8U:
            src8 = decoded;
            break;
        case CV_16U:
            decoded.convertTo(src8, CV_8U, 255.0 / 65535.0);
            break;
        default:
            throw DecodeError("unsupported depth " + std::to_string(decoded.depth()));
    }

    cv::Mat rgb;
    switch (src8.channels()) {
        case 1: cv::cvtColor(src8, rgb, cv::COLOR_GRAY2RGB); break;
        case 3: cv::cvtColor(src8, rgb, cv::COLOR_BGR2RGB); break;
        case 4: cv::cvtColor(src8, rgb, cv::COLOR_BGRA2RGB); break;
        default:
            throw DecodeError("unsupported channel count " + std::to_string(src8.channels()));
    }

    RgbImage out;
    out.width = rgb.cols;
    out.height = rgb.rows;
    out.pixels.resize(static_cast<size_t>(rgb.cols) * static_cast<size_t>(rgb.rows) * 3);
    const size_t row_bytes = static_cast<size_t>(rgb.cols) * 3;
    for (int y = 0; y < rgb.rows; ++y) {
        std::memcpy(out.pixels.data() + static_cast<size_t>(y) * row_bytes, rgb.ptr<uint8_t>(y),
                    row_bytes);
    }
    return out;
}

cv::Mat to_bgr_mat(const RgbImage& image) {
    if (image.width <= 0 || image.height <= 0 ||
        image.pixels.size() != static_cast<size_t>(image.width) * static_cast<size_t>(image.height) * 3) {
        throw ValidationError("RgbImage buffer does not match " + std::to_string(image.width) +
                              "x" + std::to_string(image.height));
    }
    // Wrap without copying, then convert into a new buffer.
    cv::Mat rgb(image.height, image.width, CV_8UC3, const_cast<uint8_t*>(image.pixels.data()));
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    return bgr;
}

SensorFrame sensor_frame_from_mosaic(const cv::Mat& mosaic, BayerPattern pattern) {
    if (mosaic.empty() || mosaic.channels() != 1) {
        throw DecodeError("mosaic must be a non-empty single-channel buffer");
    }

    cv::Mat m16;
    switch (mosaic.depth()) {
        case CV_16U: m16 = mosaic; break;
        case CV_8U: mosaic.convertTo(m16, CV_16U); break;
        default:
            throw DecodeError("mosaic depth must be 8 or 16 bit");
    }

    SensorFrame frame;
    frame.width = m16.cols;
    frame.height = m16.rows;
    frame.bayer_pattern = pattern;
    frame.samples.resize(static_cast<size_t>(m16.cols) * static_cast<size_t>(m16.rows));
    for (int y = 0; y < m16.rows; ++y) {
        const uint16_t* row = m16.ptr<uint16_t>(y);
        std::copy(row, row + m16.cols,
                  frame.samples.begin() + static_cast<std::ptrdiff_t>(y) * m16.cols);
    }
    const float white = (mosaic.depth() == CV_8U) ? 255.0f : 65535.0f;
    frame.white_levels = {white, white, white, white};
    return frame;
}

} // namespace raw_view::image
