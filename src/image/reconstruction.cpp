#include "raw_view/image/reconstruction.hpp"
#include "raw_view/image/cfa_processing.hpp"
#include "raw_view/core/errors.hpp"
#include "raw_view/core/utils.hpp"

#include <atomic>
#include <cmath>
#include <exception>
#include <limits>
#include <mutex>
#include <thread>

namespace raw_view::image {

ColorTransform::ColorTransform(const std::array<float, 4>& black_levels,
                               const std::array<float, 4>& white_levels,
                               const std::array<float, 3>& wb_coeffs) {
    for (int c = 0; c < 3; ++c) {
        gains_[c] = wb_coeffs[static_cast<size_t>(c)];
        ranges_[c] = white_levels[static_cast<size_t>(c)] - black_levels[static_cast<size_t>(c)];
    }
}

ColorTransform::ColorTransform(const SensorFrame& frame)
    : ColorTransform(frame.black_levels, frame.white_levels, frame.wb_coeffs) {}

void ColorTransform::apply(const Eigen::Array3f& linear_rgb, uint8_t* out_rgb) const {
    const Eigen::Array3f balanced = linear_rgb * gains_;
    const Eigen::Array3f normalized = (balanced / ranges_).max(0.0f).min(1.0f);
    for (int c = 0; c < 3; ++c) {
        const float encoded = std::pow(normalized[c], 1.0f / kDisplayGamma);
        out_rgb[c] = static_cast<uint8_t>(std::lround(encoded * 255.0f));
    }
}

void validate_frame(const SensorFrame& frame) {
    if (frame.width <= 0 || frame.height <= 0) {
        throw InvalidGeometryError("width and height must be positive, got " +
                                   std::to_string(frame.width) + "x" +
                                   std::to_string(frame.height));
    }
    const size_t expected = static_cast<size_t>(frame.width) * static_cast<size_t>(frame.height);
    if (frame.samples.size() != expected) {
        throw InvalidGeometryError("expected " + std::to_string(expected) +
                                   " samples for " + std::to_string(frame.width) + "x" +
                                   std::to_string(frame.height) + ", got " +
                                   std::to_string(frame.samples.size()));
    }
    if (!is_supported_pattern(frame.bayer_pattern)) {
        throw UnsupportedPatternError(bayer_pattern_to_string(frame.bayer_pattern));
    }
    for (Channel c : {Channel::R, Channel::G, Channel::B}) {
        const size_t i = static_cast<size_t>(channel_index(c));
        const float black = frame.black_levels[i];
        const float white = frame.white_levels[i];
        const float gain = frame.wb_coeffs[i];
        if (!std::isfinite(black) || !std::isfinite(white) || black < 0.0f) {
            throw InvalidGeometryError("non-finite or negative levels for channel " +
                                       channel_to_string(c));
        }
        if (white <= black) {
            throw InvalidGeometryError("white level " + std::to_string(white) +
                                       " <= black level " + std::to_string(black) +
                                       " for channel " + channel_to_string(c));
        }
        if (!std::isfinite(gain) || gain < 0.0f) {
            throw InvalidGeometryError("white balance gain for channel " +
                                       channel_to_string(c) + " must be finite and >= 0");
        }
    }
}

RgbImage reconstruct(const SensorFrame& frame) {
    return reconstruct(frame, ReconstructOptions{});
}

RgbImage reconstruct(const SensorFrame& frame, const ReconstructOptions& options) {
    validate_frame(frame);

    const int w = frame.width;
    const int h = frame.height;
    const std::array<float, 3> black{frame.black_levels[0], frame.black_levels[1],
                                     frame.black_levels[2]};
    const BayerSampler sampler(frame.samples.data(), w, h, frame.bayer_pattern, black);
    const ColorTransform color(frame);

    RgbImage out;
    out.width = w;
    out.height = h;
    out.pixels.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);

    const int workers = core::compute_worker_count(options.parallel_workers,
                                                   static_cast<size_t>(h));
    const int report_every = std::max(1, options.progress_every_rows);

    std::atomic<int> next_row{0};
    std::atomic<int> rows_done{0};
    std::atomic<bool> failed{false};
    std::mutex progress_mutex;
    std::exception_ptr error;

    auto row_worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const int y = next_row.fetch_add(1);
            if (y >= h) {
                break;
            }
            uint8_t* row = out.pixels.data() + static_cast<size_t>(y) * static_cast<size_t>(w) * 3;
            for (int x = 0; x < w; ++x) {
                color.apply(sampler.rgb_at(x, y), row + static_cast<size_t>(x) * 3);
            }

            const int done = rows_done.fetch_add(1) + 1;
            if (options.progress && (done % report_every == 0 || done == h)) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                try {
                    options.progress(done, h);
                } catch (...) {
                    if (!error) {
                        error = std::current_exception();
                    }
                    failed.store(true, std::memory_order_relaxed);
                }
            }
        }
    };

    if (workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int i = 0; i < workers; ++i) {
            pool.emplace_back(row_worker);
        }
        for (auto& t : pool) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        row_worker();
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return out;
}

} // namespace raw_view::image
