#pragma once

#include "raw_view/core/types.hpp"
#include "raw_view/view/view_transform.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace raw_view::session {

// A displayable image and what the loader measured while producing it.
struct LoadedImage {
    std::shared_ptr<const RgbImage> image;
    std::string source;
    std::chrono::milliseconds load_time{0};
    uint64_t memory_mib = 0;
    Metadata metadata;   // "Make", "Model" when the decoder reported them
};

/**
 * What the render loop reads once per frame. The image pointer and the
 * matrices always come from the same snapshot.
 */
struct FrameSnapshot {
    std::shared_ptr<const RgbImage> image;
    ViewMatrices matrices;
    float zoom_percent = 100.0f;
};

/**
 * Displayed image plus its view transform, shared between the render thread
 * and loader completions. install() swaps the image and resets the view
 * under one lock, so no snapshot pairs a new image with a stale pan/zoom.
 */
class ViewerState {
public:
    ViewerState();
    explicit ViewerState(const view::ViewSettings& settings);

    void install(LoadedImage loaded);

    FrameSnapshot frame(float viewport_aspect) const;

    void zoom(float delta, const Vector2f& cursor_ndc);
    void pan(const Vector2f& delta);
    void drag(float dx, float dy, float viewport_width, float viewport_height);

    bool has_image() const;
    std::optional<LoadedImage> current() const;
    view::ViewTransform view() const;

private:
    mutable std::mutex mutex_;
    view::ViewTransform view_;
    std::optional<LoadedImage> current_;
};

} // namespace raw_view::session
