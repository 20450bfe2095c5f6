#include "raw_view/session/viewer_state.hpp"

namespace raw_view::session {

ViewerState::ViewerState() : ViewerState(view::ViewSettings{}) {}

ViewerState::ViewerState(const view::ViewSettings& settings) : view_(settings) {}

void ViewerState::install(LoadedImage loaded) {
    float aspect = 1.0f;
    if (loaded.image && loaded.image->width > 0 && loaded.image->height > 0) {
        aspect = static_cast<float>(loaded.image->width) /
                 static_cast<float>(loaded.image->height);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    view_.reset(aspect);
    current_ = std::move(loaded);
}

FrameSnapshot ViewerState::frame(float viewport_aspect) const {
    std::lock_guard<std::mutex> lock(mutex_);
    FrameSnapshot snap;
    if (current_) {
        snap.image = current_->image;
    }
    snap.matrices = view_.derive_matrix(viewport_aspect);
    snap.zoom_percent = view_.zoom_percent();
    return snap;
}

void ViewerState::zoom(float delta, const Vector2f& cursor_ndc) {
    std::lock_guard<std::mutex> lock(mutex_);
    view_.apply_zoom_delta(delta, cursor_ndc);
}

void ViewerState::pan(const Vector2f& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    view_.apply_pan_delta(delta);
}

void ViewerState::drag(float dx, float dy, float viewport_width, float viewport_height) {
    std::lock_guard<std::mutex> lock(mutex_);
    view_.apply_pan_delta(view_.screen_delta_to_pan(dx, dy, viewport_width, viewport_height));
}

bool ViewerState::has_image() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value() && current_->image != nullptr;
}

std::optional<LoadedImage> ViewerState::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

view::ViewTransform ViewerState::view() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return view_;
}

} // namespace raw_view::session
