#include "raw_view/view/view_transform.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace raw_view::view {

namespace {

float positive_or(float v, float fallback) {
    return (std::isfinite(v) && v > 0.0f) ? v : fallback;
}

// Product clamped to the finite float range.
float saturating_mul(float a, float b) {
    const double p = static_cast<double>(a) * static_cast<double>(b);
    const double limit = static_cast<double>(std::numeric_limits<float>::max());
    return static_cast<float>(std::clamp(p, -limit, limit));
}

} // namespace

ViewTransform::ViewTransform() : ViewTransform(ViewSettings{}) {}

ViewTransform::ViewTransform(const ViewSettings& settings)
    : settings_(settings), pan_(Vector2f::Zero()), zoom_(1.0f), aspect_ratio_(1.0f) {
    settings_.zoom_min = positive_or(settings_.zoom_min, ViewSettings{}.zoom_min);
    settings_.zoom_sensitivity =
        positive_or(settings_.zoom_sensitivity, ViewSettings{}.zoom_sensitivity);
}

void ViewTransform::reset(float aspect_ratio) {
    pan_ = Vector2f::Zero();
    zoom_ = 1.0f;
    aspect_ratio_ = positive_or(aspect_ratio, 1.0f);
}

void ViewTransform::apply_zoom_delta(float delta, const Vector2f& cursor_ndc) {
    if (!std::isfinite(delta)) {
        return;
    }
    const float old_zoom = zoom_;
    float new_zoom = old_zoom * std::exp(delta * settings_.zoom_sensitivity);
    if (!std::isfinite(new_zoom)) {
        new_zoom = std::numeric_limits<float>::max();
    }
    new_zoom = std::max(new_zoom, settings_.zoom_min);

    Vector2f cursor = cursor_ndc;
    if (!std::isfinite(cursor.x()) || !std::isfinite(cursor.y())) {
        cursor = Vector2f::Zero();
    }
    pan_ += cursor * (1.0f / new_zoom - 1.0f / old_zoom);
    zoom_ = new_zoom;
}

void ViewTransform::apply_pan_delta(const Vector2f& delta) {
    if (!std::isfinite(delta.x()) || !std::isfinite(delta.y())) {
        return;
    }
    pan_ += delta;
}

ViewMatrices ViewTransform::derive_matrix(float viewport_aspect) const {
    const float va = positive_or(viewport_aspect, 1.0f);
    const float relative = aspect_ratio_ / va;

    ViewMatrices out;
    if (relative > 1.0f) {
        out.scale = Vector2f(1.0f, 1.0f / relative);
    } else {
        out.scale = Vector2f(relative, 1.0f);
    }

    out.transform = Matrix4f::Identity();
    out.transform(0, 0) = zoom_;
    out.transform(1, 1) = zoom_;
    out.transform(0, 3) = saturating_mul(zoom_, pan_.x());
    out.transform(1, 3) = saturating_mul(zoom_, pan_.y());
    return out;
}

Vector2f ViewTransform::screen_delta_to_pan(float dx, float dy, float viewport_width,
                                            float viewport_height) const {
    const float vw = positive_or(viewport_width, 1.0f);
    const float vh = positive_or(viewport_height, 1.0f);
    return Vector2f(2.0f * dx / (vw * zoom_), -2.0f * dy / (vh * zoom_));
}

float ViewTransform::zoom_percent() const {
    return saturating_mul(zoom_, 100.0f);
}

Vector2f screen_to_ndc(float px, float py, float viewport_width, float viewport_height) {
    const float vw = positive_or(viewport_width, 1.0f);
    const float vh = positive_or(viewport_height, 1.0f);
    return Vector2f(2.0f * px / vw - 1.0f, 1.0f - 2.0f * py / vh);
}

float viewport_aspect(int width, int height) {
    if (width <= 0 || height <= 0) {
        return 1.0f;
    }
    return static_cast<float>(width) / static_cast<float>(height);
}

UniformBlock pack_uniform(const ViewMatrices& matrices) {
    UniformBlock block{};
    // Eigen::Matrix4f is column-major by default.
    std::copy(matrices.transform.data(), matrices.transform.data() + 16, block.begin());
    block[16] = matrices.scale.x();
    block[17] = matrices.scale.y();
    return block;
}

} // namespace raw_view::view
