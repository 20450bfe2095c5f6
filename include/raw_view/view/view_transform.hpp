#pragma once

#include "raw_view/core/types.hpp"

#include <array>

namespace raw_view::view {

struct ViewSettings {
    float zoom_sensitivity = 0.1f;  // zoom *= exp(delta * sensitivity)
    float zoom_min = 0.01f;
};

/**
 * Pan/zoom state of the image viewer.
 *
 * Coordinates: the image is drawn on the unit quad [-1,1]^2, first scaled by
 * ViewMatrices::scale so it keeps its proportions inside the viewport, then
 * transformed by ViewMatrices::transform = zoom * (p + pan). Pan is therefore
 * expressed in quad units and zoom is a magnification (1 = fit).
 *
 * Only three fields are stored; every derived quantity is recomputed on
 * demand. Not thread-safe: mutate from the render thread only, or under the
 * lock held by session::ViewerState.
 */
class ViewTransform {
public:
    ViewTransform();
    explicit ViewTransform(const ViewSettings& settings);

    void reset(float aspect_ratio);

    // cursor_ndc: cursor in normalized device coordinates, y up. The image
    // point under the cursor stays fixed while zooming.
    void apply_zoom_delta(float delta, const Vector2f& cursor_ndc);

    void apply_pan_delta(const Vector2f& delta);

    ViewMatrices derive_matrix(float viewport_aspect) const;

    // Pixel drag (screen y down) to the pan delta that keeps the grabbed
    // point under the pointer at the current zoom.
    Vector2f screen_delta_to_pan(float dx, float dy, float viewport_width,
                                 float viewport_height) const;

    float zoom_percent() const;

    const Vector2f& pan() const { return pan_; }
    float zoom() const { return zoom_; }
    float aspect_ratio() const { return aspect_ratio_; }
    const ViewSettings& settings() const { return settings_; }

private:
    ViewSettings settings_;
    Vector2f pan_;
    float zoom_;
    float aspect_ratio_;
};

// Pixel position (origin top-left) to normalized device coordinates.
Vector2f screen_to_ndc(float px, float py, float viewport_width, float viewport_height);

float viewport_aspect(int width, int height);

/**
 * Uniform block as uploaded to the vertex stage: mat4 (column-major),
 * vec2 scale, vec2 padding. 80 bytes, 16-byte aligned.
 */
using UniformBlock = std::array<float, 20>;

UniformBlock pack_uniform(const ViewMatrices& matrices);

} // namespace raw_view::view
