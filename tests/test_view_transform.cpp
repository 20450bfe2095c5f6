#include "raw_view/view/view_transform.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using raw_view::Matrix4f;
using raw_view::Vector2f;
using raw_view::view::ViewTransform;

namespace {

// Quad point that the given NDC position shows, ignoring the aspect scale.
Vector2f quad_point_under(const ViewTransform& vt, const Vector2f& ndc) {
  return ndc / vt.zoom() - vt.pan();
}

} // namespace

TEST_CASE("reset_gives_identity_transform") {
  ViewTransform vt;
  vt.apply_zoom_delta(5.0f, Vector2f(0.3f, -0.2f));
  vt.apply_pan_delta(Vector2f(1.0f, 2.0f));
  vt.reset(1.5f);

  REQUIRE(vt.zoom() == 1.0f);
  REQUIRE(vt.pan() == Vector2f::Zero());
  REQUIRE(vt.aspect_ratio() == 1.5f);
  REQUIRE(vt.derive_matrix(1.5f).transform == Matrix4f::Identity());
  REQUIRE(vt.zoom_percent() == Catch::Approx(100.0f));
}

TEST_CASE("reset_replaces_invalid_aspect_with_one") {
  ViewTransform vt;
  vt.reset(0.0f);
  REQUIRE(vt.aspect_ratio() == 1.0f);
  vt.reset(std::numeric_limits<float>::quiet_NaN());
  REQUIRE(vt.aspect_ratio() == 1.0f);
}

TEST_CASE("derive_matrix_is_pure") {
  ViewTransform vt;
  vt.reset(1.3f);
  vt.apply_zoom_delta(3.0f, Vector2f(0.4f, 0.1f));
  vt.apply_pan_delta(Vector2f(0.25f, -0.5f));

  const auto a = vt.derive_matrix(16.0f / 9.0f);
  const auto b = vt.derive_matrix(16.0f / 9.0f);
  REQUIRE(a.transform == b.transform);
  REQUIRE(a.scale == b.scale);
  REQUIRE(vt.zoom() == vt.derive_matrix(1.0f).transform(0, 0));
}

TEST_CASE("transform_is_zoom_times_offset_point") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_zoom_delta(std::log(2.0f) / 0.1f, Vector2f::Zero());
  vt.apply_pan_delta(Vector2f(0.25f, -0.125f));

  const auto m = vt.derive_matrix(1.0f);
  REQUIRE(m.transform(0, 0) == Catch::Approx(2.0f));
  REQUIRE(m.transform(1, 1) == Catch::Approx(2.0f));
  REQUIRE(m.transform(2, 2) == 1.0f);
  REQUIRE(m.transform(0, 3) == Catch::Approx(0.5f));
  REQUIRE(m.transform(1, 3) == Catch::Approx(-0.25f));
  REQUIRE(m.transform(3, 3) == 1.0f);
}

TEST_CASE("zoom_is_exponential_and_composes") {
  ViewTransform a;
  a.reset(1.0f);
  a.apply_zoom_delta(1.5f, Vector2f::Zero());
  REQUIRE(a.zoom() == Catch::Approx(std::exp(0.15f)));
  a.apply_zoom_delta(-0.7f, Vector2f::Zero());

  ViewTransform b;
  b.reset(1.0f);
  b.apply_zoom_delta(0.8f, Vector2f::Zero());

  REQUIRE(a.zoom() == Catch::Approx(b.zoom()));
}

TEST_CASE("zoom_with_cursor_composes_like_a_single_step") {
  const Vector2f cursor(0.3f, -0.6f);
  ViewTransform a;
  a.reset(1.0f);
  a.apply_zoom_delta(2.0f, cursor);
  a.apply_zoom_delta(3.0f, cursor);

  ViewTransform b;
  b.reset(1.0f);
  b.apply_zoom_delta(5.0f, cursor);

  REQUIRE(a.zoom() == Catch::Approx(b.zoom()));
  REQUIRE(a.pan().x() == Catch::Approx(b.pan().x()));
  REQUIRE(a.pan().y() == Catch::Approx(b.pan().y()));
}

TEST_CASE("zoom_keeps_point_under_cursor_fixed") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_pan_delta(Vector2f(0.1f, 0.2f));
  const Vector2f cursor(-0.5f, 0.75f);

  const Vector2f before = quad_point_under(vt, cursor);
  vt.apply_zoom_delta(7.0f, cursor);
  const Vector2f after = quad_point_under(vt, cursor);

  REQUIRE(after.x() == Catch::Approx(before.x()).margin(1e-5));
  REQUIRE(after.y() == Catch::Approx(before.y()).margin(1e-5));
}

TEST_CASE("zoom_never_drops_below_minimum") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_zoom_delta(-1000.0f, Vector2f::Zero());
  REQUIRE(vt.zoom() == Catch::Approx(vt.settings().zoom_min));
  vt.apply_zoom_delta(-1.0f, Vector2f(0.5f, 0.5f));
  REQUIRE(vt.zoom() >= vt.settings().zoom_min);
  REQUIRE(vt.zoom() > 0.0f);
}

TEST_CASE("zoom_saturates_instead_of_overflowing") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_zoom_delta(1.0e6f, Vector2f::Zero());
  REQUIRE(std::isfinite(vt.zoom()));
  REQUIRE(std::isfinite(vt.pan().x()));
}

TEST_CASE("non_finite_input_leaves_state_unchanged") {
  ViewTransform vt;
  vt.reset(1.0f);
  const float nan = std::numeric_limits<float>::quiet_NaN();
  vt.apply_zoom_delta(nan, Vector2f::Zero());
  vt.apply_pan_delta(Vector2f(nan, 1.0f));
  REQUIRE(vt.zoom() == 1.0f);
  REQUIRE(vt.pan() == Vector2f::Zero());
}

TEST_CASE("pan_accumulates_without_clamping") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_pan_delta(Vector2f(100.0f, -50.0f));
  vt.apply_pan_delta(Vector2f(1.0f, 1.0f));
  REQUIRE(vt.pan().x() == Catch::Approx(101.0f));
  REQUIRE(vt.pan().y() == Catch::Approx(-49.0f));
  REQUIRE(vt.zoom() == 1.0f);
}

TEST_CASE("scale_fits_image_inside_viewport") {
  ViewTransform vt;

  vt.reset(2.0f);  // wide image, square window
  auto m = vt.derive_matrix(1.0f);
  REQUIRE(m.scale.x() == Catch::Approx(1.0f));
  REQUIRE(m.scale.y() == Catch::Approx(0.5f));

  vt.reset(0.5f);  // tall image, square window
  m = vt.derive_matrix(1.0f);
  REQUIRE(m.scale.x() == Catch::Approx(0.5f));
  REQUIRE(m.scale.y() == Catch::Approx(1.0f));

  vt.reset(16.0f / 9.0f);  // matching aspects fill the viewport
  m = vt.derive_matrix(16.0f / 9.0f);
  REQUIRE(m.scale.x() == Catch::Approx(1.0f));
  REQUIRE(m.scale.y() == Catch::Approx(1.0f));
}

TEST_CASE("drag_moves_content_with_pointer") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_zoom_delta(std::log(4.0f) / 0.1f, Vector2f::Zero());

  const float vw = 800.0f;
  const float vh = 600.0f;
  const Vector2f d = vt.screen_delta_to_pan(40.0f, 30.0f, vw, vh);
  const float zoom = vt.zoom();
  vt.apply_pan_delta(d);

  // Content moves by 2*px/size in clip space, y flipped.
  REQUIRE(zoom * d.x() == Catch::Approx(2.0f * 40.0f / vw));
  REQUIRE(zoom * d.y() == Catch::Approx(-2.0f * 30.0f / vh));
}

TEST_CASE("screen_to_ndc_maps_corners") {
  const Vector2f tl = raw_view::view::screen_to_ndc(0.0f, 0.0f, 640.0f, 480.0f);
  const Vector2f br = raw_view::view::screen_to_ndc(640.0f, 480.0f, 640.0f, 480.0f);
  const Vector2f mid = raw_view::view::screen_to_ndc(320.0f, 240.0f, 640.0f, 480.0f);
  REQUIRE(tl == Vector2f(-1.0f, 1.0f));
  REQUIRE(br == Vector2f(1.0f, -1.0f));
  REQUIRE(mid == Vector2f(0.0f, 0.0f));
}

TEST_CASE("viewport_aspect_handles_degenerate_windows") {
  REQUIRE(raw_view::view::viewport_aspect(1920, 1080) == Catch::Approx(16.0f / 9.0f));
  REQUIRE(raw_view::view::viewport_aspect(0, 1080) == 1.0f);
  REQUIRE(raw_view::view::viewport_aspect(640, 0) == 1.0f);
}

TEST_CASE("pack_uniform_lays_out_column_major_matrix_then_scale") {
  ViewTransform vt;
  vt.reset(2.0f);
  vt.apply_pan_delta(Vector2f(0.5f, -0.25f));
  const auto m = vt.derive_matrix(1.0f);
  const auto block = raw_view::view::pack_uniform(m);

  REQUIRE(block.size() == 20);
  REQUIRE(sizeof(block) == 80);
  REQUIRE(block[0] == m.transform(0, 0));
  REQUIRE(block[5] == m.transform(1, 1));
  REQUIRE(block[12] == Catch::Approx(0.5f));
  REQUIRE(block[13] == Catch::Approx(-0.25f));
  REQUIRE(block[15] == 1.0f);
  REQUIRE(block[16] == m.scale.x());
  REQUIRE(block[17] == m.scale.y());
  REQUIRE(block[18] == 0.0f);
  REQUIRE(block[19] == 0.0f);
}

TEST_CASE("saturated_zoom_keeps_matrix_finite_when_panned_away") {
  ViewTransform vt;
  vt.reset(1.0f);
  vt.apply_pan_delta(Vector2f(5.0f, -5.0f));
  vt.apply_zoom_delta(1.0e6f, Vector2f::Zero());
  REQUIRE(vt.zoom() == std::numeric_limits<float>::max());

  const auto m = vt.derive_matrix(1.0f);
  for (int i = 0; i < 16; ++i) {
    REQUIRE(std::isfinite(m.transform.data()[i]));
  }
  REQUIRE(m.transform(0, 3) == std::numeric_limits<float>::max());
  REQUIRE(m.transform(1, 3) == -std::numeric_limits<float>::max());
  REQUIRE(std::isfinite(vt.zoom_percent()));
}
