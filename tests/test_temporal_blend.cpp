#include "deflicker/blending/temporal_blend.hpp"
#include "deflicker/blending/weighting.hpp"
#include "deflicker/core/errors.hpp"

#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <map>

using deflicker::ConfigurationError;
using deflicker::Frame;
using deflicker::FramePtr;
using deflicker::blending::BlendWindow;
using deflicker::blending::TemporalBlender;
using deflicker::blending::WindowAlignment;
using deflicker::blending::make_blend_window;
using deflicker::matching::CorrespondenceField;
using deflicker::matching::PatchMatchParams;

namespace {

std::vector<int> range(int first, int last) {
  std::vector<int> v;
  for (int i = first; i <= last; ++i) v.push_back(i);
  return v;
}

struct FrameTable {
  std::map<int, FramePtr> frames;

  void add(Frame f) {
    const int idx = f.index;
    frames[idx] = std::make_shared<const Frame>(std::move(f));
  }
  deflicker::blending::FrameLookup lookup() const {
    return [this](int i) -> FramePtr {
      auto it = frames.find(i);
      return it == frames.end() ? nullptr : it->second;
    };
  }
};

PatchMatchParams small_match_params() {
  PatchMatchParams p;
  p.patch_size = 3;
  p.num_iter = 2;
  p.pyramid_levels = 1;
  return p;
}

} // namespace

TEST_CASE("centered_window_clamps_at_sequence_ends") {
  REQUIRE(make_blend_window(5, 5, 10, WindowAlignment::Centered).members == range(3, 7));
  REQUIRE(make_blend_window(0, 5, 10, WindowAlignment::Centered).members == range(0, 2));
  REQUIRE(make_blend_window(9, 5, 10, WindowAlignment::Centered).members == range(7, 9));
  // Even sizes put the extra member after the target.
  REQUIRE(make_blend_window(5, 4, 10, WindowAlignment::Centered).members == range(4, 7));
}

TEST_CASE("trailing_window_ends_at_target") {
  REQUIRE(make_blend_window(5, 3, 10, WindowAlignment::Trailing).members == range(3, 5));
  REQUIRE(make_blend_window(1, 3, 10, WindowAlignment::Trailing).members == range(0, 1));
}

TEST_CASE("single_frame_sequence_window_holds_only_the_target") {
  BlendWindow w = make_blend_window(0, 7, 1, WindowAlignment::Centered);
  REQUIRE(w.members == std::vector<int>{0});
  REQUIRE(make_blend_window(4, 1, 10, WindowAlignment::Centered).members == std::vector<int>{4});
}

TEST_CASE("window_span_covers_every_target_window") {
  deflicker::Batch batch{2, 4, 5};
  auto span = deflicker::blending::window_span(batch, 3, 10, WindowAlignment::Centered);
  REQUIRE(span.first == 3);
  REQUIRE(span.second == 6);

  deflicker::Batch last{4, 8, 9};
  span = deflicker::blending::window_span(last, 5, 10, WindowAlignment::Centered);
  REQUIRE(span.first == 6);
  REQUIRE(span.second == 9);
}

TEST_CASE("weights_decrease_with_cost") {
  auto exp_w = deflicker::blending::exponential_weight(10.0f);
  REQUIRE(exp_w(0.0f, 0) == Catch::Approx(1.0f));
  REQUIRE(exp_w(100.0f, 0) == Catch::Approx(std::exp(-1.0f)));
  REQUIRE(exp_w(50.0f, 0) > exp_w(200.0f, 0));

  auto degrain = deflicker::blending::degrain_weight(400.0f);
  REQUIRE(degrain(0.0f, 0) == Catch::Approx(1.0f));
  REQUIRE(degrain(100.0f, 0) > degrain(300.0f, 0));
  REQUIRE(degrain(400.0f, 0) == 0.0f);
  REQUIRE(degrain(1000.0f, 0) == 0.0f);

  auto inv = deflicker::blending::inverse_weight();
  REQUIRE(inv(0.0f, 0) == Catch::Approx(1.0f));
  REQUIRE(inv(3.0f, 0) == Catch::Approx(0.25f));
}

TEST_CASE("infinite_cost_gets_zero_weight") {
  const float inf = std::numeric_limits<float>::infinity();
  REQUIRE(deflicker::blending::exponential_weight(10.0f)(inf, 0) == 0.0f);
  REQUIRE(deflicker::blending::degrain_weight(400.0f)(inf, 0) == 0.0f);
  REQUIRE(deflicker::blending::inverse_weight()(inf, 0) == 0.0f);
}

TEST_CASE("temporal_falloff_prefers_closer_frames") {
  auto w = deflicker::blending::with_temporal_falloff(
      deflicker::blending::inverse_weight(), 2.0f);
  REQUIRE(w(0.0f, 0) == Catch::Approx(1.0f));
  REQUIRE(w(0.0f, 2) == Catch::Approx(std::exp(-0.5f)));
  REQUIRE(w(0.0f, -1) > w(0.0f, 3));

  auto unchanged = deflicker::blending::with_temporal_falloff(
      deflicker::blending::inverse_weight(), 0.0f);
  REQUIRE(unchanged(0.0f, 5) == Catch::Approx(1.0f));
}

TEST_CASE("weight_function_from_config") {
  deflicker::config::BlendingConfig cfg;
  cfg.weighting = "degrain";
  cfg.degrain_threshold = 100.0f;
  auto w = deflicker::blending::make_weight_function(cfg);
  REQUIRE(w(100.0f, 0) == 0.0f);

  cfg.weighting = "median";
  REQUIRE_THROWS_AS(deflicker::blending::make_weight_function(cfg), ConfigurationError);
}

TEST_CASE("remap_with_identity_field_reproduces_reference") {
  Frame ref = deflicker::test::make_textured_frame(3, 20, 16, 3);
  auto remapped = deflicker::blending::remap_frame(
      ref, CorrespondenceField::identity(16, 20), 5);
  REQUIRE(remapped.frame.geometry() == ref.geometry());
  REQUIRE(deflicker::test::max_abs_diff(remapped.frame, ref) == 0.0);
  REQUIRE(remapped.cost.maxCoeff() == 0.0f);
}

TEST_CASE("remap_with_invalid_field_has_no_votes") {
  Frame ref = deflicker::test::make_textured_frame(3, 10, 10);
  auto remapped = deflicker::blending::remap_frame(
      ref, CorrespondenceField::invalid(10, 10), 3);
  for (int y = 0; y < 10; ++y) {
    for (int x = 0; x < 10; ++x) {
      REQUIRE(std::isinf(remapped.cost(y, x)));
    }
  }
}

TEST_CASE("remap_follows_constant_offset") {
  Frame ref = deflicker::test::make_textured_frame(1, 24, 24);
  CorrespondenceField field = CorrespondenceField::identity(24, 24);
  field.offset_x.setConstant(2);
  field.offset_y.setConstant(1);
  auto remapped = deflicker::blending::remap_frame(ref, field, 3);
  REQUIRE(remapped.frame.channels[0](10, 10) == ref.channels[0](11, 12));
}

TEST_CASE("static_sequence_blends_to_itself") {
  FrameTable table;
  for (int i = 0; i < 5; ++i) {
    table.add(deflicker::test::make_textured_frame(i, 32, 24, 3));
  }
  TemporalBlender blender(small_match_params(),
                          deflicker::blending::exponential_weight(10.0f), 1234);

  for (int target = 0; target < 5; ++target) {
    BlendWindow w = make_blend_window(target, 5, 5, WindowAlignment::Centered);
    Frame out = blender.blend(w, table.lookup());
    REQUIRE(out.index == target);
    REQUIRE(out.geometry() == table.frames[target]->geometry());
    REQUIRE(deflicker::test::max_abs_diff(out, *table.frames[target]) < 1e-3);
  }
}

TEST_CASE("tracked_matching_keeps_static_sequence_and_is_repeatable") {
  FrameTable table;
  for (int i = 0; i < 7; ++i) {
    table.add(deflicker::test::make_textured_frame(i, 24, 24, 1, 1.0 * i, 0.0));
  }
  TemporalBlender tracked(small_match_params(),
                          deflicker::blending::exponential_weight(10.0f), 77, 1);
  REQUIRE(tracked.tracking_window_size() == 1);

  const BlendWindow w = make_blend_window(3, 7, 7, WindowAlignment::Centered);
  Frame a = tracked.blend(w, table.lookup());
  Frame b = tracked.blend(w, table.lookup());
  REQUIRE(deflicker::test::frames_identical(a, b));
  REQUIRE(a.geometry() == table.frames[3]->geometry());

  FrameTable still;
  for (int i = 0; i < 5; ++i) {
    still.add(deflicker::test::make_textured_frame(i, 24, 24));
  }
  Frame out = tracked.blend(make_blend_window(2, 5, 5, WindowAlignment::Centered), still.lookup());
  REQUIRE(deflicker::test::max_abs_diff(out, *still.frames[2]) < 1e-3);

  REQUIRE_THROWS_AS(TemporalBlender(small_match_params(),
                                    deflicker::blending::inverse_weight(), 1, -1),
                    ConfigurationError);
}

TEST_CASE("window_of_one_returns_target_unchanged") {
  FrameTable table;
  table.add(deflicker::test::make_textured_frame(0, 16, 16));
  table.add(deflicker::test::add_noise(deflicker::test::make_textured_frame(1, 16, 16), 20.0f, 9));
  TemporalBlender blender(small_match_params(), deflicker::blending::inverse_weight(), 1);

  Frame out = blender.blend(make_blend_window(1, 1, 2, WindowAlignment::Centered), table.lookup());
  REQUIRE(deflicker::test::frames_identical(out, *table.frames[1]));
}

TEST_CASE("zero_weights_fall_back_to_target_pixels") {
  FrameTable table;
  table.add(deflicker::test::make_textured_frame(0, 16, 16));
  table.add(deflicker::test::make_constant_frame(1, 16, 16, 1, 200.0f));
  table.add(deflicker::test::make_textured_frame(2, 16, 16, 1, 1.0, 0.0));
  TemporalBlender blender(small_match_params(),
                          [](float, int) { return 0.0f; }, 1);

  Frame out = blender.blend(make_blend_window(1, 3, 3, WindowAlignment::Centered), table.lookup());
  REQUIRE(deflicker::test::frames_identical(out, *table.frames[1]));
}

TEST_CASE("blend_pulls_flickering_frame_towards_neighbours") {
  // Brightness flicker on the middle frame of a flat field.
  FrameTable table;
  table.add(deflicker::test::make_constant_frame(0, 24, 24, 1, 100.0f));
  table.add(deflicker::test::make_constant_frame(1, 24, 24, 1, 106.0f));
  table.add(deflicker::test::make_constant_frame(2, 24, 24, 1, 100.0f));

  TemporalBlender blender(small_match_params(),
                          deflicker::blending::exponential_weight(10.0f), 5);
  Frame out = blender.blend(make_blend_window(1, 3, 3, WindowAlignment::Centered), table.lookup());

  // Every match costs 36, so each neighbour gets exp(-0.36).
  const double w = std::exp(-0.36);
  const double expected = (106.0 + 2.0 * w * 100.0) / (1.0 + 2.0 * w);
  REQUIRE(out.channels[0](12, 12) == Catch::Approx(expected).epsilon(1e-5));
  REQUIRE(out.channels[0](0, 23) == Catch::Approx(expected).epsilon(1e-5));
}

TEST_CASE("missing_window_member_is_a_data_error") {
  FrameTable table;
  table.add(deflicker::test::make_textured_frame(0, 16, 16));
  TemporalBlender blender(small_match_params(), deflicker::blending::inverse_weight(), 1);
  REQUIRE_THROWS_AS(
      blender.blend(make_blend_window(0, 3, 3, WindowAlignment::Centered), table.lookup()),
      deflicker::DataError);
}
