#include "deflicker/core/errors.hpp"
#include "deflicker/matching/correspondence_field.hpp"
#include "deflicker/matching/patch_match.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>

using deflicker::ConfigurationError;
using deflicker::DataError;
using deflicker::Frame;
using deflicker::matching::CorrespondenceField;
using deflicker::matching::PatchDescriptor;
using deflicker::matching::PatchMatchParams;
using deflicker::matching::PatchMatcher;
using deflicker::matching::Rng;
using deflicker::matching::derive_seed;
using deflicker::matching::mean_cost;
using deflicker::matching::patch_cost;
using deflicker::test::make_textured_frame;

TEST_CASE("patch_cost_is_zero_for_identical_patches") {
  Frame a = make_textured_frame(0, 32, 32, 3);
  REQUIRE(patch_cost(a, a, PatchDescriptor{10, 12, 5}, 10, 12) == 0.0f);
  // Footprint taps beyond the border are edge-replicated.
  REQUIRE(patch_cost(a, a, PatchDescriptor{0, 0, 5}, 0, 0) == 0.0f);
  REQUIRE(patch_cost(a, a, PatchDescriptor{31, 31, 7}, 31, 31) == 0.0f);
}

TEST_CASE("patch_cost_rejects_centres_outside_reference") {
  Frame a = make_textured_frame(0, 16, 16);
  REQUIRE(std::isinf(patch_cost(a, a, PatchDescriptor{3, 3, 3}, -1, 3)));
  REQUIRE(std::isinf(patch_cost(a, a, PatchDescriptor{3, 3, 3}, 3, 16)));
  REQUIRE(std::isfinite(patch_cost(a, a, PatchDescriptor{3, 3, 3}, 15, 15)));
}

TEST_CASE("patch_cost_is_mean_squared_difference") {
  Frame a = deflicker::test::make_constant_frame(0, 8, 8, 2, 10.0f);
  Frame b = deflicker::test::make_constant_frame(1, 8, 8, 2, 13.0f);
  REQUIRE(patch_cost(a, b, PatchDescriptor{4, 4, 3}, 4, 4) == 9.0f);
}

TEST_CASE("derive_seed_depends_only_on_inputs") {
  REQUIRE(derive_seed(7, 3, 4) == derive_seed(7, 3, 4));
  REQUIRE(derive_seed(7, 3, 4) != derive_seed(7, 4, 3));
  REQUIRE(derive_seed(7, 3, 4) != derive_seed(8, 3, 4));
}

TEST_CASE("identical_frames_keep_identity_correspondence") {
  Frame a = make_textured_frame(0, 40, 32);
  Frame b = make_textured_frame(1, 40, 32);

  PatchMatchParams params;
  params.patch_size = 5;
  params.num_iter = 3;
  params.pyramid_levels = 2;
  PatchMatcher matcher(params);

  Rng rng(derive_seed(1, 0, 1));
  CorrespondenceField field = matcher.match(a, b, rng);

  REQUIRE(field.rows() == 32);
  REQUIRE(field.cols() == 40);
  REQUIRE(field.offset_x.cwiseAbs().maxCoeff() == 0);
  REQUIRE(field.offset_y.cwiseAbs().maxCoeff() == 0);
  REQUIRE(field.cost.maxCoeff() == 0.0f);
}

TEST_CASE("search_recovers_global_shift") {
  Frame src = make_textured_frame(0, 48, 48);
  Frame ref = make_textured_frame(1, 48, 48, 1, 3.0, 2.0);

  PatchMatchParams params;
  params.patch_size = 5;
  params.num_iter = 8;
  params.pyramid_levels = 2;
  PatchMatcher matcher(params);

  Rng rng(derive_seed(99, 0, 1));
  CorrespondenceField field = matcher.match(src, ref, rng);

  CorrespondenceField baseline = CorrespondenceField::identity(48, 48);
  for (int y = 0; y < 48; ++y) {
    for (int x = 0; x < 48; ++x) {
      baseline.cost(y, x) = patch_cost(src, ref, PatchDescriptor{x, y, 5}, x, y);
    }
  }
  REQUIRE(mean_cost(field) < 0.5f * mean_cost(baseline));

  // Content moved by (+3, +2).
  int exact = 0;
  int interior = 0;
  for (int y = 8; y < 40; ++y) {
    for (int x = 8; x < 40; ++x) {
      ++interior;
      if (field.offset_x(y, x) == 3 && field.offset_y(y, x) == 2) ++exact;
    }
  }
  REQUIRE(exact * 2 > interior);
}

TEST_CASE("more_iterations_never_increase_cost") {
  Frame src = make_textured_frame(0, 32, 32);
  Frame ref = make_textured_frame(1, 32, 32, 1, -2.0, 1.0);

  PatchMatchParams params;
  params.patch_size = 3;
  params.pyramid_levels = 1;
  params.init = deflicker::core::InitMode::Random;

  params.num_iter = 1;
  Rng rng_a(derive_seed(5, 0, 1));
  CorrespondenceField one = PatchMatcher(params).match(src, ref, rng_a);

  params.num_iter = 4;
  Rng rng_b(derive_seed(5, 0, 1));
  CorrespondenceField four = PatchMatcher(params).match(src, ref, rng_b);

  for (int y = 0; y < 32; ++y) {
    for (int x = 0; x < 32; ++x) {
      REQUIRE(four.cost(y, x) <= one.cost(y, x));
    }
  }
}

TEST_CASE("warm_start_from_previous_field_needs_fewer_iterations") {
  // Two references with the same motion: the field found for the first one
  // is a valid starting point for the second.
  Frame src = make_textured_frame(0, 32, 32);
  Frame ref_a = make_textured_frame(1, 32, 32, 1, 3.0, 2.0);
  Frame ref_b = make_textured_frame(2, 32, 32, 1, 3.0, 2.0);

  PatchMatchParams params;
  params.patch_size = 5;
  params.pyramid_levels = 1;

  // Same seed as the cold run: its single iteration is the first of these four.
  params.num_iter = 4;
  Rng rng_prev(derive_seed(9, 0, 2));
  CorrespondenceField previous = PatchMatcher(params).match(src, ref_a, rng_prev);

  params.num_iter = 1;
  Rng rng_cold(derive_seed(9, 0, 2));
  CorrespondenceField cold = PatchMatcher(params).match(src, ref_b, rng_cold);
  Rng rng_warm(derive_seed(9, 0, 2));
  CorrespondenceField warm =
      PatchMatcher(params).match(src, ref_b, rng_warm, nullptr, nullptr, &previous);

  // One warm iteration is never worse than four cold ones on the same motion.
  REQUIRE(mean_cost(warm) <= mean_cost(previous));
  REQUIRE(mean_cost(warm) <= mean_cost(cold));
  for (int y = 0; y < 32; ++y) {
    for (int x = 0; x < 32; ++x) {
      REQUIRE(warm.cost(y, x) <= previous.cost(y, x));
    }
  }
}

TEST_CASE("warm_start_outside_reference_falls_back_to_identity") {
  Frame src = make_textured_frame(0, 16, 16);
  CorrespondenceField far = CorrespondenceField::identity(16, 16);
  far.offset_x.setConstant(100);

  PatchMatchParams params;
  params.patch_size = 3;
  params.num_iter = 1;
  Rng rng(4);
  CorrespondenceField field = PatchMatcher(params).match(src, src, rng, nullptr, nullptr, &far);
  REQUIRE(field.cost.maxCoeff() == 0.0f);
  REQUIRE(field.offset_x.cwiseAbs().maxCoeff() == 0);

  CorrespondenceField wrong_size = CorrespondenceField::identity(8, 16);
  REQUIRE_THROWS_AS(PatchMatcher(params).match(src, src, rng, nullptr, nullptr, &wrong_size),
                    deflicker::DeflickerError);
}

TEST_CASE("same_seed_gives_identical_fields") {
  Frame src = make_textured_frame(0, 32, 24);
  Frame ref = make_textured_frame(1, 32, 24, 1, 1.5, -1.0);

  PatchMatchParams params;
  params.patch_size = 3;
  params.num_iter = 3;
  params.pyramid_levels = 1;
  params.init = deflicker::core::InitMode::Random;
  PatchMatcher matcher(params);

  Rng a(derive_seed(11, 0, 1));
  Rng b(derive_seed(11, 0, 1));
  CorrespondenceField fa = matcher.match(src, ref, a);
  CorrespondenceField fb = matcher.match(src, ref, b);
  REQUIRE(fa.offset_x == fb.offset_x);
  REQUIRE(fa.offset_y == fb.offset_y);
  REQUIRE(fa.cost == fb.cost);
}

TEST_CASE("random_init_only_produces_valid_matches") {
  Frame src = make_textured_frame(0, 20, 20);
  PatchMatchParams params;
  params.patch_size = 3;
  params.num_iter = 1;
  params.init = deflicker::core::InitMode::Random;

  Rng rng(3);
  CorrespondenceField field = PatchMatcher(params).match(src, src, rng);
  REQUIRE(deflicker::matching::count_valid(field) == 400);
  for (int y = 0; y < 20; ++y) {
    for (int x = 0; x < 20; ++x) {
      const int qx = x + field.offset_x(y, x);
      const int qy = y + field.offset_y(y, x);
      REQUIRE(qx >= 0);
      REQUIRE(qx < 20);
      REQUIRE(qy >= 0);
      REQUIRE(qy < 20);
    }
  }
}

TEST_CASE("reference_smaller_than_patch_is_a_configuration_error") {
  Frame tiny = make_textured_frame(0, 4, 4);
  PatchMatchParams params;
  params.patch_size = 5;
  Rng rng(1);
  REQUIRE_THROWS_AS(PatchMatcher(params).match(tiny, tiny, rng), ConfigurationError);
}

TEST_CASE("even_patch_size_is_a_configuration_error") {
  PatchMatchParams params;
  params.patch_size = 4;
  REQUIRE_THROWS_AS(PatchMatcher(params), ConfigurationError);
}

TEST_CASE("geometry_mismatch_is_a_data_error_naming_the_reference") {
  Frame src = make_textured_frame(0, 16, 16);
  Frame ref = make_textured_frame(7, 16, 12);
  PatchMatchParams params;
  params.patch_size = 3;
  Rng rng(1);
  try {
    PatchMatcher(params).match(src, ref, rng);
    FAIL("expected DataError");
  } catch (const DataError &e) {
    REQUIRE(e.frame_index() == 7);
  }
}

TEST_CASE("guides_must_come_in_pairs") {
  Frame src = make_textured_frame(0, 16, 16);
  Frame ref = make_textured_frame(1, 16, 16);
  PatchMatchParams params;
  params.patch_size = 3;
  params.guide_weight = 10.0f;
  Rng rng(1);
  REQUIRE_THROWS_AS(PatchMatcher(params).match(src, ref, rng, &src, nullptr),
                    ConfigurationError);

  Frame small_guide = make_textured_frame(1, 8, 8);
  REQUIRE_THROWS_AS(PatchMatcher(params).match(src, ref, rng, &src, &small_guide),
                    DataError);
}

TEST_CASE("identical_guides_keep_identity_on_differing_frames") {
  // Frames disagree everywhere, the guides agree: guide-dominated cost keeps
  // every pixel on its identity match when the frame difference is flat.
  Frame src = deflicker::test::make_constant_frame(0, 24, 24, 1, 50.0f);
  Frame ref = deflicker::test::make_constant_frame(1, 24, 24, 1, 60.0f);
  Frame guide = make_textured_frame(0, 24, 24);

  PatchMatchParams params;
  params.patch_size = 3;
  params.num_iter = 3;
  params.guide_weight = 10.0f;
  Rng rng(derive_seed(2, 0, 1));
  CorrespondenceField field = PatchMatcher(params).match(src, ref, rng, &guide, &guide);

  REQUIRE(field.offset_x.cwiseAbs().maxCoeff() == 0);
  REQUIRE(field.offset_y.cwiseAbs().maxCoeff() == 0);
  // (10 * 0 + 100) / 11
  REQUIRE(std::abs(field.cost(12, 12) - 100.0f / 11.0f) < 1e-4f);
}

TEST_CASE("upsample_field_doubles_offsets") {
  CorrespondenceField coarse = CorrespondenceField::identity(2, 2);
  coarse.offset_x(0, 1) = 3;
  coarse.offset_y(1, 0) = -2;
  CorrespondenceField fine = deflicker::matching::upsample_field(coarse, 5, 4);
  REQUIRE(fine.rows() == 5);
  REQUIRE(fine.cols() == 4);
  REQUIRE(fine.offset_x(0, 2) == 6);
  REQUIRE(fine.offset_x(1, 3) == 6);
  REQUIRE(fine.offset_y(2, 0) == -4);
  REQUIRE(fine.offset_y(4, 1) == -4);
  REQUIRE(std::isinf(fine.cost(0, 0)));
}
