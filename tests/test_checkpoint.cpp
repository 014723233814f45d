#include "deflicker/core/errors.hpp"
#include "deflicker/core/mode_profile.hpp"
#include "deflicker/core/utils.hpp"
#include "deflicker/pipeline/checkpoint.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

namespace fs = std::filesystem;

using deflicker::CheckpointCorruption;
using deflicker::FrameGeometry;
using deflicker::pipeline::Checkpoint;
using deflicker::pipeline::CheckpointStore;
using deflicker::pipeline::ResumeDecision;
using deflicker::pipeline::compute_config_fingerprint;

namespace {

Checkpoint expected_checkpoint(const std::string &fingerprint = "abc") {
  Checkpoint cp;
  cp.fingerprint = fingerprint;
  cp.mode = "balanced";
  cp.total_batches = 5;
  cp.num_frames = 10;
  cp.batch_size = 2;
  return cp;
}

} // namespace

TEST_CASE("fresh_store_starts_at_batch_zero") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_fresh");
  CheckpointStore store(dir / "checkpoint.json");
  ResumeDecision d = store.open(expected_checkpoint());
  REQUIRE(d.start_batch == 0);
  REQUIRE_FALSE(d.loaded);
  REQUIRE(d.ignored_reason.empty());
  REQUIRE_FALSE(fs::exists(dir / "checkpoint.json"));
  fs::remove_all(dir);
}

TEST_CASE("committed_batches_resume_after_restart") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_resume");
  const auto path = dir / "checkpoint.json";
  {
    CheckpointStore store(path);
    store.open(expected_checkpoint());
    store.commit(0);
    store.commit(1);
    store.close(false);
  }
  REQUIRE(fs::exists(path));
  REQUIRE_FALSE(fs::exists(dir / "checkpoint.json.tmp"));

  CheckpointStore store(path);
  ResumeDecision d = store.open(expected_checkpoint());
  REQUIRE(d.loaded);
  REQUIRE_FALSE(d.complete);
  REQUIRE(d.start_batch == 2);
  REQUIRE(store.current().last_committed_batch == 1);
  fs::remove_all(dir);
}

TEST_CASE("changed_configuration_invalidates_checkpoint") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_mismatch");
  const auto path = dir / "checkpoint.json";
  {
    CheckpointStore store(path);
    store.open(expected_checkpoint("old"));
    store.commit(0);
  }
  CheckpointStore store(path);
  ResumeDecision d = store.open(expected_checkpoint("new"));
  REQUIRE(d.start_batch == 0);
  REQUIRE_FALSE(d.loaded);
  REQUIRE_FALSE(d.ignored_reason.empty());

  // The next commit replaces the foreign record.
  store.commit(0);
  auto cp = store.read();
  REQUIRE(cp.has_value());
  REQUIRE(cp->fingerprint == "new");
  REQUIRE(cp->last_committed_batch == 0);
  fs::remove_all(dir);
}

TEST_CASE("corrupt_checkpoint_is_treated_as_absent") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_corrupt");
  const auto path = dir / "checkpoint.json";

  deflicker::core::write_text(path, "{\"fingerprint\": \"abc\", \"last_comm");
  CheckpointStore store(path);
  REQUIRE_THROWS_AS(store.read(), CheckpointCorruption);
  ResumeDecision d = store.open(expected_checkpoint());
  REQUIRE(d.start_batch == 0);
  REQUIRE_FALSE(d.ignored_reason.empty());

  deflicker::core::write_text(path, "{\"fingerprint\": 12}");
  REQUIRE_THROWS_AS(store.read(), CheckpointCorruption);

  deflicker::core::write_text(path, "");
  REQUIRE(store.open(expected_checkpoint()).start_batch == 0);
  fs::remove_all(dir);
}

TEST_CASE("out_of_range_batch_index_is_corruption") {
  nlohmann::json j = expected_checkpoint().to_json();
  j["last_committed_batch"] = 9;
  REQUIRE_THROWS_AS(Checkpoint::from_json(j), CheckpointCorruption);
}

TEST_CASE("completed_checkpoint_resumes_past_the_last_batch") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_complete");
  const auto path = dir / "checkpoint.json";
  {
    CheckpointStore store(path);
    store.open(expected_checkpoint());
    for (int b = 0; b < 5; ++b) store.commit(b);
    store.close(true);
  }
  CheckpointStore store(path);
  ResumeDecision d = store.open(expected_checkpoint());
  REQUIRE(d.loaded);
  REQUIRE(d.complete);
  REQUIRE(d.start_batch == 5);
  fs::remove_all(dir);
}

TEST_CASE("commits_must_be_in_order") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_order");
  CheckpointStore store(dir / "checkpoint.json");
  REQUIRE_THROWS(store.commit(0));
  store.open(expected_checkpoint());
  REQUIRE_THROWS(store.commit(1));
  REQUIRE_NOTHROW(store.commit(0));
  REQUIRE_THROWS(store.commit(0));
  fs::remove_all(dir);
}

TEST_CASE("disabled_store_never_touches_disk") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_disabled");
  CheckpointStore store(dir / "checkpoint.json", false);
  REQUIRE(store.open(expected_checkpoint()).start_batch == 0);
  store.commit(0);
  store.close(true);
  REQUIRE_FALSE(fs::exists(dir / "checkpoint.json"));
  fs::remove_all(dir);
}

TEST_CASE("clear_removes_the_checkpoint") {
  const auto dir = deflicker::test::make_temp_dir("ckpt_clear");
  CheckpointStore store(dir / "checkpoint.json");
  store.open(expected_checkpoint());
  store.commit(0);
  REQUIRE(fs::exists(store.path()));
  store.clear();
  REQUIRE_FALSE(fs::exists(store.path()));
  REQUIRE_FALSE(store.read().has_value());
  fs::remove_all(dir);
}

TEST_CASE("fingerprint_tracks_every_output_relevant_setting") {
  using deflicker::core::Mode;
  using deflicker::core::ResolutionHint;
  using deflicker::core::resolve_mode_profile;

  auto params = resolve_mode_profile(Mode::Balanced, ResolutionHint{64, 64});
  deflicker::config::BlendingConfig blending;
  const FrameGeometry geom{64, 64, 1};

  const std::string base = compute_config_fingerprint(params, blending, geom, 10, false);
  REQUIRE(base.size() == 64);
  REQUIRE(base == compute_config_fingerprint(params, blending, geom, 10, false));

  auto other = params;
  other.window_size += 2;
  REQUIRE(base != compute_config_fingerprint(other, blending, geom, 10, false));

  other = params;
  other.tracking_window_size = 1;
  REQUIRE(base != compute_config_fingerprint(other, blending, geom, 10, false));

  other = params;
  other.batch_size = 1;
  REQUIRE(base != compute_config_fingerprint(other, blending, geom, 10, false));

  other = resolve_mode_profile(Mode::Accurate, ResolutionHint{64, 64});
  REQUIRE(base != compute_config_fingerprint(other, blending, geom, 10, false));

  REQUIRE(base != compute_config_fingerprint(params, blending, FrameGeometry{64, 48, 1}, 10, false));
  REQUIRE(base != compute_config_fingerprint(params, blending, geom, 11, false));
  REQUIRE(base != compute_config_fingerprint(params, blending, geom, 10, true));

  auto blend_other = blending;
  blend_other.weighting = "inverse";
  REQUIRE(base != compute_config_fingerprint(params, blend_other, geom, 10, false));
}
