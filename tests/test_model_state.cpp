/**
 * Tests for model_state.hpp: trained vs demo lifecycle, checkpoint failure
 * recovery, the process-wide instance and status reporting.
 */

#include <gtest/gtest.h>
#include "model_state.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace pgx;
using namespace pgx_test;

static SequenceTensor small_window(int pos) {
    Variant v;
    v.chrom = "10";
    v.pos = pos;
    v.ref = "C";
    v.alt = "T";
    WindowEncoder encoder(std::make_shared<SyntheticSequenceSource>(), kSmallFlank);
    return encoder.encode(v);
}

TEST(ModelMode, ToString) {
    EXPECT_EQ(model_mode_to_string(ModelMode::TRAINED), "trained");
    EXPECT_EQ(model_mode_to_string(ModelMode::DEMO), "demo");
}

TEST(ModelState, NoCheckpointIsDemo) {
    auto state = ModelState::create("", small_classifier_config());
    ASSERT_NE(state, nullptr);
    EXPECT_TRUE(state->is_demo());
    EXPECT_FALSE(state->is_loaded());
    EXPECT_EQ(state->mode(), ModelMode::DEMO);
    EXPECT_TRUE(state->checkpoint_path().empty());
    EXPECT_TRUE(state->load_error().empty());
    EXPECT_EQ(state->device(), "cpu");
}

TEST(ModelState, MissingCheckpointFallsBackToDemo) {
    auto state = ModelState::create("/nonexistent/model.ckpt", small_classifier_config());
    EXPECT_TRUE(state->is_demo());
    EXPECT_EQ(state->checkpoint_path(), "/nonexistent/model.ckpt");
    EXPECT_NE(state->load_error().find("Checkpoint error"), std::string::npos);
    EXPECT_TRUE(state->classifier().config() == small_classifier_config());
}

TEST(ModelState, CorruptCheckpointFallsBackToDemo) {
    TempFile ckpt(".ckpt");
    ckpt.write("garbage");
    auto state = ModelState::create(ckpt.path(), small_classifier_config());
    EXPECT_TRUE(state->is_demo());
    EXPECT_FALSE(state->load_error().empty());
}

TEST(ModelState, DemoPredictionsCapped) {
    auto state = ModelState::create("", small_classifier_config());
    for (int pos = 94790000; pos < 94790040; ++pos) {
        MlPrediction p = state->predict(small_window(pos));
        EXPECT_TRUE(p.demo_mode);
        EXPECT_LE(p.confidence, kDemoConfidenceCap);
    }
}

TEST(ModelState, LoadedCheckpointIsTrained) {
    TempFile ckpt(".ckpt");
    VariantClassifier trained(small_classifier_config(), 99);
    trained.save_checkpoint(ckpt.path());

    auto state = ModelState::create(ckpt.path());
    EXPECT_TRUE(state->is_loaded());
    EXPECT_FALSE(state->is_demo());
    EXPECT_TRUE(state->load_error().empty());

    SequenceTensor window = small_window(94790000);
    MlPrediction p = state->predict(window);
    EXPECT_FALSE(p.demo_mode);

    // Same confidence as the uncapped classifier
    MlPrediction direct = trained.predict(window, false);
    EXPECT_DOUBLE_EQ(p.confidence, direct.confidence);
    EXPECT_EQ(p.function_class, direct.function_class);
}

TEST(ModelState, CancellationPropagates) {
    auto state = ModelState::create("", small_classifier_config());
    std::atomic<bool> cancel{true};
    EXPECT_THROW(state->predict(small_window(94790000), &cancel), RequestCancelledError);
}

TEST(ModelState, StatusString) {
    auto state = ModelState::create("/nonexistent/model.ckpt", small_classifier_config());
    std::string status = state->status_string();
    EXPECT_NE(status.find("Model mode: demo"), std::string::npos);
    EXPECT_NE(status.find("/nonexistent/model.ckpt"), std::string::npos);
    EXPECT_NE(status.find("Load error:"), std::string::npos);
    EXPECT_NE(status.find("Device: cpu"), std::string::npos);
    EXPECT_NE(status.find("Confidence cap: 0.5"), std::string::npos);
    EXPECT_FALSE(state->simd_instructions().empty());
}

TEST(ModelState, GlobalInitializedOnce) {
    auto first = ModelState::global();
    auto second = ModelState::initialize_global("/some/other/model.ckpt");
    auto third = ModelState::global();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first.get(), third.get());
    EXPECT_TRUE(first->is_demo());
}
