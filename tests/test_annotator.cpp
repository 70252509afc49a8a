/**
 * Tests for annotator.hpp: curated matches, model fallback, unresolved
 * variants, relevance filtering and metric bookkeeping.
 */

#include <gtest/gtest.h>
#include "annotator.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace pgx;
using namespace pgx_test;

static Variant call(const std::string& chrom, int pos, const std::string& ref,
                    const std::string& alt, Zygosity zygosity) {
    Variant v;
    v.chrom = chrom;
    v.pos = pos;
    v.ref = ref;
    v.alt = alt;
    v.zygosity = zygosity;
    if (zygosity == Zygosity::HOM_ALT) {
        v.allele1 = 1;
        v.allele2 = 1;
    } else if (zygosity == Zygosity::HET) {
        v.allele1 = 0;
        v.allele2 = 1;
    } else if (zygosity == Zygosity::HOM_REF) {
        v.allele1 = 0;
        v.allele2 = 0;
    }
    return v;
}

class AnnotatorTest : public ::testing::Test {
protected:
    KnowledgeBase kb = KnowledgeBase::builtin();
    std::shared_ptr<const ReferenceStore> store = std::make_shared<ReferenceStore>(kb);
    std::shared_ptr<const WindowEncoder> encoder =
        std::make_shared<WindowEncoder>(std::make_shared<SyntheticSequenceSource>(), kSmallFlank);
    std::shared_ptr<const ModelState> model = ModelState::create("", small_classifier_config());
    VariantAnnotator annotator{store, encoder, model, true};
};

TEST_F(AnnotatorTest, CuratedMatch) {
    QualityMetrics metrics;
    auto result = annotator.annotate_one(call("chr22", 42524947, "C", "T", Zygosity::HET), metrics);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resolution, Resolution::MATCHED);
    EXPECT_EQ(result->gene, "CYP2D6");
    EXPECT_EQ(result->star_allele(), std::optional<std::string>("*4"));
    EXPECT_EQ(result->function_class(), std::optional<FunctionClass>(FunctionClass::NO_FUNCTION));
    EXPECT_EQ(result->rsid(), "rs3892097");
    EXPECT_FALSE(result->prediction.has_value());
    EXPECT_EQ(metrics.curated_matches(), 1u);
    EXPECT_EQ(metrics.pgx_relevant_hits(), 1u);
    EXPECT_EQ(metrics.ml_predictions_made(), 0u);
}

TEST_F(AnnotatorTest, CuratedMatchOutsideGeneWindow) {
    // CYP2C19*17 lies upstream of the monitored window but is still curated
    QualityMetrics metrics;
    auto result = annotator.annotate_one(call("10", 94761900, "C", "T", Zygosity::HET), metrics);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resolution, Resolution::MATCHED);
    EXPECT_EQ(result->gene, "CYP2C19");
}

TEST_F(AnnotatorTest, ModelFallbackInsideRegion) {
    QualityMetrics metrics;
    auto result = annotator.annotate_one(call("10", 94800000, "A", "G", Zygosity::HET), metrics);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resolution, Resolution::ML_RESOLVED);
    EXPECT_TRUE(result->is_model_derived());
    EXPECT_EQ(result->gene, "CYP2C19");
    ASSERT_TRUE(result->prediction.has_value());
    EXPECT_TRUE(result->prediction->demo_mode);
    EXPECT_LE(result->prediction->confidence, kDemoConfidenceCap);
    EXPECT_FALSE(result->entry.has_value());
    EXPECT_FALSE(result->star_allele().has_value());
    EXPECT_TRUE(result->function_class().has_value());
    EXPECT_TRUE(result->activity().has_value());
    EXPECT_EQ(result->rsid(), ".");
    EXPECT_EQ(metrics.ml_predictions_made(), 1u);
    EXPECT_EQ(metrics.pgx_relevant_hits(), 1u);
}

TEST_F(AnnotatorTest, OutsideEveryRegionDropped) {
    QualityMetrics metrics;
    auto result = annotator.annotate_one(call("3", 1000000, "A", "G", Zygosity::HOM_ALT), metrics);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(metrics.pgx_relevant_hits(), 0u);
}

TEST_F(AnnotatorTest, HomRefAndNoCallSkipped) {
    QualityMetrics metrics;
    EXPECT_FALSE(annotator.annotate_one(
        call("22", 42524947, "C", "T", Zygosity::HOM_REF), metrics).has_value());
    EXPECT_FALSE(annotator.annotate_one(
        call("22", 42524947, "C", "T", Zygosity::NO_CALL), metrics).has_value());
    EXPECT_EQ(metrics.pgx_relevant_hits(), 0u);
}

TEST_F(AnnotatorTest, SymbolicAltSkipped) {
    QualityMetrics metrics;
    EXPECT_FALSE(annotator.annotate_one(
        call("10", 94800000, "A", "*", Zygosity::HET), metrics).has_value());
    EXPECT_FALSE(annotator.annotate_one(
        call("10", 94800000, "A", ".", Zygosity::HET), metrics).has_value());
}

TEST_F(AnnotatorTest, AnnotatePreservesOrderAndCounts) {
    std::vector<Variant> variants = {
        call("10", 94800000, "A", "G", Zygosity::HET),      // model
        call("1", 5000, "A", "G", Zygosity::HET),           // dropped
        call("22", 42524947, "C", "T", Zygosity::HOM_ALT),  // curated
        call("6", 18130943, "G", "C", Zygosity::HOM_REF),   // skipped
        call("6", 18130918, "C", "T", Zygosity::HET),       // curated
    };
    QualityMetrics metrics;
    auto annotated = annotator.annotate(variants, metrics);

    ASSERT_EQ(annotated.size(), 3u);
    EXPECT_EQ(annotated[0].gene, "CYP2C19");
    EXPECT_EQ(annotated[1].gene, "CYP2D6");
    EXPECT_EQ(annotated[2].gene, "TPMT");
    EXPECT_EQ(metrics.pgx_relevant_hits(), 3u);
    EXPECT_EQ(metrics.curated_matches(), 2u);
    EXPECT_EQ(metrics.ml_predictions_made(), 1u);
    EXPECT_EQ(metrics.unresolved_variants(), 0u);
}

TEST_F(AnnotatorTest, CancelledInferencePropagates) {
    std::atomic<bool> cancel{true};
    QualityMetrics metrics;
    std::vector<Variant> variants = {call("10", 94800000, "A", "G", Zygosity::HET)};
    EXPECT_THROW(annotator.annotate(variants, metrics, &cancel), RequestCancelledError);
}

TEST_F(AnnotatorTest, CuratedMatchIgnoresCancellation) {
    std::atomic<bool> cancel{true};
    QualityMetrics metrics;
    std::vector<Variant> variants = {call("22", 42524947, "C", "T", Zygosity::HET)};
    EXPECT_EQ(annotator.annotate(variants, metrics, &cancel).size(), 1u);
}

TEST_F(AnnotatorTest, FallbackDisabledLeavesUnresolved) {
    VariantAnnotator no_ml(store, nullptr, nullptr, false);
    QualityMetrics metrics;
    auto result = no_ml.annotate_one(call("10", 94800000, "A", "G", Zygosity::HET), metrics);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resolution, Resolution::UNRESOLVED);
    EXPECT_EQ(result->unresolved_reason, "ML fallback disabled");
    EXPECT_FALSE(result->star_allele().has_value());
    EXPECT_FALSE(result->function_class().has_value());
    EXPECT_EQ(metrics.unresolved_variants(), 1u);
    EXPECT_EQ(metrics.pgx_relevant_hits(), 1u);
    EXPECT_EQ(metrics.ml_predictions_made(), 0u);
}

TEST_F(AnnotatorTest, InferenceErrorMarksVariantUnresolved) {
    // Window of 11 fed to a classifier expecting 21
    auto short_encoder =
        std::make_shared<WindowEncoder>(std::make_shared<SyntheticSequenceSource>(), 5);
    VariantAnnotator mismatched(store, short_encoder, model, true);

    std::vector<Variant> variants = {
        call("10", 94800000, "A", "G", Zygosity::HET),
        call("22", 42524947, "C", "T", Zygosity::HET),
    };
    QualityMetrics metrics;
    auto annotated = mismatched.annotate(variants, metrics);

    ASSERT_EQ(annotated.size(), 2u);
    EXPECT_EQ(annotated[0].resolution, Resolution::UNRESOLVED);
    EXPECT_NE(annotated[0].unresolved_reason.find("Inference failed"), std::string::npos);
    EXPECT_EQ(annotated[1].resolution, Resolution::MATCHED);
    EXPECT_EQ(metrics.inference_failures(), 1u);
    EXPECT_EQ(metrics.unresolved_variants(), 1u);
    EXPECT_EQ(metrics.curated_matches(), 1u);
}

TEST(VariantAnnotator, RequiresStore) {
    EXPECT_THROW(VariantAnnotator(nullptr, nullptr, nullptr, false), ConfigError);
}

TEST(VariantAnnotator, FallbackRequiresModel) {
    KnowledgeBase kb = KnowledgeBase::builtin();
    auto store = std::make_shared<ReferenceStore>(kb);
    EXPECT_THROW(VariantAnnotator(store, nullptr, nullptr, true), ConfigError);
}
