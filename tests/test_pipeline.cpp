/**
 * End-to-end tests for pipeline.hpp: VCF text in, per-drug reports out.
 */

#include <gtest/gtest.h>
#include "pipeline.hpp"
#include "report_writer.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <future>
#include <sstream>

using namespace pgx;
using namespace pgx_test;

namespace {

PipelineConfig small_config() {
    PipelineConfig config;
    config.flank_length = kSmallFlank;
    return config;
}

AnalysisRequest request_for(const std::vector<std::string>& drugs) {
    AnalysisRequest request;
    request.patient_id = "PATIENT_TEST";
    request.drugs = drugs;
    request.timestamp = "2024-05-01T12:00:00Z";
    return request;
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    AnalysisResult run(const std::vector<std::string>& records, const AnalysisRequest& request) const {
        std::istringstream vcf(make_vcf(records));
        return pipeline.analyze(vcf, request);
    }

    KnowledgeBase kb = KnowledgeBase::builtin();
    std::shared_ptr<const ModelState> model = ModelState::create("", small_classifier_config());
    Pipeline pipeline{kb, model, std::make_shared<SyntheticSequenceSource>(), small_config()};
};

// ============================================================================
// Reference scenarios
// ============================================================================

TEST_F(PipelineTest, WarfarinWithoutPharmacogenomicVariants) {
    AnalysisResult result = run({vcf_record("3", 1000000, ".", "A", "G", "0/1")},
                                request_for({"Warfarin"}));
    ASSERT_EQ(result.reports.size(), 1u);
    const DrugReport& r = result.reports[0];
    EXPECT_EQ(r.status, ReportStatus::OK);
    EXPECT_EQ(r.drug, "Warfarin");
    EXPECT_EQ(r.primary_gene, "CYP2C9");
    ASSERT_TRUE(r.profile.has_value());
    ASSERT_TRUE(r.risk.has_value());
    EXPECT_EQ(r.profile->diplotype(), "*1/*1");
    EXPECT_EQ(r.risk->phenotype, Phenotype::NORMAL_METABOLIZER);
    EXPECT_EQ(r.risk->label, RiskLabel::SAFE);
    EXPECT_EQ(r.risk->severity, Severity::LOW);
    EXPECT_DOUBLE_EQ(r.risk->confidence, 0.95);
    EXPECT_TRUE(r.profile->variants.empty());
    EXPECT_EQ(r.metrics.total_variants_parsed(), 1u);
    EXPECT_EQ(r.metrics.pgx_relevant_hits(), 0u);
}

TEST_F(PipelineTest, CodeinePoorMetabolizer) {
    AnalysisResult result = run({vcf_record("chr22", 42524947, "rs3892097", "C", "T", "1/1")},
                                request_for({"CODEINE"}));
    ASSERT_EQ(result.reports.size(), 1u);
    const DrugReport& r = result.reports[0];
    ASSERT_EQ(r.status, ReportStatus::OK);
    EXPECT_EQ(r.drug, "Codeine");
    EXPECT_EQ(r.profile->diplotype(), "*4/*4");
    EXPECT_DOUBLE_EQ(r.profile->activity_score, 0.0);
    EXPECT_EQ(r.risk->phenotype, Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(r.risk->label, RiskLabel::INEFFECTIVE);
    EXPECT_EQ(r.risk->severity, Severity::CRITICAL);
    EXPECT_DOUBLE_EQ(r.risk->confidence, 0.97);
    EXPECT_FALSE(r.risk->model_derived);
    ASSERT_EQ(r.profile->variants.size(), 1u);
    EXPECT_EQ(r.profile->variants[0].rsid(), "rs3892097");
    EXPECT_EQ(r.metrics.curated_matches(), 1u);
}

TEST_F(PipelineTest, HomozygousSecondAltIsCalled) {
    // T is the second ALT of a joint-called site
    AnalysisResult result = run({vcf_record("chr22", 42524947, "rs3892097", "C", "G,T", "2/2")},
                                request_for({"Codeine"}));
    ASSERT_EQ(result.reports.size(), 1u);
    const DrugReport& r = result.reports[0];
    ASSERT_EQ(r.status, ReportStatus::OK);
    EXPECT_EQ(r.profile->diplotype(), "*4/*4");
    EXPECT_EQ(r.risk->phenotype, Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(r.risk->label, RiskLabel::INEFFECTIVE);
    ASSERT_EQ(r.profile->variants.size(), 1u);
    EXPECT_EQ(r.profile->variants[0].variant.alt, "T");
    EXPECT_EQ(r.metrics.pgx_relevant_hits(), 1u);
}

TEST_F(PipelineTest, NovelVariantResolvedByDemoModel) {
    AnalysisResult result = run({vcf_record("10", 94800000, ".", "A", "G", "0/1")},
                                request_for({"Clopidogrel"}));
    ASSERT_EQ(result.reports.size(), 1u);
    const DrugReport& r = result.reports[0];
    ASSERT_EQ(r.status, ReportStatus::OK);
    EXPECT_EQ(r.model_mode, ModelMode::DEMO);
    EXPECT_EQ(r.metrics.ml_predictions_made(), 1u);
    EXPECT_TRUE(r.profile->has_model_derived_allele());
    ASSERT_EQ(r.profile->variants.size(), 1u);
    ASSERT_TRUE(r.profile->variants[0].prediction.has_value());
    EXPECT_LE(r.profile->variants[0].prediction->confidence, kDemoConfidenceCap);
    EXPECT_TRUE(r.risk->model_derived);
    EXPECT_LE(r.risk->confidence, 0.80);
}

TEST_F(PipelineTest, EmptyDrugListRejected) {
    EXPECT_THROW(run({}, request_for({})), NoDrugsSpecifiedError);
    EXPECT_THROW(run({}, request_for({"  ", ""})), NoDrugsSpecifiedError);
}

// ============================================================================
// Request handling
// ============================================================================

TEST_F(PipelineTest, ReportsFollowRequestOrder) {
    AnalysisResult result = run({vcf_record("22", 42524947, ".", "C", "T", "0/1")},
                                request_for({"warfarin", "CODEINE", "Ibuprofen", "clopidogrel"}));
    ASSERT_EQ(result.reports.size(), 4u);
    EXPECT_EQ(result.reports[0].drug, "Warfarin");
    EXPECT_EQ(result.reports[1].drug, "Codeine");
    EXPECT_EQ(result.reports[2].drug, "Ibuprofen");
    EXPECT_EQ(result.reports[3].drug, "Clopidogrel");
    EXPECT_EQ(result.reports[1].profile->diplotype(), "*1/*4");
}

TEST_F(PipelineTest, UnsupportedDrugDoesNotAffectOthers) {
    AnalysisResult result = run({vcf_record("3", 1000000, ".", "A", "G", "0/1")},
                                request_for({"Ibuprofen", "Azathioprine"}));
    ASSERT_EQ(result.reports.size(), 2u);

    const DrugReport& unsupported = result.reports[0];
    EXPECT_EQ(unsupported.status, ReportStatus::UNSUPPORTED);
    EXPECT_TRUE(unsupported.primary_gene.empty());
    EXPECT_FALSE(unsupported.profile.has_value());
    EXPECT_FALSE(unsupported.risk.has_value());
    EXPECT_NE(unsupported.error.find("Ibuprofen"), std::string::npos);

    EXPECT_EQ(result.reports[1].status, ReportStatus::OK);
    EXPECT_EQ(result.reports[1].risk->label, RiskLabel::SAFE);
}

TEST_F(PipelineTest, SharedTimestampPatientAndMetrics) {
    AnalysisRequest request = request_for({"Codeine", "Warfarin"});
    request.retrieval_success = true;
    AnalysisResult result = run({vcf_record("22", 42524947, ".", "C", "T", "0/1")}, request);
    for (const auto& r : result.reports) {
        EXPECT_EQ(r.timestamp, "2024-05-01T12:00:00Z");
        EXPECT_EQ(r.patient_id, "PATIENT_TEST");
        EXPECT_EQ(r.metrics.curated_matches(), 1u);
        EXPECT_TRUE(r.metrics.retrieval_success());
        EXPECT_FALSE(r.metrics.generation_success());
    }
    EXPECT_EQ(result.annotated.size(), 1u);
}

TEST_F(PipelineTest, DefaultPatientIdAndTimestamp) {
    AnalysisRequest request;
    request.drugs = {"Codeine"};
    AnalysisResult result = run({vcf_record("3", 1000000, ".", "A", "G", "0/1")}, request);
    EXPECT_EQ(result.reports[0].patient_id, "PATIENT_UNKNOWN");
    EXPECT_EQ(result.reports[0].timestamp.size(), 20u);
    EXPECT_EQ(result.reports[0].timestamp.back(), 'Z');
}

TEST_F(PipelineTest, PhasedCompoundHeterozygote) {
    AnalysisResult result = run({
        vcf_record("10", 94781859, "rs4244285", "G", "A", "1|0"),
        vcf_record("10", 94780573, "rs4986893", "G", "A", "0|1"),
    }, request_for({"Clopidogrel"}));
    const DrugReport& r = result.reports[0];
    EXPECT_TRUE(r.profile->phased);
    EXPECT_EQ(r.profile->diplotype(), "*2/*3");
    EXPECT_EQ(r.risk->phenotype, Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(r.risk->label, RiskLabel::INEFFECTIVE);
}

TEST_F(PipelineTest, MalformedRecordsCounted) {
    AnalysisResult result = run({
        "22\tnot_a_number\t.\tC\tT\t50\tPASS\t.\tGT\t0/1",
        vcf_record("22", 42524947, ".", "C", "T", "0/1"),
    }, request_for({"Codeine"}));
    EXPECT_EQ(result.metrics.malformed_records(), 1u);
    EXPECT_EQ(result.metrics.total_variants_parsed(), 1u);
    EXPECT_EQ(result.reports[0].profile->diplotype(), "*1/*4");
}

TEST_F(PipelineTest, InvalidVcfRejected) {
    std::istringstream vcf("this is not a vcf\n");
    EXPECT_THROW(pipeline.analyze(vcf, request_for({"Codeine"})), FormatError);
    EXPECT_THROW(run({}, request_for({"Codeine"})), FormatError);
}

TEST_F(PipelineTest, CancelledRequest) {
    AnalysisRequest request = request_for({"Codeine"});
    request.cancel = std::make_shared<std::atomic<bool>>(true);
    EXPECT_THROW(run({}, request), RequestCancelledError);
}

TEST_F(PipelineTest, DeterministicOutput) {
    std::vector<std::string> records = {
        vcf_record("10", 94800000, ".", "A", "G", "0/1"),
        vcf_record("22", 42524947, ".", "C", "T", "0/1"),
    };
    AnalysisRequest request = request_for({"Clopidogrel", "Codeine"});
    AnalysisResult first = run(records, request);
    AnalysisResult second = run(records, request);
    ASSERT_EQ(first.reports.size(), second.reports.size());
    for (size_t i = 0; i < first.reports.size(); ++i) {
        EXPECT_EQ(report_to_json(first.reports[i]), report_to_json(second.reports[i]));
    }
}

TEST_F(PipelineTest, ConcurrentRequestsShareOnePipeline) {
    std::vector<std::string> records = {vcf_record("22", 42524947, ".", "C", "T", "1/1")};
    auto task = [&]() { return run(records, request_for({"Codeine"})); };
    auto a = std::async(std::launch::async, task);
    auto b = std::async(std::launch::async, task);
    AnalysisResult ra = a.get();
    AnalysisResult rb = b.get();
    EXPECT_EQ(report_to_json(ra.reports[0]), report_to_json(rb.reports[0]));
    EXPECT_EQ(ra.reports[0].risk->label, RiskLabel::INEFFECTIVE);
}

TEST_F(PipelineTest, SerialEvaluationMatchesParallel) {
    PipelineConfig config = small_config();
    config.parallel_drugs = false;
    Pipeline serial(kb, model, std::make_shared<SyntheticSequenceSource>(), config);

    std::vector<std::string> records = {vcf_record("6", 18130918, ".", "C", "T", "0/1")};
    AnalysisRequest request = request_for({"Azathioprine", "Fluorouracil", "Simvastatin"});
    AnalysisResult parallel_result = run(records, request);

    std::istringstream vcf(make_vcf(records));
    AnalysisResult serial_result = serial.analyze(vcf, request);
    ASSERT_EQ(serial_result.reports.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(report_to_json(serial_result.reports[i]),
                  report_to_json(parallel_result.reports[i]));
    }
    EXPECT_EQ(serial_result.reports[0].risk->label, RiskLabel::ADJUST_DOSAGE);
}

TEST_F(PipelineTest, AnalyzeFileDerivesPatientId) {
    TempFile file(".vcf");
    file.write(make_vcf({vcf_record("22", 42524947, ".", "C", "T", "0/1")}));
    AnalysisRequest request = request_for({"Codeine"});
    request.patient_id.clear();
    AnalysisResult result = pipeline.analyze_file(file.path(), request);
    EXPECT_EQ(result.reports[0].patient_id.rfind("PATIENT_pgxrisk_test_", 0), 0u);
    EXPECT_EQ(result.reports[0].profile->diplotype(), "*1/*4");
}

TEST(DefaultPatientId, StripsVcfSuffixes) {
    EXPECT_EQ(default_patient_id("/data/sample01.vcf.gz"), "PATIENT_sample01");
    EXPECT_EQ(default_patient_id("sample02.vcf"), "PATIENT_sample02");
    EXPECT_EQ(default_patient_id("/data/raw"), "PATIENT_raw");
}

// ============================================================================
// Construction
// ============================================================================

TEST(PipelineConstruction, FallbackDisabledLeavesNovelVariantUnresolved) {
    PipelineConfig config = small_config();
    config.ml_fallback = false;
    Pipeline pipeline(KnowledgeBase::builtin(), ModelState::create("", small_classifier_config()),
                      std::make_shared<SyntheticSequenceSource>(), config);

    std::istringstream vcf(make_vcf({vcf_record("10", 94800000, ".", "A", "G", "1/1")}));
    AnalysisResult result = pipeline.analyze(vcf, request_for({"Clopidogrel"}));
    const DrugReport& r = result.reports[0];
    EXPECT_EQ(r.profile->diplotype(), "*1/*1");
    EXPECT_EQ(r.metrics.unresolved_variants(), 1u);
    EXPECT_EQ(r.metrics.ml_predictions_made(), 0u);
    EXPECT_FALSE(r.risk->model_derived);
}

TEST(PipelineConstruction, WindowMustMatchClassifier) {
    PipelineConfig config;      // flank 50 -> window 101
    EXPECT_THROW(Pipeline(KnowledgeBase::builtin(),
                          ModelState::create("", small_classifier_config()),
                          std::make_shared<SyntheticSequenceSource>(), config),
                 ConfigError);

    config.ml_fallback = false;
    EXPECT_NO_THROW(Pipeline(KnowledgeBase::builtin(),
                             ModelState::create("", small_classifier_config()),
                             std::make_shared<SyntheticSequenceSource>(), config));
}

TEST(PipelineConstruction, RequiresModel) {
    EXPECT_THROW(Pipeline(KnowledgeBase::builtin(), nullptr,
                          std::make_shared<SyntheticSequenceSource>(), small_config()),
                 ConfigError);
}
