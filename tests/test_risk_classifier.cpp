/**
 * Tests for risk_classifier.hpp: decision table lookup, confidence policy,
 * severity derivation and drug mapping.
 */

#include <gtest/gtest.h>
#include "risk_classifier.hpp"
#include "errors.hpp"

using namespace pgx;

class RiskClassifierTest : public ::testing::Test {
protected:
    KnowledgeBase kb = KnowledgeBase::builtin();
    RiskClassifier classifier{kb.rules, kb.drug_genes};
};

// ============================================================================
// Decision table
// ============================================================================

TEST_F(RiskClassifierTest, CodeinePoorMetabolizerIneffective) {
    RiskAssessment r = classifier.classify("CODEINE", "CYP2D6",
                                           Phenotype::POOR_METABOLIZER, "*4/*4", false);
    EXPECT_EQ(r.drug, "Codeine");
    EXPECT_EQ(r.gene, "CYP2D6");
    EXPECT_EQ(r.diplotype, "*4/*4");
    EXPECT_EQ(r.label, RiskLabel::INEFFECTIVE);
    EXPECT_EQ(r.severity, Severity::CRITICAL);
    EXPECT_DOUBLE_EQ(r.confidence, 0.97);
    EXPECT_TRUE(r.guideline_found);
    EXPECT_FALSE(r.model_derived);
    EXPECT_EQ(r.guideline_source, "CPIC");
    EXPECT_FALSE(r.recommendation.empty());
}

TEST_F(RiskClassifierTest, CodeineUltrarapidToxic) {
    RiskAssessment r = classifier.classify("codeine", "CYP2D6",
                                           Phenotype::ULTRARAPID_METABOLIZER, "*1/*1xN", false);
    EXPECT_EQ(r.label, RiskLabel::TOXIC);
    EXPECT_EQ(r.severity, Severity::CRITICAL);
}

TEST_F(RiskClassifierTest, WarfarinNormalSafe) {
    RiskAssessment r = classifier.classify("Warfarin", "CYP2C9",
                                           Phenotype::NORMAL_METABOLIZER, "*1/*1", false);
    EXPECT_EQ(r.label, RiskLabel::SAFE);
    EXPECT_EQ(r.severity, Severity::LOW);
    EXPECT_DOUBLE_EQ(r.confidence, 0.95);
}

TEST_F(RiskClassifierTest, AdjustDosageIsModerate) {
    RiskAssessment r = classifier.classify("AZATHIOPRINE", "TPMT",
                                           Phenotype::INTERMEDIATE_METABOLIZER, "*1/*3B", false);
    EXPECT_EQ(r.label, RiskLabel::ADJUST_DOSAGE);
    EXPECT_EQ(r.severity, Severity::MODERATE);
}

TEST_F(RiskClassifierTest, SimvastatinTransporterPhenotypes) {
    EXPECT_EQ(classifier.classify("SIMVASTATIN", "SLCO1B1", Phenotype::POOR_FUNCTION,
                                  "*5/*5", false).label, RiskLabel::TOXIC);
    EXPECT_EQ(classifier.classify("SIMVASTATIN", "SLCO1B1", Phenotype::NORMAL_FUNCTION,
                                  "*1a/*1a", false).label, RiskLabel::SAFE);
}

TEST_F(RiskClassifierTest, MissingGuidelineIsSafeWithReducedConfidence) {
    RiskAssessment r = classifier.classify("FLUOROURACIL", "DPYD",
                                           Phenotype::ULTRARAPID_METABOLIZER, "*1/*1", false);
    EXPECT_EQ(r.label, RiskLabel::SAFE);
    EXPECT_EQ(r.severity, Severity::LOW);
    EXPECT_FALSE(r.guideline_found);
    EXPECT_DOUBLE_EQ(r.confidence, 0.50);
    EXPECT_TRUE(r.guideline_source.empty());
    EXPECT_EQ(r.recommendation.rfind("No guideline is available", 0), 0u);
}

// ============================================================================
// Confidence policy
// ============================================================================

TEST_F(RiskClassifierTest, ModelEvidenceLowersConfidence) {
    RiskAssessment curated = classifier.classify("CLOPIDOGREL", "CYP2C19",
                                                 Phenotype::INTERMEDIATE_METABOLIZER, "*1/*2", false);
    RiskAssessment model = classifier.classify("CLOPIDOGREL", "CYP2C19",
                                               Phenotype::INTERMEDIATE_METABOLIZER, "*1/novel", true);
    EXPECT_LT(model.confidence, curated.confidence);
    EXPECT_DOUBLE_EQ(model.confidence, 0.73);
    EXPECT_TRUE(model.model_derived);
    EXPECT_EQ(model.label, curated.label);
}

TEST_F(RiskClassifierTest, ModelEvidenceCanDropSeverity) {
    RiskAssessment curated = classifier.classify("CLOPIDOGREL", "CYP2C19",
                                                 Phenotype::INTERMEDIATE_METABOLIZER, "*1/*2", false);
    RiskAssessment model = classifier.classify("CLOPIDOGREL", "CYP2C19",
                                               Phenotype::INTERMEDIATE_METABOLIZER, "*1/novel", true);
    EXPECT_EQ(curated.severity, Severity::CRITICAL);
    EXPECT_EQ(model.severity, Severity::HIGH);
}

TEST_F(RiskClassifierTest, MissingGuidelineWithModelEvidence) {
    RiskAssessment r = classifier.classify("FLUOROURACIL", "DPYD",
                                           Phenotype::ULTRARAPID_METABOLIZER, "*1/novel", true);
    EXPECT_DOUBLE_EQ(r.confidence, 0.35);
}

TEST(RiskClassifier, ConfidenceClampedToUnitInterval) {
    RiskRule rule;
    rule.drug = "TESTDRUG";
    rule.gene = "G";
    rule.phenotype = Phenotype::POOR_METABOLIZER;
    rule.label = RiskLabel::TOXIC;
    rule.base_confidence = 0.10;

    RiskPolicy policy;
    policy.ml_penalty = 0.5;
    RiskClassifier classifier({rule}, {{"TESTDRUG", "G"}}, policy);

    RiskAssessment r = classifier.classify("TESTDRUG", "G", Phenotype::POOR_METABOLIZER, "*1/novel", true);
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_EQ(r.severity, Severity::HIGH);
}

TEST(RiskClassifier, CustomCriticalThreshold) {
    KnowledgeBase kb = KnowledgeBase::builtin();
    RiskPolicy policy;
    policy.critical_confidence = 0.99;
    RiskClassifier classifier(kb.rules, kb.drug_genes, policy);
    EXPECT_EQ(classifier.severity_for(RiskLabel::TOXIC, 0.98), Severity::HIGH);
    EXPECT_EQ(classifier.severity_for(RiskLabel::TOXIC, 0.99), Severity::CRITICAL);
    EXPECT_DOUBLE_EQ(classifier.policy().critical_confidence, 0.99);
}

TEST_F(RiskClassifierTest, SeverityForEachLabel) {
    EXPECT_EQ(classifier.severity_for(RiskLabel::SAFE, 1.0), Severity::LOW);
    EXPECT_EQ(classifier.severity_for(RiskLabel::ADJUST_DOSAGE, 1.0), Severity::MODERATE);
    EXPECT_EQ(classifier.severity_for(RiskLabel::INEFFECTIVE, 0.79), Severity::HIGH);
    EXPECT_EQ(classifier.severity_for(RiskLabel::INEFFECTIVE, 0.80), Severity::CRITICAL);
}

TEST(RiskClassifier, DuplicateRuleRejected) {
    RiskRule rule;
    rule.drug = "TESTDRUG";
    rule.gene = "G";
    rule.phenotype = Phenotype::NORMAL_METABOLIZER;
    EXPECT_THROW(RiskClassifier({rule, rule}, {}), ConfigError);
}

// ============================================================================
// Drug mapping
// ============================================================================

TEST_F(RiskClassifierTest, GeneForDrugCaseInsensitive) {
    EXPECT_EQ(classifier.gene_for_drug("codeine"), "CYP2D6");
    EXPECT_EQ(classifier.gene_for_drug(" Clopidogrel "), "CYP2C19");
    EXPECT_EQ(classifier.gene_for_drug("FLUOROURACIL"), "DPYD");
    EXPECT_TRUE(classifier.is_supported_drug("warfarin"));
}

TEST_F(RiskClassifierTest, UnsupportedDrug) {
    EXPECT_FALSE(classifier.is_supported_drug("ibuprofen"));
    try {
        classifier.gene_for_drug("ibuprofen");
        FAIL() << "expected UnsupportedGeneError";
    } catch (const UnsupportedGeneError& e) {
        EXPECT_NE(std::string(e.what()).find("Ibuprofen"), std::string::npos);
    }
}

TEST_F(RiskClassifierTest, SupportedDrugsDisplayNames) {
    std::vector<std::string> drugs = classifier.supported_drugs();
    ASSERT_EQ(drugs.size(), 6u);
    EXPECT_EQ(drugs.front(), "Azathioprine");
    EXPECT_EQ(drugs.back(), "Warfarin");
}
