/**
 * Tests for phenotype.hpp: band lookup, boundary ties and band validation.
 */

#include <gtest/gtest.h>
#include "phenotype.hpp"
#include "errors.hpp"

using namespace pgx;

static PhenotypeBand band(const std::string& gene, Phenotype phenotype,
                          std::optional<double> upper) {
    PhenotypeBand b;
    b.gene = gene;
    b.phenotype = phenotype;
    b.upper = upper;
    return b;
}

class PhenotypeMapperTest : public ::testing::Test {
protected:
    PhenotypeMapper mapper{KnowledgeBase::builtin().bands};
};

TEST_F(PhenotypeMapperTest, Cyp2d6Bands) {
    EXPECT_EQ(mapper.map("CYP2D6", 0.0), Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2D6", 0.25), Phenotype::INTERMEDIATE_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2D6", 1.0), Phenotype::INTERMEDIATE_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2D6", 1.5), Phenotype::NORMAL_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2D6", 2.0), Phenotype::NORMAL_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2D6", 2.25), Phenotype::NORMAL_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2D6", 3.0), Phenotype::ULTRARAPID_METABOLIZER);
}

TEST_F(PhenotypeMapperTest, Cyp2c19Bands) {
    EXPECT_EQ(mapper.map("CYP2C19", 0.0), Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2C19", 1.0), Phenotype::INTERMEDIATE_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2C19", 2.0), Phenotype::NORMAL_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2C19", 2.5), Phenotype::ULTRARAPID_METABOLIZER);
}

TEST_F(PhenotypeMapperTest, TransporterUsesFunctionPhenotypes) {
    EXPECT_EQ(mapper.map("SLCO1B1", 0.0), Phenotype::POOR_FUNCTION);
    EXPECT_EQ(mapper.map("SLCO1B1", 1.0), Phenotype::DECREASED_FUNCTION);
    EXPECT_EQ(mapper.map("SLCO1B1", 2.0), Phenotype::NORMAL_FUNCTION);
}

TEST_F(PhenotypeMapperTest, TpmtHasNoUltraRapidBand) {
    EXPECT_EQ(mapper.map("TPMT", 0.0), Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(mapper.map("TPMT", 1.0), Phenotype::INTERMEDIATE_METABOLIZER);
    EXPECT_EQ(mapper.map("TPMT", 4.0), Phenotype::NORMAL_METABOLIZER);
}

TEST_F(PhenotypeMapperTest, BoundaryTieGoesToLowerBand) {
    EXPECT_EQ(mapper.map("CYP2C9", 0.5), Phenotype::POOR_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2C9", 0.5001), Phenotype::INTERMEDIATE_METABOLIZER);
    EXPECT_EQ(mapper.map("CYP2C9", 1.5), Phenotype::INTERMEDIATE_METABOLIZER);
}

TEST_F(PhenotypeMapperTest, FloatingPointSumsRoundedBeforeComparison) {
    // 0.1 accumulated fifteen times drifts from 1.5
    double score = 0.0;
    for (int i = 0; i < 15; ++i) score += 0.1;
    EXPECT_EQ(mapper.map("CYP2C9", score), Phenotype::INTERMEDIATE_METABOLIZER);
}

TEST_F(PhenotypeMapperTest, UnknownGeneThrows) {
    EXPECT_FALSE(mapper.has_gene("UGT1A1"));
    EXPECT_THROW(mapper.map("UGT1A1", 1.0), UnsupportedGeneError);
    EXPECT_THROW(mapper.bands_for("UGT1A1"), UnsupportedGeneError);
}

TEST_F(PhenotypeMapperTest, BandsForKeepsOrder) {
    ASSERT_TRUE(mapper.has_gene("DPYD"));
    const auto& bands = mapper.bands_for("DPYD");
    ASSERT_EQ(bands.size(), 4u);
    EXPECT_EQ(bands.front().phenotype, Phenotype::POOR_METABOLIZER);
    EXPECT_FALSE(bands.back().upper.has_value());
}

TEST(PhenotypeMapper, RejectsBoundedLastBand) {
    std::vector<PhenotypeBand> bands = {
        band("G", Phenotype::POOR_METABOLIZER, 0.5),
        band("G", Phenotype::NORMAL_METABOLIZER, 2.0),
    };
    EXPECT_THROW(PhenotypeMapper{bands}, ConfigError);
}

TEST(PhenotypeMapper, RejectsUnboundedMiddleBand) {
    std::vector<PhenotypeBand> bands = {
        band("G", Phenotype::POOR_METABOLIZER, std::nullopt),
        band("G", Phenotype::NORMAL_METABOLIZER, std::nullopt),
    };
    EXPECT_THROW(PhenotypeMapper{bands}, ConfigError);
}

TEST(PhenotypeMapper, RejectsNonIncreasingBounds) {
    std::vector<PhenotypeBand> bands = {
        band("G", Phenotype::POOR_METABOLIZER, 1.0),
        band("G", Phenotype::INTERMEDIATE_METABOLIZER, 1.0),
        band("G", Phenotype::NORMAL_METABOLIZER, std::nullopt),
    };
    EXPECT_THROW(PhenotypeMapper{bands}, ConfigError);
}

TEST(PhenotypeMapper, SingleOpenBand) {
    PhenotypeMapper mapper({band("G", Phenotype::NORMAL_FUNCTION, std::nullopt)});
    EXPECT_EQ(mapper.map("G", -1.0), Phenotype::NORMAL_FUNCTION);
    EXPECT_EQ(mapper.map("G", 100.0), Phenotype::NORMAL_FUNCTION);
}
