/**
 * Pharmacogenomic Knowledge Base
 *
 * Versioned tabular data behind the pipeline:
 * - genes.tsv            monitored gene regions, wild-type defaults, combine rule
 * - pgx_variants.tsv     curated star-allele definitions
 * - phenotype_bands.tsv  ordered activity-score bands per gene
 * - drugs.tsv            drug -> primary gene
 * - risk_rules.tsv       (drug, gene, phenotype) -> risk label decision table
 *
 * Built-in tables are compiled into the library; any of the five can be
 * overridden from a directory.
 */

#ifndef PGX_KNOWLEDGE_BASE_HPP
#define PGX_KNOWLEDGE_BASE_HPP

#include "pgx_engine.hpp"
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgx {

/**
 * How two allele contributions combine into a gene activity score
 */
enum class CombineRule {
    SUM,
    PRODUCT
};

std::string combine_rule_to_string(CombineRule rule);
CombineRule parse_combine_rule(const std::string& text);

/**
 * A monitored pharmacogene
 */
struct GeneDefinition {
    std::string symbol;
    std::string chrom;              // normalized
    int start = 0;                  // 1-based, inclusive
    int end = 0;
    std::string default_star = "*1";
    FunctionClass default_function = FunctionClass::NORMAL;
    double default_activity = 1.0;
    CombineRule combine_rule = CombineRule::SUM;

    bool contains(const std::string& norm_chrom, int pos) const {
        return norm_chrom == chrom && pos >= start && pos <= end;
    }
};

/**
 * One phenotype band: scores up to and including `upper` map to `phenotype`.
 * The last band of a gene has no upper bound.
 */
struct PhenotypeBand {
    std::string gene;
    Phenotype phenotype = Phenotype::NORMAL_METABOLIZER;
    std::optional<double> upper;
};

/**
 * One row of the drug-gene-phenotype decision table
 */
struct RiskRule {
    std::string drug;               // canonical upper-case
    std::string gene;
    Phenotype phenotype = Phenotype::NORMAL_METABOLIZER;
    RiskLabel label = RiskLabel::SAFE;
    double base_confidence = 0.0;   // guideline-strength weight
    std::string guideline_source;
    std::string recommendation;
};

struct KnowledgeBase {
    std::string version;
    std::vector<GeneDefinition> genes;
    std::vector<ReferenceEntry> variants;
    std::vector<PhenotypeBand> bands;
    std::map<std::string, std::string> drug_genes;   // drug -> gene
    std::vector<RiskRule> rules;

    /**
     * Tables compiled into the library
     */
    static KnowledgeBase builtin();

    /**
     * Built-in tables with any of the five files found in `dir` replacing
     * their built-in counterpart
     * @throws ConfigError on a malformed table or a missing directory
     */
    static KnowledgeBase load(const std::string& dir);

    /**
     * Cross-table consistency: every variant, band, drug and rule names a
     * defined gene, and every gene has bands.
     * @throws ConfigError
     */
    void validate() const;
};

// ============================================================================
// Table parsers (shared by the built-in text and override files)
// ============================================================================

/**
 * Parse genes.tsv. A "##version=<tag>" line sets `version`.
 */
std::vector<GeneDefinition> parse_genes_table(std::istream& input, std::string& version);
std::vector<ReferenceEntry> parse_variants_table(std::istream& input);
std::vector<PhenotypeBand> parse_bands_table(std::istream& input);
std::map<std::string, std::string> parse_drugs_table(std::istream& input);
std::vector<RiskRule> parse_rules_table(std::istream& input);

// Built-in table text (builtin_tables.cpp)
namespace builtin_tables {
extern const char* const kGenes;
extern const char* const kVariants;
extern const char* const kPhenotypeBands;
extern const char* const kDrugs;
extern const char* const kRiskRules;
} // namespace builtin_tables

} // namespace pgx

#endif // PGX_KNOWLEDGE_BASE_HPP
