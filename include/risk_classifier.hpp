/**
 * Risk Classifier
 *
 * Looks up (drug, gene, phenotype) in the decision table and derives the
 * reported confidence and severity:
 *
 *   confidence = rule weight - ml_penalty (if a model-derived allele contributed)
 *   Toxic / Ineffective  -> critical when confidence >= critical_confidence, else high
 *   Adjust Dosage        -> moderate
 *   Safe                 -> low
 *
 * A combination missing from the table is reported as Safe / low with a
 * reduced confidence and guideline_found = false.
 */

#ifndef PGX_RISK_CLASSIFIER_HPP
#define PGX_RISK_CLASSIFIER_HPP

#include "pgx_engine.hpp"
#include "knowledge_base.hpp"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace pgx {

struct RiskPolicy {
    double ml_penalty = 0.15;
    double missing_guideline_confidence = 0.50;
    double critical_confidence = 0.80;
};

struct RiskAssessment {
    std::string drug;               // display name
    std::string gene;
    std::string diplotype;
    Phenotype phenotype = Phenotype::NORMAL_METABOLIZER;
    RiskLabel label = RiskLabel::SAFE;
    Severity severity = Severity::LOW;
    double confidence = 0.0;
    bool guideline_found = false;
    bool model_derived = false;     // confidence carries the ML penalty
    std::string guideline_source;
    std::string recommendation;
};

class RiskClassifier {
public:
    RiskClassifier(const std::vector<RiskRule>& rules,
                   const std::map<std::string, std::string>& drug_genes,
                   const RiskPolicy& policy = RiskPolicy());

    /**
     * Primary gene for a drug (case-insensitive name)
     * @throws UnsupportedGeneError for a drug with no modelled gene
     */
    std::string gene_for_drug(const std::string& drug) const;

    bool is_supported_drug(const std::string& drug) const;

    /**
     * @param model_derived True when any allele of the diplotype was ML-resolved
     */
    RiskAssessment classify(
        const std::string& drug,
        const std::string& gene,
        Phenotype phenotype,
        const std::string& diplotype,
        bool model_derived
    ) const;

    Severity severity_for(RiskLabel label, double confidence) const;

    const RiskPolicy& policy() const { return policy_; }

    std::vector<std::string> supported_drugs() const;

private:
    std::map<std::tuple<std::string, std::string, Phenotype>, RiskRule> rules_;
    std::map<std::string, std::string> drug_genes_;
    RiskPolicy policy_;
};

} // namespace pgx

#endif // PGX_RISK_CLASSIFIER_HPP
