/**
 * Risk Classifier implementation
 */

#include "risk_classifier.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace pgx {

RiskClassifier::RiskClassifier(const std::vector<RiskRule>& rules,
                               const std::map<std::string, std::string>& drug_genes,
                               const RiskPolicy& policy)
    : drug_genes_(drug_genes), policy_(policy) {
    for (const auto& rule : rules) {
        auto key = std::make_tuple(rule.drug, rule.gene, rule.phenotype);
        if (!rules_.emplace(key, rule).second) {
            throw ConfigError("duplicate risk rule for " + rule.drug + "/" + rule.gene + "/" +
                              phenotype_code(rule.phenotype));
        }
    }
}

std::string RiskClassifier::gene_for_drug(const std::string& drug) const {
    auto it = drug_genes_.find(normalize_drug_name(drug));
    if (it == drug_genes_.end()) {
        throw UnsupportedGeneError("", "Drug " + drug_display_name(drug) +
                                   " is not mapped to a supported pharmacogene");
    }
    return it->second;
}

bool RiskClassifier::is_supported_drug(const std::string& drug) const {
    return drug_genes_.count(normalize_drug_name(drug)) > 0;
}

std::vector<std::string> RiskClassifier::supported_drugs() const {
    std::vector<std::string> drugs;
    for (const auto& kv : drug_genes_) {
        drugs.push_back(drug_display_name(kv.first));
    }
    return drugs;
}

Severity RiskClassifier::severity_for(RiskLabel label, double confidence) const {
    switch (label) {
        case RiskLabel::TOXIC:
        case RiskLabel::INEFFECTIVE:
            return confidence >= policy_.critical_confidence ? Severity::CRITICAL : Severity::HIGH;
        case RiskLabel::ADJUST_DOSAGE:
            return Severity::MODERATE;
        case RiskLabel::SAFE:
        default:
            return Severity::LOW;
    }
}

RiskAssessment RiskClassifier::classify(
    const std::string& drug,
    const std::string& gene,
    Phenotype phenotype,
    const std::string& diplotype,
    bool model_derived
) const {
    RiskAssessment assessment;
    assessment.drug = drug_display_name(drug);
    assessment.gene = gene;
    assessment.diplotype = diplotype;
    assessment.phenotype = phenotype;
    assessment.model_derived = model_derived;

    auto it = rules_.find(std::make_tuple(normalize_drug_name(drug), gene, phenotype));
    double confidence;
    if (it == rules_.end()) {
        log(LogLevel::WARNING, "No guideline for " + assessment.drug + " / " + gene + " / " +
            phenotype_to_string(phenotype) + "; reporting Safe with reduced confidence");
        assessment.label = RiskLabel::SAFE;
        assessment.guideline_found = false;
        confidence = policy_.missing_guideline_confidence;
        assessment.recommendation =
            "No guideline is available for " + gene + " / " + assessment.drug + " / " +
            phenotype_to_string(phenotype) + ". Absence of guidance is not evidence of safety; "
            "consult a clinical pharmacist.";
    } else {
        const RiskRule& rule = it->second;
        assessment.label = rule.label;
        assessment.guideline_found = true;
        assessment.guideline_source = rule.guideline_source;
        assessment.recommendation = rule.recommendation;
        confidence = rule.base_confidence;
    }

    if (model_derived) {
        confidence -= policy_.ml_penalty;
    }
    confidence = std::min(1.0, std::max(0.0, confidence));
    assessment.confidence = std::round(confidence * 10000.0) / 10000.0;
    assessment.severity = severity_for(assessment.label, assessment.confidence);

    return assessment;
}

} // namespace pgx
