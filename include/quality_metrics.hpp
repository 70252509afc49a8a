/**
 * Quality / Provenance Tracker
 *
 * Per-request counters observed by every pipeline stage. Counters only
 * grow; there is no way to decrement or reset one within a request.
 */

#ifndef PGX_QUALITY_METRICS_HPP
#define PGX_QUALITY_METRICS_HPP

#include <cstddef>
#include <string>
#include <sstream>

namespace pgx {

class QualityMetrics {
public:
    // Loader
    void record_parsed(size_t count = 1) { total_variants_parsed_ += count; }
    void record_malformed(size_t count = 1) { malformed_records_ += count; }
    void mark_parsing_success() { vcf_parsing_success_ = true; }

    // Annotator
    void record_curated_match() { ++pgx_relevant_hits_; ++curated_matches_; }
    void record_model_prediction() { ++pgx_relevant_hits_; ++ml_predictions_made_; }
    void record_unresolved() { ++pgx_relevant_hits_; ++unresolved_variants_; }
    void record_inference_failure() { ++inference_failures_; }

    // Explanation collaborator flags, passed through at response assembly
    void set_explanation_status(bool retrieval_success, bool generation_success) {
        retrieval_success_ = retrieval_success;
        generation_success_ = generation_success;
    }

    size_t total_variants_parsed() const { return total_variants_parsed_; }
    size_t malformed_records() const { return malformed_records_; }
    size_t pgx_relevant_hits() const { return pgx_relevant_hits_; }
    size_t curated_matches() const { return curated_matches_; }
    size_t ml_predictions_made() const { return ml_predictions_made_; }
    size_t unresolved_variants() const { return unresolved_variants_; }
    size_t inference_failures() const { return inference_failures_; }
    bool vcf_parsing_success() const { return vcf_parsing_success_; }
    bool retrieval_success() const { return retrieval_success_; }
    bool generation_success() const { return generation_success_; }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "=== Quality Metrics ===\n";
        oss << "VCF parsing success: " << (vcf_parsing_success_ ? "yes" : "no") << "\n";
        oss << "Total variants parsed: " << total_variants_parsed_ << "\n";
        oss << "Malformed records skipped: " << malformed_records_ << "\n";
        oss << "PGx-relevant variants: " << pgx_relevant_hits_ << "\n";
        oss << "  curated matches: " << curated_matches_ << "\n";
        oss << "  ML predictions: " << ml_predictions_made_ << "\n";
        oss << "  unresolved: " << unresolved_variants_ << "\n";
        oss << "Inference failures: " << inference_failures_ << "\n";
        return oss.str();
    }

private:
    size_t total_variants_parsed_ = 0;
    size_t malformed_records_ = 0;
    size_t pgx_relevant_hits_ = 0;
    size_t curated_matches_ = 0;
    size_t ml_predictions_made_ = 0;
    size_t unresolved_variants_ = 0;
    size_t inference_failures_ = 0;
    bool vcf_parsing_success_ = false;
    bool retrieval_success_ = false;
    bool generation_success_ = false;
};

} // namespace pgx

#endif // PGX_QUALITY_METRICS_HPP
