/**
 * Pipeline configuration
 *
 * key=value file, '#' comments:
 *   flank_length                  window flank in bases (window = 2 * flank + 1)
 *   ml_fallback                   true / false
 *   ml_penalty                    confidence penalty for model-derived evidence
 *   missing_guideline_confidence  confidence reported without a guideline row
 *   critical_confidence           Toxic / Ineffective escalation threshold
 *   parallel_drugs                evaluate requested drugs concurrently
 */

#ifndef PGX_PIPELINE_CONFIG_HPP
#define PGX_PIPELINE_CONFIG_HPP

#include "risk_classifier.hpp"
#include "window_encoder.hpp"
#include <istream>
#include <string>

namespace pgx {

struct PipelineConfig {
    int flank_length = kDefaultFlankLength;
    bool ml_fallback = true;
    bool parallel_drugs = true;
    RiskPolicy risk;

    /**
     * @throws ConfigError on an unknown key, unparsable value or a value out of range
     */
    static PipelineConfig parse(std::istream& input);
    static PipelineConfig load_file(const std::string& path);

    /**
     * Apply one key=value setting
     */
    void set(const std::string& key, const std::string& value);

    void validate() const;
};

} // namespace pgx

#endif // PGX_PIPELINE_CONFIG_HPP
