/**
 * Analysis Pipeline
 *
 * Orchestrates one request end to end:
 *   validate drugs -> load VCF -> annotate -> per drug (diplotype ->
 *   phenotype -> risk) -> reports in the caller's drug order
 *
 * Request-fatal errors (FormatError, NoDrugsSpecifiedError,
 * RequestCancelledError) propagate and no reports are returned. An
 * unsupported drug produces a report with status "unsupported" and null
 * assessment fields; other drugs are unaffected.
 *
 * A Pipeline holds only immutable state and can serve concurrent requests.
 */

#ifndef PGX_PIPELINE_HPP
#define PGX_PIPELINE_HPP

#include "pgx_engine.hpp"
#include "annotator.hpp"
#include "diplotype.hpp"
#include "knowledge_base.hpp"
#include "model_state.hpp"
#include "phenotype.hpp"
#include "pipeline_config.hpp"
#include "quality_metrics.hpp"
#include "reference_store.hpp"
#include "risk_classifier.hpp"
#include "sequence_source.hpp"
#include "window_encoder.hpp"
#include <atomic>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgx {

/**
 * Advisory notice carried by every report
 */
extern const char* const kAdvisoryDisclaimer;

struct AnalysisRequest {
    std::string patient_id;                         // empty: derived from the VCF name
    std::vector<std::string> drugs;                 // evaluated and reported in this order
    std::string timestamp;                          // empty: current UTC time
    std::shared_ptr<std::atomic<bool>> cancel;      // optional

    // Explanation collaborator outcome, passed through to the metrics
    bool retrieval_success = false;
    bool generation_success = false;
};

enum class ReportStatus {
    OK,
    UNSUPPORTED
};

std::string report_status_to_string(ReportStatus status);

/**
 * Everything reported for one requested drug
 */
struct DrugReport {
    std::string patient_id;
    std::string drug;                               // display name
    std::string timestamp;
    ReportStatus status = ReportStatus::OK;
    std::string error;

    std::string primary_gene;                       // empty if the drug is unsupported
    std::optional<GeneDiplotype> profile;
    std::optional<RiskAssessment> risk;

    ModelMode model_mode = ModelMode::DEMO;
    QualityMetrics metrics;
};

struct AnalysisResult {
    std::vector<DrugReport> reports;
    std::vector<AnnotatedVariant> annotated;
    QualityMetrics metrics;
};

class Pipeline {
public:
    Pipeline(
        const KnowledgeBase& kb,
        std::shared_ptr<const ModelState> model,
        std::shared_ptr<const SequenceSource> source,
        const PipelineConfig& config = PipelineConfig()
    );

    /**
     * Analyze VCF text from an open stream
     */
    AnalysisResult analyze(std::istream& vcf, const AnalysisRequest& request) const;

    /**
     * Analyze a .vcf / .vcf.gz file. The patient id defaults to
     * PATIENT_<file stem>.
     */
    AnalysisResult analyze_file(const std::string& vcf_path, const AnalysisRequest& request) const;

    /**
     * Evaluate one drug against already-annotated variants
     */
    DrugReport evaluate_drug(
        const std::string& drug,
        const std::vector<AnnotatedVariant>& annotated
    ) const;

    const ReferenceStore& store() const { return *store_; }
    const ModelState& model() const { return *model_; }
    const PipelineConfig& config() const { return config_; }
    const RiskClassifier& risk_classifier() const { return risk_; }
    const std::string& knowledge_base_version() const { return store_->version(); }

private:
    AnalysisResult run(std::vector<Variant> variants, QualityMetrics metrics,
                       const AnalysisRequest& request, const std::string& patient_id) const;

    PipelineConfig config_;
    std::shared_ptr<const ReferenceStore> store_;
    std::shared_ptr<const ModelState> model_;
    std::shared_ptr<const WindowEncoder> encoder_;
    VariantAnnotator annotator_;
    DiplotypeAssembler assembler_;
    PhenotypeMapper phenotypes_;
    RiskClassifier risk_;
};

/**
 * Current time as ISO-8601 UTC ("2024-05-01T12:00:00Z")
 */
std::string utc_timestamp();

/**
 * "PATIENT_<stem>" for "/data/<stem>.vcf.gz"
 */
std::string default_patient_id(const std::string& vcf_path);

} // namespace pgx

#endif // PGX_PIPELINE_HPP
