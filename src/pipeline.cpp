/**
 * Analysis Pipeline implementation
 */

#include "pipeline.hpp"
#include "errors.hpp"
#include "vcf_loader.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <future>
#include <iomanip>
#include <sstream>

namespace pgx {

const char* const kAdvisoryDisclaimer =
    "Advisory output for research and decision support only. Not a clinical-grade "
    "diagnosis; confirm with a qualified clinician or pharmacist before acting.";

namespace {

void check_cancel(const AnalysisRequest& request) {
    if (request.cancel && request.cancel->load()) {
        throw RequestCancelledError();
    }
}

std::vector<std::string> requested_drugs(const AnalysisRequest& request) {
    std::vector<std::string> drugs;
    for (const auto& drug : request.drugs) {
        if (!normalize_drug_name(drug).empty()) {
            drugs.push_back(drug);
        }
    }
    if (drugs.empty()) {
        throw NoDrugsSpecifiedError();
    }
    return drugs;
}

} // namespace

std::string report_status_to_string(ReportStatus status) {
    switch (status) {
        case ReportStatus::OK: return "ok";
        case ReportStatus::UNSUPPORTED: return "unsupported";
        default: return "unknown";
    }
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc_tm{};
    gmtime_r(&t, &utc_tm);
    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string default_patient_id(const std::string& vcf_path) {
    std::string name = std::filesystem::path(vcf_path).filename().string();
    for (const char* suffix : {".gz", ".vcf"}) {
        std::string s(suffix);
        if (name.size() > s.size() && name.compare(name.size() - s.size(), s.size(), s) == 0) {
            name.erase(name.size() - s.size());
        }
    }
    return "PATIENT_" + (name.empty() ? std::string("UNKNOWN") : name);
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(
    const KnowledgeBase& kb,
    std::shared_ptr<const ModelState> model,
    std::shared_ptr<const SequenceSource> source,
    const PipelineConfig& config
) : config_(config),
    store_(std::make_shared<ReferenceStore>(kb)),
    model_(std::move(model)),
    encoder_(std::make_shared<WindowEncoder>(std::move(source), config.flank_length)),
    annotator_(store_, encoder_, model_, config.ml_fallback),
    assembler_(store_),
    phenotypes_(kb.bands),
    risk_(kb.rules, kb.drug_genes, config.risk) {

    if (!model_) {
        throw ConfigError("pipeline requires a model state");
    }
    config_.validate();
    kb.validate();

    if (config_.ml_fallback &&
        encoder_->window_length() != model_->classifier().config().input_length) {
        throw ConfigError("window length " + std::to_string(encoder_->window_length()) +
                          " does not match classifier input length " +
                          std::to_string(model_->classifier().config().input_length));
    }

    log(LogLevel::INFO, "Pipeline ready: knowledge base " + store_->version() +
        ", model " + model_mode_to_string(model_->mode()) +
        ", sequence source " + encoder_->source().name());
}

DrugReport Pipeline::evaluate_drug(
    const std::string& drug,
    const std::vector<AnnotatedVariant>& annotated
) const {
    DrugReport report;
    report.drug = drug_display_name(drug);
    report.model_mode = model_->mode();

    try {
        std::string gene = risk_.gene_for_drug(drug);
        report.primary_gene = gene;

        GeneDiplotype diplotype = assembler_.assemble(gene, annotated);
        Phenotype phenotype = phenotypes_.map(gene, diplotype.activity_score);
        diplotype.phenotype = phenotype;

        report.risk = risk_.classify(drug, gene, phenotype, diplotype.diplotype(),
                                     diplotype.has_model_derived_allele());
        report.profile = std::move(diplotype);
        report.status = ReportStatus::OK;

        log(LogLevel::INFO, report.drug + ": " + gene + " " + report.risk->diplotype + " " +
            phenotype_code(phenotype) + " -> " + risk_label_to_string(report.risk->label) +
            " (" + severity_to_string(report.risk->severity) + ", confidence " +
            std::to_string(report.risk->confidence) + ")");
    } catch (const UnsupportedGeneError& e) {
        report.status = ReportStatus::UNSUPPORTED;
        report.error = e.what();
        report.profile.reset();
        report.risk.reset();
        log(LogLevel::WARNING, "Unsupported drug " + report.drug + ": " + e.what());
    }

    return report;
}

AnalysisResult Pipeline::run(
    std::vector<Variant> variants,
    QualityMetrics metrics,
    const AnalysisRequest& request,
    const std::string& patient_id
) const {
    const std::atomic<bool>* cancel = request.cancel.get();
    std::vector<std::string> drugs = requested_drugs(request);

    AnalysisResult result;
    result.annotated = annotator_.annotate(variants, metrics, cancel);
    check_cancel(request);

    metrics.set_explanation_status(request.retrieval_success, request.generation_success);

    std::vector<DrugReport> reports;
    reports.reserve(drugs.size());

    if (config_.parallel_drugs && drugs.size() > 1) {
        std::vector<std::future<DrugReport>> futures;
        futures.reserve(drugs.size());
        for (const auto& drug : drugs) {
            futures.push_back(std::async(std::launch::async, [this, &drug, &result, &request]() {
                check_cancel(request);
                return evaluate_drug(drug, result.annotated);
            }));
        }
        // Collected in request order regardless of completion order
        for (auto& future : futures) {
            reports.push_back(future.get());
        }
    } else {
        for (const auto& drug : drugs) {
            check_cancel(request);
            reports.push_back(evaluate_drug(drug, result.annotated));
        }
    }

    const std::string timestamp = request.timestamp.empty() ? utc_timestamp() : request.timestamp;
    for (auto& report : reports) {
        report.patient_id = patient_id;
        report.timestamp = timestamp;
        report.metrics = metrics;
    }

    result.reports = std::move(reports);
    result.metrics = metrics;
    return result;
}

AnalysisResult Pipeline::analyze(std::istream& vcf, const AnalysisRequest& request) const {
    requested_drugs(request);
    check_cancel(request);

    QualityMetrics metrics;
    std::vector<Variant> variants = VCFLoader::parse(vcf, metrics);

    std::string patient_id = request.patient_id.empty() ? "PATIENT_UNKNOWN" : request.patient_id;
    return run(std::move(variants), metrics, request, patient_id);
}

AnalysisResult Pipeline::analyze_file(const std::string& vcf_path,
                                      const AnalysisRequest& request) const {
    requested_drugs(request);
    check_cancel(request);

    QualityMetrics metrics;
    std::vector<Variant> variants = VCFLoader::parse_file(vcf_path, metrics);

    std::string patient_id = request.patient_id.empty() ? default_patient_id(vcf_path)
                                                        : request.patient_id;
    return run(std::move(variants), metrics, request, patient_id);
}

} // namespace pgx
