/**
 * Report Writer - JSON and TSV output of per-drug reports
 *
 * JSON is always an array of report objects with a fixed shape: every key is
 * present for every drug, with null where a value does not apply (unsupported
 * drug, curated vs model-derived variant).
 */

#ifndef PGX_REPORT_WRITER_HPP
#define PGX_REPORT_WRITER_HPP

#include "pipeline.hpp"
#include "errors.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <zlib.h>

namespace pgx {

/**
 * Output format types
 */
enum class OutputFormat {
    JSON,   // JSON array (default)
    TSV     // one row per drug
};

/**
 * Parse output format from string
 * @throws ConfigError for anything other than json / tsv
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "json") return OutputFormat::JSON;
    if (lower == "tsv") return OutputFormat::TSV;
    throw ConfigError("unknown output format '" + format + "' (expected json or tsv)");
}

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

// Shortest round-trippable form at report precision: 0.97, 2, 0.25
inline std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    return oss.str();
}

inline std::string escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

// JSON value helpers
inline std::string json_string(const std::string& s) {
    return "\"" + escape_json(s) + "\"";
}

inline std::string json_string_or_null(const std::optional<std::string>& s) {
    return s ? json_string(*s) : "null";
}

inline std::string json_number_or_null(const std::optional<double>& v) {
    return v ? format_number(*v) : "null";
}

inline std::string json_bool(bool b) {
    return b ? "true" : "false";
}

/**
 * Abstract base class for report writers
 */
class ReportWriter {
public:
    explicit ReportWriter(const std::string& output_path)
        : output_path_(output_path), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            return;
        }
        if (ends_with_gz(output_path_)) {
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~ReportWriter() {
        close_stream();
    }

    ReportWriter(const ReportWriter&) = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;

    virtual void write_header() = 0;
    virtual void write_report(const DrugReport& report) = 0;
    virtual void write_footer() = 0;

    void write_reports(const std::vector<DrugReport>& reports) {
        for (const auto& report : reports) {
            write_report(report);
        }
    }

    void close() {
        close_stream();
    }

protected:
    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (gz_file_) {
            if (!s.empty() &&
                gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) == 0) {
                throw std::runtime_error("Write failed: " + output_path_);
            }
        } else {
            output_ << s;
        }
    }

private:
    void close_stream() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }

    std::string output_path_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

// ============================================================================
// JSON
// ============================================================================

inline std::string quality_metrics_to_json(const QualityMetrics& m, const std::string& indent) {
    std::ostringstream json;
    json << "{\n";
    json << indent << "  \"vcf_parsing_success\": " << json_bool(m.vcf_parsing_success()) << ",\n";
    json << indent << "  \"total_variants_parsed\": " << m.total_variants_parsed() << ",\n";
    json << indent << "  \"malformed_records\": " << m.malformed_records() << ",\n";
    json << indent << "  \"pgx_relevant_hits\": " << m.pgx_relevant_hits() << ",\n";
    json << indent << "  \"curated_matches\": " << m.curated_matches() << ",\n";
    json << indent << "  \"ml_predictions_made\": " << m.ml_predictions_made() << ",\n";
    json << indent << "  \"unresolved_variants\": " << m.unresolved_variants() << ",\n";
    json << indent << "  \"inference_failures\": " << m.inference_failures() << ",\n";
    json << indent << "  \"retrieval_success\": " << json_bool(m.retrieval_success()) << ",\n";
    json << indent << "  \"generation_success\": " << json_bool(m.generation_success()) << "\n";
    json << indent << "}";
    return json.str();
}

inline std::string detected_variant_to_json(const AnnotatedVariant& av, const std::string& indent) {
    const Variant& v = av.variant;
    std::optional<std::string> function_class;
    if (auto fc = av.function_class()) function_class = function_class_to_string(*fc);

    std::optional<double> ml_confidence;
    std::optional<bool> demo;
    if (av.prediction) {
        ml_confidence = av.prediction->confidence;
        demo = av.prediction->demo_mode;
    }

    std::ostringstream json;
    json << "{\n";
    json << indent << "  \"rsid\": " << json_string(av.rsid()) << ",\n";
    json << indent << "  \"gene\": " << json_string(av.gene) << ",\n";
    json << indent << "  \"chrom\": " << json_string(v.chrom) << ",\n";
    json << indent << "  \"pos\": " << v.pos << ",\n";
    json << indent << "  \"ref\": " << json_string(v.ref) << ",\n";
    json << indent << "  \"alt\": " << json_string(v.alt) << ",\n";
    json << indent << "  \"genotype\": " << json_string(v.gt_raw) << ",\n";
    json << indent << "  \"zygosity\": " << json_string(zygosity_to_string(v.zygosity)) << ",\n";
    json << indent << "  \"resolution\": " << json_string(resolution_to_string(av.resolution)) << ",\n";
    json << indent << "  \"star_allele\": " << json_string_or_null(av.star_allele()) << ",\n";
    json << indent << "  \"function_class\": " << json_string_or_null(function_class) << ",\n";
    json << indent << "  \"activity_score\": " << json_number_or_null(av.activity()) << ",\n";
    json << indent << "  \"ml_confidence\": " << json_number_or_null(ml_confidence) << ",\n";
    json << indent << "  \"demo_mode\": " << (demo ? json_bool(*demo) : "null") << ",\n";
    json << indent << "  \"unresolved_reason\": "
         << (av.unresolved_reason.empty() ? "null" : json_string(av.unresolved_reason)) << ",\n";
    json << indent << "  \"km\": " << json_number_or_null(v.km) << ",\n";
    json << indent << "  \"mtd\": [";
    for (size_t i = 0; i < v.mtd_methods.size(); ++i) {
        if (i > 0) json << ", ";
        json << json_string(v.mtd_methods[i]);
    }
    json << "]\n";
    json << indent << "}";
    return json.str();
}

/**
 * One report as a JSON object (no trailing newline)
 */
inline std::string report_to_json(const DrugReport& r, const std::string& indent = "  ") {
    const std::string in1 = indent + "  ";
    const std::string in2 = in1 + "  ";
    const bool ok = r.status == ReportStatus::OK && r.risk && r.profile;

    std::ostringstream json;
    json << indent << "{\n";
    json << in1 << "\"patient_id\": " << json_string(r.patient_id) << ",\n";
    json << in1 << "\"drug\": " << json_string(r.drug) << ",\n";
    json << in1 << "\"timestamp\": " << json_string(r.timestamp) << ",\n";
    json << in1 << "\"status\": " << json_string(report_status_to_string(r.status)) << ",\n";
    json << in1 << "\"error\": " << (r.error.empty() ? "null" : json_string(r.error)) << ",\n";

    // risk_assessment
    json << in1 << "\"risk_assessment\": {\n";
    if (ok) {
        json << in2 << "\"risk_label\": " << json_string(risk_label_to_string(r.risk->label)) << ",\n";
        json << in2 << "\"confidence_score\": " << format_number(r.risk->confidence) << ",\n";
        json << in2 << "\"severity\": " << json_string(severity_to_string(r.risk->severity)) << ",\n";
        json << in2 << "\"guideline_found\": " << json_bool(r.risk->guideline_found) << ",\n";
        json << in2 << "\"model_derived_evidence\": " << json_bool(r.risk->model_derived) << "\n";
    } else {
        json << in2 << "\"risk_label\": null,\n";
        json << in2 << "\"confidence_score\": null,\n";
        json << in2 << "\"severity\": null,\n";
        json << in2 << "\"guideline_found\": null,\n";
        json << in2 << "\"model_derived_evidence\": null\n";
    }
    json << in1 << "},\n";

    // pharmacogenomic_profile
    json << in1 << "\"pharmacogenomic_profile\": {\n";
    json << in2 << "\"primary_gene\": "
         << (r.primary_gene.empty() ? "null" : json_string(r.primary_gene)) << ",\n";
    if (ok) {
        const GeneDiplotype& p = *r.profile;
        json << in2 << "\"diplotype\": " << json_string(p.diplotype()) << ",\n";
        json << in2 << "\"phenotype\": " << json_string(phenotype_to_string(r.risk->phenotype)) << ",\n";
        json << in2 << "\"phenotype_code\": " << json_string(phenotype_code(r.risk->phenotype)) << ",\n";
        json << in2 << "\"activity_score\": " << format_number(p.activity_score) << ",\n";
        json << in2 << "\"combine_rule\": " << json_string(combine_rule_to_string(p.combine_rule)) << ",\n";
        json << in2 << "\"phased\": " << json_bool(p.phased) << ",\n";
        json << in2 << "\"detected_variants\": [";
        for (size_t i = 0; i < p.variants.size(); ++i) {
            json << (i > 0 ? ",\n" : "\n") << in2 << "  "
                 << detected_variant_to_json(p.variants[i], in2 + "  ");
        }
        json << (p.variants.empty() ? "]\n" : "\n" + in2 + "]\n");
    } else {
        json << in2 << "\"diplotype\": null,\n";
        json << in2 << "\"phenotype\": null,\n";
        json << in2 << "\"phenotype_code\": null,\n";
        json << in2 << "\"activity_score\": null,\n";
        json << in2 << "\"combine_rule\": null,\n";
        json << in2 << "\"phased\": null,\n";
        json << in2 << "\"detected_variants\": []\n";
    }
    json << in1 << "},\n";

    // clinical_recommendation
    json << in1 << "\"clinical_recommendation\": {\n";
    if (ok) {
        json << in2 << "\"text\": " << json_string(r.risk->recommendation) << ",\n";
        json << in2 << "\"guideline_source\": "
             << (r.risk->guideline_source.empty() ? "null" : json_string(r.risk->guideline_source))
             << "\n";
    } else {
        json << in2 << "\"text\": null,\n";
        json << in2 << "\"guideline_source\": null\n";
    }
    json << in1 << "},\n";

    json << in1 << "\"model_mode\": " << json_string(model_mode_to_string(r.model_mode)) << ",\n";
    json << in1 << "\"disclaimer\": " << json_string(kAdvisoryDisclaimer) << ",\n";
    json << in1 << "\"quality_metrics\": " << quality_metrics_to_json(r.metrics, in1) << "\n";
    json << indent << "}";
    return json.str();
}

/**
 * JSON output writer - array of report objects
 */
class JSONWriter : public ReportWriter {
public:
    explicit JSONWriter(const std::string& output_path) : ReportWriter(output_path) {}

    void write_header() override {
        write_string("[");
        first_report_ = true;
    }

    void write_report(const DrugReport& report) override {
        write_string(first_report_ ? "\n" : ",\n");
        write_string(report_to_json(report));
        first_report_ = false;
    }

    void write_footer() override {
        write_string(first_report_ ? "]\n" : "\n]\n");
    }

private:
    bool first_report_ = true;
};

// ============================================================================
// TSV
// ============================================================================

/**
 * TSV output writer - one row per drug, "-" for empty values
 */
class TSVWriter : public ReportWriter {
public:
    explicit TSVWriter(const std::string& output_path) : ReportWriter(output_path) {}

    void write_header() override {
        write_string("#patient_id\tdrug\ttimestamp\tstatus\tgene\tdiplotype\tphenotype\t"
                     "phenotype_code\tactivity_score\trisk_label\tseverity\tconfidence\t"
                     "guideline_found\tmodel_mode\tcurated_variants\tml_variants\t"
                     "unresolved_variants\trecommendation\terror\n");
    }

    void write_report(const DrugReport& r) override {
        const bool ok = r.status == ReportStatus::OK && r.risk && r.profile;

        size_t curated = 0, predicted = 0, unresolved = 0;
        if (ok) {
            for (const auto& av : r.profile->variants) {
                switch (av.resolution) {
                    case Resolution::MATCHED: ++curated; break;
                    case Resolution::ML_RESOLVED: ++predicted; break;
                    case Resolution::UNRESOLVED: ++unresolved; break;
                }
            }
        }

        std::ostringstream line;
        line << field(r.patient_id) << "\t"
             << field(r.drug) << "\t"
             << field(r.timestamp) << "\t"
             << report_status_to_string(r.status) << "\t"
             << field(r.primary_gene) << "\t";
        if (ok) {
            line << field(r.profile->diplotype()) << "\t"
                 << phenotype_to_string(r.risk->phenotype) << "\t"
                 << phenotype_code(r.risk->phenotype) << "\t"
                 << format_number(r.profile->activity_score) << "\t"
                 << risk_label_to_string(r.risk->label) << "\t"
                 << severity_to_string(r.risk->severity) << "\t"
                 << format_number(r.risk->confidence) << "\t"
                 << (r.risk->guideline_found ? "yes" : "no") << "\t";
        } else {
            line << "-\t-\t-\t-\t-\t-\t-\t-\t";
        }
        line << model_mode_to_string(r.model_mode) << "\t"
             << curated << "\t" << predicted << "\t" << unresolved << "\t"
             << field(ok ? r.risk->recommendation : "") << "\t"
             << field(r.error) << "\n";

        write_string(line.str());
    }

    void write_footer() override {}

private:
    static std::string field(const std::string& value) {
        if (value.empty()) return "-";
        std::string clean = value;
        for (char& c : clean) {
            if (c == '\t' || c == '\n' || c == '\r') c = ' ';
        }
        return clean;
    }
};

/**
 * Create a writer for the given format
 * @param output_path File path, or "-" / empty for stdout; ".gz" compresses
 */
inline std::unique_ptr<ReportWriter> create_report_writer(OutputFormat format,
                                                          const std::string& output_path) {
    switch (format) {
        case OutputFormat::TSV:
            return std::make_unique<TSVWriter>(output_path);
        case OutputFormat::JSON:
        default:
            return std::make_unique<JSONWriter>(output_path);
    }
}

} // namespace pgx

#endif // PGX_REPORT_WRITER_HPP
