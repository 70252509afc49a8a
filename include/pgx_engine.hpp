/**
 * pgxrisk - Pharmacogenomic Risk Engine
 *
 * Core data model shared by every stage of the pipeline:
 * variant records, curated reference entries, annotated variants and the
 * enumerations (function class, phenotype, risk label, severity) that the
 * decision tables are keyed on.
 *
 * Outputs of this library are advisory and not a clinical-grade diagnosis.
 */

#ifndef PGX_ENGINE_HPP
#define PGX_ENGINE_HPP

#include <string>
#include <vector>
#include <optional>
#include <array>

namespace pgx {

/**
 * Genotype zygosity of a single VCF record
 */
enum class Zygosity {
    HOM_REF,
    HET,
    HOM_ALT,
    NO_CALL     // missing genotype ("./.")
};

/**
 * Allele function class (PharmVar / CPIC vocabulary)
 *
 * Order is fixed: it is also the output order of the neural classifier.
 */
enum class FunctionClass {
    NORMAL = 0,
    DECREASED = 1,
    INCREASED = 2,
    NO_FUNCTION = 3
};

constexpr size_t kNumFunctionClasses = 4;

/**
 * How an annotated variant was resolved
 */
enum class Resolution {
    MATCHED,        // curated reference table hit
    ML_RESOLVED,    // neural fallback classifier
    UNRESOLVED      // no PGx-relevant call, treated as wild-type
};

/**
 * Metabolizer / transporter phenotype
 */
enum class Phenotype {
    POOR_METABOLIZER,
    INTERMEDIATE_METABOLIZER,
    NORMAL_METABOLIZER,
    RAPID_METABOLIZER,
    ULTRARAPID_METABOLIZER,
    POOR_FUNCTION,
    DECREASED_FUNCTION,
    NORMAL_FUNCTION
};

enum class RiskLabel {
    SAFE,
    ADJUST_DOSAGE,
    TOXIC,
    INEFFECTIVE
};

enum class Severity {
    LOW,
    MODERATE,
    HIGH,
    CRITICAL
};

// String conversions. The parse_* functions throw ConfigError on unknown input.
std::string zygosity_to_string(Zygosity zygosity);
std::string function_class_to_string(FunctionClass fc);
FunctionClass parse_function_class(const std::string& text);
std::string resolution_to_string(Resolution resolution);
std::string phenotype_to_string(Phenotype phenotype);
std::string phenotype_code(Phenotype phenotype);
Phenotype parse_phenotype_code(const std::string& code);
std::string risk_label_to_string(RiskLabel label);
RiskLabel parse_risk_label(const std::string& text);
std::string severity_to_string(Severity severity);

/**
 * Default activity-score contribution of an allele with the given function
 * class (used for model-derived alleles that have no curated score)
 */
double default_activity_for(FunctionClass fc);

/**
 * Normalize chromosome name (remove "chr" prefix for consistency)
 */
inline std::string normalize_chrom(const std::string& chrom) {
    if (chrom.length() > 3 && chrom.compare(0, 3, "chr") == 0) {
        return chrom.substr(3);
    }
    return chrom;
}

/**
 * Canonical upper-case drug key ("codeine " -> "CODEINE")
 */
std::string normalize_drug_name(const std::string& drug);

/**
 * Title-case display name ("CODEINE" -> "Codeine")
 */
std::string drug_display_name(const std::string& drug);

/**
 * A single called variant. Immutable once produced by the loader.
 */
struct Variant {
    std::string chrom;
    int pos = 0;                    // 1-based
    std::string id = ".";           // rsID from the ID column, or "."
    std::string ref;
    std::string alt;                // primary ALT allele

    std::string gt_raw = ".";
    bool phased = false;
    int allele1 = -1;               // GT allele index, -1 = missing
    int allele2 = -1;
    Zygosity zygosity = Zygosity::NO_CALL;

    // QC fields from INFO (Platinum Genomes style)
    std::optional<double> km;
    std::optional<int> kfp;
    std::optional<int> kff;
    std::vector<std::string> mtd_methods;

    std::string key() const {
        return normalize_chrom(chrom) + ":" + std::to_string(pos) + ":" + ref + ":" + alt;
    }
};

/**
 * Curated star-allele definition keyed by (chrom, pos, ref, alt)
 */
struct ReferenceEntry {
    std::string gene;
    std::string chrom;              // normalized
    int pos = 0;
    std::string ref;
    std::string alt;
    std::string star_allele;
    std::string rsid;
    FunctionClass function_class = FunctionClass::NORMAL;
    double activity = 1.0;
    std::string guideline_source;   // e.g. "PharmVar", "CPIC"
};

/**
 * Output of the neural fallback classifier for one window
 */
struct MlPrediction {
    FunctionClass function_class = FunctionClass::NORMAL;
    double confidence = 0.0;
    bool demo_mode = true;
    std::array<double, kNumFunctionClasses> probabilities{};
};

/**
 * A variant inside a monitored gene plus how it was resolved.
 *
 * Exactly one of `entry` (MATCHED) or `prediction` (ML_RESOLVED) is set;
 * UNRESOLVED carries neither.
 */
struct AnnotatedVariant {
    Variant variant;
    std::string gene;
    Resolution resolution = Resolution::UNRESOLVED;
    std::optional<ReferenceEntry> entry;
    std::optional<MlPrediction> prediction;
    std::string unresolved_reason;

    bool is_matched() const { return resolution == Resolution::MATCHED; }
    bool is_model_derived() const { return resolution == Resolution::ML_RESOLVED; }

    /** rsID from the curated entry, then the VCF ID column, else "." */
    std::string rsid() const;

    std::optional<std::string> star_allele() const;
    std::optional<FunctionClass> function_class() const;
    std::optional<double> activity() const;
};

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

} // namespace pgx

#endif // PGX_ENGINE_HPP
