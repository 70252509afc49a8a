/**
 * pgxrisk - core type utilities and logging
 */

#include "pgx_engine.hpp"
#include "errors.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>

namespace pgx {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);
    std::cerr << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// Enum utilities
// ============================================================================

static std::string to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string zygosity_to_string(Zygosity zygosity) {
    switch (zygosity) {
        case Zygosity::HOM_REF: return "hom_ref";
        case Zygosity::HET: return "het";
        case Zygosity::HOM_ALT: return "hom_alt";
        case Zygosity::NO_CALL: return "missing";
        default: return "unknown";
    }
}

std::string function_class_to_string(FunctionClass fc) {
    switch (fc) {
        case FunctionClass::NORMAL: return "normal_function";
        case FunctionClass::DECREASED: return "decreased_function";
        case FunctionClass::INCREASED: return "increased_function";
        case FunctionClass::NO_FUNCTION: return "no_function";
        default: return "unknown";
    }
}

FunctionClass parse_function_class(const std::string& text) {
    std::string lower = to_lower(trim(text));
    if (lower == "normal" || lower == "normal_function") return FunctionClass::NORMAL;
    if (lower == "decreased" || lower == "decreased_function") return FunctionClass::DECREASED;
    if (lower == "increased" || lower == "increased_function") return FunctionClass::INCREASED;
    if (lower == "no_function" || lower == "none") return FunctionClass::NO_FUNCTION;
    throw ConfigError("unknown function class '" + text + "'");
}

std::string resolution_to_string(Resolution resolution) {
    switch (resolution) {
        case Resolution::MATCHED: return "curated";
        case Resolution::ML_RESOLVED: return "ml_predicted";
        case Resolution::UNRESOLVED: return "unresolved";
        default: return "unknown";
    }
}

std::string phenotype_to_string(Phenotype phenotype) {
    switch (phenotype) {
        case Phenotype::POOR_METABOLIZER: return "Poor Metabolizer";
        case Phenotype::INTERMEDIATE_METABOLIZER: return "Intermediate Metabolizer";
        case Phenotype::NORMAL_METABOLIZER: return "Normal Metabolizer";
        case Phenotype::RAPID_METABOLIZER: return "Rapid Metabolizer";
        case Phenotype::ULTRARAPID_METABOLIZER: return "Ultra-Rapid Metabolizer";
        case Phenotype::POOR_FUNCTION: return "Poor Function";
        case Phenotype::DECREASED_FUNCTION: return "Decreased Function";
        case Phenotype::NORMAL_FUNCTION: return "Normal Function";
        default: return "Unknown";
    }
}

std::string phenotype_code(Phenotype phenotype) {
    switch (phenotype) {
        case Phenotype::POOR_METABOLIZER: return "PM";
        case Phenotype::INTERMEDIATE_METABOLIZER: return "IM";
        case Phenotype::NORMAL_METABOLIZER: return "NM";
        case Phenotype::RAPID_METABOLIZER: return "RM";
        case Phenotype::ULTRARAPID_METABOLIZER: return "UM";
        case Phenotype::POOR_FUNCTION: return "PF";
        case Phenotype::DECREASED_FUNCTION: return "DF";
        case Phenotype::NORMAL_FUNCTION: return "NF";
        default: return "??";
    }
}

Phenotype parse_phenotype_code(const std::string& code) {
    std::string upper = trim(code);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "PM") return Phenotype::POOR_METABOLIZER;
    if (upper == "IM") return Phenotype::INTERMEDIATE_METABOLIZER;
    if (upper == "NM") return Phenotype::NORMAL_METABOLIZER;
    if (upper == "RM") return Phenotype::RAPID_METABOLIZER;
    if (upper == "UM") return Phenotype::ULTRARAPID_METABOLIZER;
    if (upper == "PF") return Phenotype::POOR_FUNCTION;
    if (upper == "DF") return Phenotype::DECREASED_FUNCTION;
    if (upper == "NF") return Phenotype::NORMAL_FUNCTION;
    throw ConfigError("unknown phenotype code '" + code + "'");
}

std::string risk_label_to_string(RiskLabel label) {
    switch (label) {
        case RiskLabel::SAFE: return "Safe";
        case RiskLabel::ADJUST_DOSAGE: return "Adjust Dosage";
        case RiskLabel::TOXIC: return "Toxic";
        case RiskLabel::INEFFECTIVE: return "Ineffective";
        default: return "Unknown";
    }
}

RiskLabel parse_risk_label(const std::string& text) {
    std::string lower = to_lower(trim(text));
    if (lower == "safe") return RiskLabel::SAFE;
    if (lower == "adjust dosage" || lower == "adjust_dosage") return RiskLabel::ADJUST_DOSAGE;
    if (lower == "toxic") return RiskLabel::TOXIC;
    if (lower == "ineffective") return RiskLabel::INEFFECTIVE;
    throw ConfigError("unknown risk label '" + text + "'");
}

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MODERATE: return "moderate";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

double default_activity_for(FunctionClass fc) {
    switch (fc) {
        case FunctionClass::NO_FUNCTION: return 0.0;
        case FunctionClass::DECREASED: return 0.5;
        case FunctionClass::NORMAL: return 1.0;
        case FunctionClass::INCREASED: return 1.5;
        default: return 1.0;
    }
}

std::string normalize_drug_name(const std::string& drug) {
    std::string upper = trim(drug);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::string drug_display_name(const std::string& drug) {
    std::string display = to_lower(trim(drug));
    bool word_start = true;
    for (char& c : display) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            if (word_start) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return display;
}

// ============================================================================
// AnnotatedVariant accessors
// ============================================================================

std::string AnnotatedVariant::rsid() const {
    if (entry && !entry->rsid.empty() && entry->rsid != ".") return entry->rsid;
    if (!variant.id.empty()) return variant.id;
    return ".";
}

std::optional<std::string> AnnotatedVariant::star_allele() const {
    if (entry) return entry->star_allele;
    return std::nullopt;
}

std::optional<FunctionClass> AnnotatedVariant::function_class() const {
    if (entry) return entry->function_class;
    if (prediction) return prediction->function_class;
    return std::nullopt;
}

std::optional<double> AnnotatedVariant::activity() const {
    if (entry) return entry->activity;
    if (prediction) return default_activity_for(prediction->function_class);
    return std::nullopt;
}

} // namespace pgx
