/**
 * Pipeline configuration parsing
 */

#include "pipeline_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace pgx {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

double to_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed == value.size()) return result;
    } catch (const std::exception&) {
    }
    throw ConfigError(key + " expects a number, got '" + value + "'");
}

int to_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed == value.size()) return result;
    } catch (const std::exception&) {
    }
    throw ConfigError(key + " expects an integer, got '" + value + "'");
}

bool to_bool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
    throw ConfigError(key + " expects true or false, got '" + value + "'");
}

} // namespace

void PipelineConfig::set(const std::string& key, const std::string& value) {
    if (key == "flank_length") {
        flank_length = to_int(key, value);
    } else if (key == "ml_fallback") {
        ml_fallback = to_bool(key, value);
    } else if (key == "parallel_drugs") {
        parallel_drugs = to_bool(key, value);
    } else if (key == "ml_penalty") {
        risk.ml_penalty = to_double(key, value);
    } else if (key == "missing_guideline_confidence") {
        risk.missing_guideline_confidence = to_double(key, value);
    } else if (key == "critical_confidence") {
        risk.critical_confidence = to_double(key, value);
    } else {
        throw ConfigError("unknown setting '" + key + "'");
    }
}

void PipelineConfig::validate() const {
    if (flank_length < 1) {
        throw ConfigError("flank_length must be at least 1");
    }
    auto check_unit = [](const std::string& key, double value) {
        if (value < 0.0 || value > 1.0) {
            throw ConfigError(key + " must lie in [0, 1]");
        }
    };
    check_unit("ml_penalty", risk.ml_penalty);
    check_unit("missing_guideline_confidence", risk.missing_guideline_confidence);
    check_unit("critical_confidence", risk.critical_confidence);
}

PipelineConfig PipelineConfig::parse(std::istream& input) {
    PipelineConfig config;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("line " + std::to_string(line_number) + ": expected key=value");
        }
        config.set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }

    config.validate();
    return config;
}

PipelineConfig PipelineConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    log(LogLevel::INFO, "Loading pipeline configuration: " + path);
    return parse(file);
}

} // namespace pgx
