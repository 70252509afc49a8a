/**
 * Variant Record Loader implementation
 */

#include "vcf_loader.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <functional>
#include <initializer_list>
#include <zlib.h>

namespace pgx {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, delim)) {
        result.push_back(item);
    }
    return result;
}

bool parse_int_strict(const std::string& text, int& value) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<double> parse_optional_double(const std::map<std::string, std::string>& info,
                                            const std::string& key) {
    auto it = info.find(key);
    if (it == info.end() || it->second.empty() || it->second == ".") return std::nullopt;
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int> parse_optional_int(const std::map<std::string, std::string>& info,
                                      const std::string& key) {
    auto it = info.find(key);
    if (it == info.end()) return std::nullopt;
    int value = 0;
    if (!parse_int_strict(it->second, value)) return std::nullopt;
    return value;
}

/**
 * Parse one data line into the records its genotype calls. Returns false for
 * a structurally malformed record.
 *
 * A record yields one Variant per distinct ALT named by the GT, with allele
 * indices renumbered so 1 means that ALT: "2/2" becomes a hom-alt call on the
 * second ALT and "1/2" two heterozygous calls in trans. Hom-ref and no-call
 * records keep the first ALT.
 */
bool parse_record(const std::string& line, int sample_col, std::vector<Variant>& out) {
    auto cols = split(line, '\t');
    if (cols.size() < 8) return false;

    int pos = 0;
    if (!parse_int_strict(cols[1], pos) || pos <= 0) return false;
    if (cols[0].empty() || cols[3].empty() || cols[4].empty()) return false;

    auto alts = split(cols[4], ',');
    if (alts.empty()) return false;
    for (const auto& alt : alts) {
        if (alt.empty()) return false;
    }

    Variant variant;
    variant.chrom = cols[0];
    variant.pos = pos;
    variant.id = cols[2].empty() ? "." : cols[2];
    variant.ref = cols[3];
    variant.alt = alts[0];

    // Genotype
    std::string gt = ".";
    if (cols.size() > 8 && static_cast<int>(cols.size()) > sample_col) {
        auto fmt_fields = split(cols[8], ':');
        auto sample_fields = split(cols[sample_col], ':');
        for (size_t i = 0; i < fmt_fields.size(); ++i) {
            if (fmt_fields[i] == "GT") {
                if (i < sample_fields.size()) gt = sample_fields[i];
                break;
            }
        }
    }

    int a1 = -1, a2 = -1;
    bool phased = false;
    try {
        std::tie(a1, a2, phased) = VCFLoader::parse_genotype(gt);
    } catch (const FormatError&) {
        return false;
    }
    const int num_alts = static_cast<int>(alts.size());
    if (a1 > num_alts || a2 > num_alts) return false;

    variant.gt_raw = gt;
    variant.allele1 = a1;
    variant.allele2 = a2;
    variant.phased = phased;
    variant.zygosity = VCFLoader::zygosity_of(a1, a2);

    // QC fields
    auto info = VCFLoader::parse_info(cols[7]);
    variant.km = parse_optional_double(info, "KM");
    variant.kfp = parse_optional_int(info, "KFP");
    variant.kff = parse_optional_int(info, "KFF");
    auto mtd_it = info.find("MTD");
    if (mtd_it != info.end() && !mtd_it->second.empty()) {
        variant.mtd_methods = split(mtd_it->second, ',');
    }

    if (variant.zygosity == Zygosity::NO_CALL || variant.zygosity == Zygosity::HOM_REF) {
        out.push_back(std::move(variant));
        return true;
    }

    for (int index : {a1, a2}) {
        if (index <= 0) continue;
        Variant called = variant;
        called.alt = alts[index - 1];
        called.allele1 = (a1 == index) ? 1 : 0;
        called.allele2 = (a2 == index) ? 1 : 0;
        called.zygosity = VCFLoader::zygosity_of(called.allele1, called.allele2);
        out.push_back(std::move(called));
        if (a1 == a2) break;
    }

    return true;
}

std::vector<Variant> parse_lines(const std::function<bool(std::string&)>& read_line,
                                 QualityMetrics& metrics) {
    std::string line;
    if (!read_line(line) || !VCFLoader::has_vcf_signature(line)) {
        throw FormatError("missing ##fileformat=VCF header");
    }

    std::vector<Variant> variants;
    int sample_col = 9;
    size_t malformed = 0;
    size_t line_number = 1;

    while (read_line(line)) {
        ++line_number;
        if (line.empty()) continue;

        if (line.compare(0, 2, "##") == 0) continue;

        if (line[0] == '#') {
            // #CHROM header - locate the sample column after FORMAT
            auto cols = split(line.substr(1), '\t');
            for (size_t i = 0; i < cols.size(); ++i) {
                if (cols[i] == "FORMAT") {
                    sample_col = static_cast<int>(i) + 1;
                    break;
                }
            }
            continue;
        }

        if (!parse_record(line, sample_col, variants)) {
            ++malformed;
            log(LogLevel::DEBUG, "Skipping malformed VCF record at line " + std::to_string(line_number));
        }
    }

    metrics.record_malformed(malformed);
    metrics.record_parsed(variants.size());

    if (variants.empty()) {
        throw FormatError(malformed > 0
            ? "no usable records (" + std::to_string(malformed) + " malformed)"
            : "no variant records");
    }

    metrics.mark_parsing_success();

    log(LogLevel::INFO, "Parsed " + std::to_string(variants.size()) + " VCF records" +
        (malformed > 0 ? " (" + std::to_string(malformed) + " malformed skipped)" : ""));

    return variants;
}

} // namespace

bool VCFLoader::has_vcf_signature(const std::string& first_line) {
    return first_line.compare(0, 16, "##fileformat=VCF") == 0;
}

std::tuple<int, int, bool> VCFLoader::parse_genotype(const std::string& gt) {
    bool phased = gt.find('|') != std::string::npos;
    char sep = phased ? '|' : '/';

    auto to_index = [](const std::string& s) -> int {
        if (s.empty() || s == ".") return -1;
        int value = 0;
        if (!parse_int_strict(s, value) || value < 0) {
            throw FormatError("bad genotype allele '" + s + "'");
        }
        return value;
    };

    auto parts = split(gt, sep);
    int a1 = parts.size() > 0 ? to_index(parts[0]) : -1;
    int a2 = parts.size() > 1 ? to_index(parts[1]) : -1;
    return {a1, a2, phased};
}

Zygosity VCFLoader::zygosity_of(int allele1, int allele2) {
    if (allele1 < 0 || allele2 < 0) return Zygosity::NO_CALL;
    if (allele1 == 0 && allele2 == 0) return Zygosity::HOM_REF;
    if (allele1 == allele2) return Zygosity::HOM_ALT;
    return Zygosity::HET;
}

std::map<std::string, std::string> VCFLoader::parse_info(const std::string& info_str) {
    std::map<std::string, std::string> info;
    if (info_str == "." || info_str.empty()) return info;

    std::istringstream iss(info_str);
    std::string item;

    while (std::getline(iss, item, ';')) {
        if (item.empty()) continue;
        size_t eq_pos = item.find('=');
        if (eq_pos != std::string::npos) {
            info[item.substr(0, eq_pos)] = item.substr(eq_pos + 1);
        } else {
            // Flag field (no value)
            info[item] = "1";
        }
    }

    return info;
}

std::vector<Variant> VCFLoader::parse(std::istream& input, QualityMetrics& metrics) {
    auto read_line = [&input](std::string& line) -> bool {
        if (!std::getline(input, line)) return false;
        while (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    };
    return parse_lines(read_line, metrics);
}

std::vector<Variant> VCFLoader::parse_file(const std::string& path, QualityMetrics& metrics) {
    bool is_gzipped = (path.size() > 3 && path.substr(path.size() - 3) == ".gz");

    if (!is_gzipped) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open VCF file: " + path);
        }
        log(LogLevel::INFO, "Reading VCF file: " + path);
        return parse(file, metrics);
    }

    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        throw std::runtime_error("Cannot open gzipped VCF file: " + path);
    }
    log(LogLevel::INFO, "Reading gzipped VCF file: " + path);

    char buffer[65536];
    auto read_line = [&gz, &buffer](std::string& line) -> bool {
        line.clear();
        // Long lines arrive in several gzgets chunks
        while (gzgets(gz, buffer, sizeof(buffer)) != nullptr) {
            line += buffer;
            if (!line.empty() && line.back() == '\n') break;
        }
        if (line.empty()) return false;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        return true;
    };

    try {
        auto variants = parse_lines(read_line, metrics);
        gzclose(gz);
        return variants;
    } catch (...) {
        gzclose(gz);
        throw;
    }
}

} // namespace pgx
