/**
 * Knowledge base table loading
 */

#include "knowledge_base.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace pgx {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/**
 * Iterates the data rows of a table, skipping blank and '#' lines.
 * Rows with fewer than `min_fields` columns are a ConfigError.
 */
class TableReader {
public:
    TableReader(std::istream& input, const std::string& table, size_t min_fields)
        : input_(input), table_(table), min_fields_(min_fields) {}

    bool next(std::vector<std::string>& fields) {
        std::string line;
        while (std::getline(input_, line)) {
            ++line_number_;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) continue;
            if (line[0] == '#') {
                comments_.push_back(line);
                continue;
            }
            fields = split_tabs(line);
            for (auto& f : fields) f = trim(f);
            if (fields.size() < min_fields_) {
                fail("expected " + std::to_string(min_fields_) + " columns, found " +
                     std::to_string(fields.size()));
            }
            return true;
        }
        return false;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ConfigError(table_ + " line " + std::to_string(line_number_) + ": " + message);
    }

    int to_int(const std::string& text) const {
        try {
            size_t consumed = 0;
            int value = std::stoi(text, &consumed);
            if (consumed == text.size()) return value;
        } catch (const std::exception&) {
        }
        fail("not an integer: '" + text + "'");
    }

    double to_double(const std::string& text) const {
        try {
            size_t consumed = 0;
            double value = std::stod(text, &consumed);
            if (consumed == text.size()) return value;
        } catch (const std::exception&) {
        }
        fail("not a number: '" + text + "'");
    }

    // Enum parsers throw ConfigError without position; add it
    template <typename F>
    auto with_context(F&& parse) const -> decltype(parse()) {
        try {
            return parse();
        } catch (const ConfigError& e) {
            fail(e.what());
        }
    }

    const std::vector<std::string>& comments() const { return comments_; }

private:
    std::istream& input_;
    std::string table_;
    size_t min_fields_;
    size_t line_number_ = 0;
    std::vector<std::string> comments_;
};

std::string upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

// ============================================================================
// Combine rule
// ============================================================================

std::string combine_rule_to_string(CombineRule rule) {
    switch (rule) {
        case CombineRule::SUM: return "sum";
        case CombineRule::PRODUCT: return "product";
        default: return "unknown";
    }
}

CombineRule parse_combine_rule(const std::string& text) {
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sum") return CombineRule::SUM;
    if (lower == "product") return CombineRule::PRODUCT;
    throw ConfigError("unknown combine rule '" + text + "'");
}

// ============================================================================
// Table parsers
// ============================================================================

std::vector<GeneDefinition> parse_genes_table(std::istream& input, std::string& version) {
    TableReader reader(input, "genes.tsv", 8);
    std::vector<GeneDefinition> genes;
    std::vector<std::string> f;

    while (reader.next(f)) {
        GeneDefinition gene;
        gene.symbol = upper(f[0]);
        gene.chrom = normalize_chrom(f[1]);
        gene.start = reader.to_int(f[2]);
        gene.end = reader.to_int(f[3]);
        if (gene.start <= 0 || gene.end < gene.start) {
            reader.fail("invalid region " + f[2] + "-" + f[3]);
        }
        gene.default_star = f[4];
        gene.default_function = reader.with_context([&] { return parse_function_class(f[5]); });
        gene.default_activity = reader.to_double(f[6]);
        gene.combine_rule = reader.with_context([&] { return parse_combine_rule(f[7]); });
        genes.push_back(gene);
    }

    for (const auto& line : reader.comments()) {
        if (line.compare(0, 10, "##version=") == 0) {
            version = trim(line.substr(10));
        }
    }
    return genes;
}

std::vector<ReferenceEntry> parse_variants_table(std::istream& input) {
    TableReader reader(input, "pgx_variants.tsv", 9);
    std::vector<ReferenceEntry> entries;
    std::vector<std::string> f;

    while (reader.next(f)) {
        ReferenceEntry entry;
        entry.gene = upper(f[0]);
        entry.chrom = normalize_chrom(f[1]);
        entry.pos = reader.to_int(f[2]);
        entry.ref = f[3];
        entry.alt = f[4];
        entry.star_allele = f[5];
        entry.rsid = f[6].empty() ? "." : f[6];
        entry.function_class = reader.with_context([&] { return parse_function_class(f[7]); });
        entry.activity = reader.to_double(f[8]);
        entry.guideline_source = f.size() > 9 ? f[9] : "";
        if (entry.ref.empty() || entry.alt.empty()) {
            reader.fail("empty ref or alt");
        }
        entries.push_back(entry);
    }
    return entries;
}

std::vector<PhenotypeBand> parse_bands_table(std::istream& input) {
    TableReader reader(input, "phenotype_bands.tsv", 3);
    std::vector<PhenotypeBand> bands;
    std::vector<std::string> f;

    while (reader.next(f)) {
        PhenotypeBand band;
        band.gene = upper(f[0]);
        band.phenotype = reader.with_context([&] { return parse_phenotype_code(f[1]); });
        if (f[2] != "-" && !f[2].empty()) {
            band.upper = reader.to_double(f[2]);
        }
        bands.push_back(band);
    }
    return bands;
}

std::map<std::string, std::string> parse_drugs_table(std::istream& input) {
    TableReader reader(input, "drugs.tsv", 2);
    std::map<std::string, std::string> drugs;
    std::vector<std::string> f;

    while (reader.next(f)) {
        drugs[normalize_drug_name(f[0])] = upper(f[1]);
    }
    return drugs;
}

std::vector<RiskRule> parse_rules_table(std::istream& input) {
    TableReader reader(input, "risk_rules.tsv", 5);
    std::vector<RiskRule> rules;
    std::vector<std::string> f;

    while (reader.next(f)) {
        RiskRule rule;
        rule.drug = normalize_drug_name(f[0]);
        rule.gene = upper(f[1]);
        rule.phenotype = reader.with_context([&] { return parse_phenotype_code(f[2]); });
        rule.label = reader.with_context([&] { return parse_risk_label(f[3]); });
        rule.base_confidence = reader.to_double(f[4]);
        if (rule.base_confidence < 0.0 || rule.base_confidence > 1.0) {
            reader.fail("confidence outside [0,1]: " + f[4]);
        }
        rule.guideline_source = f.size() > 5 ? f[5] : "";
        rule.recommendation = f.size() > 6 ? f[6] : "";
        rules.push_back(rule);
    }
    return rules;
}

// ============================================================================
// KnowledgeBase
// ============================================================================

KnowledgeBase KnowledgeBase::builtin() {
    KnowledgeBase kb;

    std::istringstream genes(builtin_tables::kGenes);
    kb.genes = parse_genes_table(genes, kb.version);

    std::istringstream variants(builtin_tables::kVariants);
    kb.variants = parse_variants_table(variants);

    std::istringstream bands(builtin_tables::kPhenotypeBands);
    kb.bands = parse_bands_table(bands);

    std::istringstream drugs(builtin_tables::kDrugs);
    kb.drug_genes = parse_drugs_table(drugs);

    std::istringstream rules(builtin_tables::kRiskRules);
    kb.rules = parse_rules_table(rules);

    return kb;
}

KnowledgeBase KnowledgeBase::load(const std::string& dir) {
    if (!fs::is_directory(dir)) {
        throw ConfigError("knowledge base directory not found: " + dir);
    }

    KnowledgeBase kb = builtin();

    auto open_table = [&dir](const std::string& name, std::ifstream& file) -> bool {
        fs::path path = fs::path(dir) / name;
        if (!fs::exists(path)) return false;
        file.open(path);
        if (!file.is_open()) {
            throw ConfigError("cannot open " + path.string());
        }
        log(LogLevel::INFO, "Loading knowledge base override: " + path.string());
        return true;
    };

    {
        std::ifstream file;
        if (open_table("genes.tsv", file)) {
            std::string version = "custom";
            kb.genes = parse_genes_table(file, version);
            kb.version = version;
        }
    }
    {
        std::ifstream file;
        if (open_table("pgx_variants.tsv", file)) kb.variants = parse_variants_table(file);
    }
    {
        std::ifstream file;
        if (open_table("phenotype_bands.tsv", file)) kb.bands = parse_bands_table(file);
    }
    {
        std::ifstream file;
        if (open_table("drugs.tsv", file)) kb.drug_genes = parse_drugs_table(file);
    }
    {
        std::ifstream file;
        if (open_table("risk_rules.tsv", file)) kb.rules = parse_rules_table(file);
    }

    kb.validate();
    return kb;
}

void KnowledgeBase::validate() const {
    std::set<std::string> symbols;
    for (const auto& gene : genes) {
        if (!symbols.insert(gene.symbol).second) {
            throw ConfigError("duplicate gene " + gene.symbol);
        }
    }

    for (const auto& entry : variants) {
        if (!symbols.count(entry.gene)) {
            throw ConfigError("variant " + entry.rsid + " names undefined gene " + entry.gene);
        }
    }

    std::set<std::string> banded;
    for (const auto& band : bands) {
        if (!symbols.count(band.gene)) {
            throw ConfigError("phenotype band for undefined gene " + band.gene);
        }
        banded.insert(band.gene);
    }
    for (const auto& gene : genes) {
        if (!banded.count(gene.symbol)) {
            throw ConfigError("gene " + gene.symbol + " has no phenotype bands");
        }
    }

    for (const auto& kv : drug_genes) {
        if (!symbols.count(kv.second)) {
            throw ConfigError("drug " + kv.first + " maps to undefined gene " + kv.second);
        }
    }

    for (const auto& rule : rules) {
        if (!symbols.count(rule.gene)) {
            throw ConfigError("risk rule for undefined gene " + rule.gene);
        }
    }
}

} // namespace pgx
