/**
 * PGx Reference Store implementation
 */

#include "reference_store.hpp"
#include "errors.hpp"

namespace pgx {

ReferenceStore::ReferenceStore(const KnowledgeBase& kb)
    : version_(kb.version), genes_(kb.genes) {
    for (const auto& entry : kb.variants) {
        std::string key = make_key(entry.chrom, entry.pos, entry.ref, entry.alt);
        auto result = entries_.emplace(key, entry);
        if (!result.second) {
            throw ConfigError("duplicate curated variant " + key);
        }
    }

    log(LogLevel::INFO, "Reference store " + version_ + ": " +
        std::to_string(entries_.size()) + " curated variants across " +
        std::to_string(genes_.size()) + " genes");
}

std::string ReferenceStore::make_key(const std::string& chrom, int pos,
                                     const std::string& ref, const std::string& alt) {
    return normalize_chrom(chrom) + ":" + std::to_string(pos) + ":" + ref + ":" + alt;
}

std::optional<ReferenceEntry> ReferenceStore::lookup(
    const std::string& chrom,
    int pos,
    const std::string& ref,
    const std::string& alt
) const {
    auto it = entries_.find(make_key(chrom, pos, ref, alt));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<ReferenceEntry> ReferenceStore::lookup_in_gene(
    const std::string& gene,
    int pos,
    const std::string& ref,
    const std::string& alt
) const {
    const GeneDefinition* def = this->gene(gene);
    if (!def) return std::nullopt;

    auto entry = lookup(def->chrom, pos, ref, alt);
    if (entry && entry->gene == def->symbol) return entry;
    return std::nullopt;
}

std::optional<std::string> ReferenceStore::region_for(const std::string& chrom, int pos) const {
    std::string norm = normalize_chrom(chrom);
    for (const auto& gene : genes_) {
        if (gene.contains(norm, pos)) return gene.symbol;
    }
    return std::nullopt;
}

const GeneDefinition* ReferenceStore::gene(const std::string& symbol) const {
    for (const auto& gene : genes_) {
        if (gene.symbol == symbol) return &gene;
    }
    return nullptr;
}

} // namespace pgx
