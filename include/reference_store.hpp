/**
 * PGx Reference Store
 *
 * Exact-match lookup of curated star-allele definitions and gene-region
 * membership tests. Immutable after construction; concurrent reads need no
 * locking.
 */

#ifndef PGX_REFERENCE_STORE_HPP
#define PGX_REFERENCE_STORE_HPP

#include "pgx_engine.hpp"
#include "knowledge_base.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgx {

class ReferenceStore {
public:
    explicit ReferenceStore(const KnowledgeBase& kb);

    /**
     * Exact match on (chrom, pos, ref, alt). Chromosome names with or
     * without the "chr" prefix are equivalent.
     */
    std::optional<ReferenceEntry> lookup(
        const std::string& chrom,
        int pos,
        const std::string& ref,
        const std::string& alt
    ) const;

    /**
     * Exact match restricted to one gene's curated entries
     */
    std::optional<ReferenceEntry> lookup_in_gene(
        const std::string& gene,
        int pos,
        const std::string& ref,
        const std::string& alt
    ) const;

    /**
     * Monitored gene whose region contains the position, if any
     */
    std::optional<std::string> region_for(const std::string& chrom, int pos) const;

    /**
     * Gene definition by symbol, nullptr if not modelled
     */
    const GeneDefinition* gene(const std::string& symbol) const;

    const std::vector<GeneDefinition>& genes() const { return genes_; }
    size_t size() const { return entries_.size(); }
    const std::string& version() const { return version_; }

private:
    static std::string make_key(const std::string& chrom, int pos,
                                const std::string& ref, const std::string& alt);

    std::string version_;
    std::vector<GeneDefinition> genes_;
    std::unordered_map<std::string, ReferenceEntry> entries_;
};

} // namespace pgx

#endif // PGX_REFERENCE_STORE_HPP
