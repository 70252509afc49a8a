/**
 * Phenotype Mapper implementation
 */

#include "phenotype.hpp"
#include "errors.hpp"
#include <cmath>

namespace pgx {

PhenotypeMapper::PhenotypeMapper(const std::vector<PhenotypeBand>& bands) {
    for (const auto& band : bands) {
        bands_[band.gene].push_back(band);
    }

    for (const auto& kv : bands_) {
        const auto& gene_bands = kv.second;
        for (size_t i = 0; i < gene_bands.size(); ++i) {
            bool last = (i + 1 == gene_bands.size());
            if (last && gene_bands[i].upper) {
                throw ConfigError("last phenotype band of " + kv.first + " must be unbounded");
            }
            if (!last && !gene_bands[i].upper) {
                throw ConfigError("only the last phenotype band of " + kv.first +
                                  " may be unbounded");
            }
            if (i > 0 && !last && *gene_bands[i].upper <= *gene_bands[i - 1].upper) {
                throw ConfigError("phenotype bands of " + kv.first + " are not increasing");
            }
        }
    }
}

bool PhenotypeMapper::has_gene(const std::string& gene) const {
    return bands_.count(gene) > 0;
}

const std::vector<PhenotypeBand>& PhenotypeMapper::bands_for(const std::string& gene) const {
    auto it = bands_.find(gene);
    if (it == bands_.end()) {
        throw UnsupportedGeneError(gene, "No phenotype thresholds for gene " + gene);
    }
    return it->second;
}

Phenotype PhenotypeMapper::map(const std::string& gene, double activity_score) const {
    const auto& gene_bands = bands_for(gene);

    // Compare at 4 decimals so 0.1 + 0.2 lands on the 0.3 boundary
    double score = std::round(activity_score * 10000.0) / 10000.0;
    for (const auto& band : gene_bands) {
        if (!band.upper || score <= *band.upper) {
            return band.phenotype;
        }
    }
    return gene_bands.back().phenotype;
}

} // namespace pgx
