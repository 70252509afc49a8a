/**
 * Phenotype Mapper
 *
 * Maps a gene activity score to a phenotype through the gene's ordered
 * bands. A score equal to a band's upper bound stays in that (lower) band.
 */

#ifndef PGX_PHENOTYPE_HPP
#define PGX_PHENOTYPE_HPP

#include "pgx_engine.hpp"
#include "knowledge_base.hpp"
#include <map>
#include <string>
#include <vector>

namespace pgx {

class PhenotypeMapper {
public:
    /**
     * @throws ConfigError if a gene's bounds are not strictly increasing or
     *         its last band is bounded
     */
    explicit PhenotypeMapper(const std::vector<PhenotypeBand>& bands);

    /**
     * @throws UnsupportedGeneError for a gene without bands
     */
    Phenotype map(const std::string& gene, double activity_score) const;

    bool has_gene(const std::string& gene) const;

    const std::vector<PhenotypeBand>& bands_for(const std::string& gene) const;

private:
    std::map<std::string, std::vector<PhenotypeBand>> bands_;
};

} // namespace pgx

#endif // PGX_PHENOTYPE_HPP
