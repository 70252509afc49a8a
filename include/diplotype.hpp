/**
 * Diplotype Assembler
 *
 * Collapses the annotated variants of one gene into exactly two alleles
 * (one per haplotype) and a combined activity score.
 *
 * Haplotype assignment:
 * - phased genotypes follow their GT indices
 * - unphased hom-alt calls fill both haplotypes
 * - unphased het calls are placed in trans, most deleterious first, so two
 *   different non-wild-type variants form a compound heterozygote
 * Each haplotype keeps its lowest-activity call; an empty haplotype takes the
 * gene's wild-type default. Unresolved variants contribute nothing.
 */

#ifndef PGX_DIPLOTYPE_HPP
#define PGX_DIPLOTYPE_HPP

#include "pgx_engine.hpp"
#include "knowledge_base.hpp"
#include "reference_store.hpp"
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgx {

/**
 * Star allele assigned to model-derived alleles
 */
extern const char* const kNovelAlleleStar;

struct DiplotypeAllele {
    std::string star;
    FunctionClass function_class = FunctionClass::NORMAL;
    double activity = 1.0;
    Resolution source = Resolution::UNRESOLVED;     // UNRESOLVED = wild-type default
    std::string variant_key;                        // empty for the default allele
    std::optional<double> ml_confidence;

    bool is_default() const { return variant_key.empty(); }
    bool is_model_derived() const { return source == Resolution::ML_RESOLVED; }
};

struct GeneDiplotype {
    std::string gene;
    std::array<DiplotypeAllele, 2> alleles;
    double activity_score = 2.0;
    CombineRule combine_rule = CombineRule::SUM;
    bool phased = false;
    std::optional<Phenotype> phenotype;             // set by the phenotype mapper
    std::vector<AnnotatedVariant> variants;         // every annotated variant of the gene

    /** "*1/*4" */
    std::string diplotype() const;

    /** True if either allele came from the fallback classifier */
    bool has_model_derived_allele() const;
};

class DiplotypeAssembler {
public:
    explicit DiplotypeAssembler(std::shared_ptr<const ReferenceStore> store);

    /**
     * @param gene Gene symbol
     * @param variants Annotated variants (variants of other genes are ignored)
     * @throws UnsupportedGeneError if the gene is not modelled
     */
    GeneDiplotype assemble(const std::string& gene,
                           const std::vector<AnnotatedVariant>& variants) const;

    /**
     * Wild-type allele for a gene
     */
    DiplotypeAllele default_allele(const GeneDefinition& gene) const;

    static double combine(CombineRule rule, double a, double b);

private:
    std::shared_ptr<const ReferenceStore> store_;
};

/**
 * Group annotated variants by gene symbol, preserving input order within a gene
 */
std::map<std::string, std::vector<AnnotatedVariant>> group_by_gene(
    const std::vector<AnnotatedVariant>& variants);

} // namespace pgx

#endif // PGX_DIPLOTYPE_HPP
