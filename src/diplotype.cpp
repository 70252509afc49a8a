/**
 * Diplotype Assembler implementation
 */

#include "diplotype.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace pgx {

const char* const kNovelAlleleStar = "novel";

namespace {

double round4(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

DiplotypeAllele allele_from(const AnnotatedVariant& av) {
    DiplotypeAllele allele;
    allele.source = av.resolution;
    allele.variant_key = av.variant.key();
    if (av.is_matched()) {
        allele.star = av.entry->star_allele;
        allele.function_class = av.entry->function_class;
        allele.activity = av.entry->activity;
    } else {
        allele.star = kNovelAlleleStar;
        allele.function_class = av.prediction->function_class;
        allele.activity = default_activity_for(av.prediction->function_class);
        allele.ml_confidence = av.prediction->confidence;
    }
    return allele;
}

// Lower activity wins; on a tie curated evidence beats model evidence
bool more_deleterious(const DiplotypeAllele& a, const DiplotypeAllele& b) {
    if (a.activity != b.activity) return a.activity < b.activity;
    return !a.is_model_derived() && b.is_model_derived();
}

} // namespace

// ============================================================================
// GeneDiplotype
// ============================================================================

std::string GeneDiplotype::diplotype() const {
    return alleles[0].star + "/" + alleles[1].star;
}

bool GeneDiplotype::has_model_derived_allele() const {
    return alleles[0].is_model_derived() || alleles[1].is_model_derived();
}

// ============================================================================
// DiplotypeAssembler
// ============================================================================

DiplotypeAssembler::DiplotypeAssembler(std::shared_ptr<const ReferenceStore> store)
    : store_(std::move(store)) {}

DiplotypeAllele DiplotypeAssembler::default_allele(const GeneDefinition& gene) const {
    DiplotypeAllele allele;
    allele.star = gene.default_star;
    allele.function_class = gene.default_function;
    allele.activity = gene.default_activity;
    allele.source = Resolution::UNRESOLVED;
    return allele;
}

double DiplotypeAssembler::combine(CombineRule rule, double a, double b) {
    switch (rule) {
        case CombineRule::PRODUCT: return a * b;
        case CombineRule::SUM:
        default: return a + b;
    }
}

GeneDiplotype DiplotypeAssembler::assemble(
    const std::string& gene,
    const std::vector<AnnotatedVariant>& variants
) const {
    const GeneDefinition* def = store_->gene(gene);
    if (!def) {
        throw UnsupportedGeneError(gene, "Gene " + gene + " is not modelled");
    }

    GeneDiplotype result;
    result.gene = def->symbol;
    result.combine_rule = def->combine_rule;

    std::vector<const AnnotatedVariant*> calls;
    for (const auto& av : variants) {
        if (av.gene != def->symbol) continue;
        result.variants.push_back(av);
        if (av.resolution == Resolution::UNRESOLVED) continue;
        calls.push_back(&av);
    }

    result.phased = !calls.empty() &&
        std::all_of(calls.begin(), calls.end(),
                    [](const AnnotatedVariant* av) { return av->variant.phased; });

    std::array<std::vector<DiplotypeAllele>, 2> haplotypes;

    if (result.phased) {
        for (const auto* av : calls) {
            if (av->variant.allele1 == 1) haplotypes[0].push_back(allele_from(*av));
            if (av->variant.allele2 == 1) haplotypes[1].push_back(allele_from(*av));
        }
    } else {
        std::vector<DiplotypeAllele> hets;
        for (const auto* av : calls) {
            if (av->variant.zygosity == Zygosity::HOM_ALT) {
                haplotypes[0].push_back(allele_from(*av));
                haplotypes[1].push_back(allele_from(*av));
            } else {
                hets.push_back(allele_from(*av));
            }
        }
        // Trans placement: the two most deleterious hets land on different haplotypes
        std::stable_sort(hets.begin(), hets.end(), more_deleterious);
        for (size_t i = 0; i < hets.size(); ++i) {
            haplotypes[i % 2].push_back(hets[i]);
        }
    }

    for (size_t h = 0; h < 2; ++h) {
        if (haplotypes[h].empty()) {
            result.alleles[h] = default_allele(*def);
        } else {
            result.alleles[h] = *std::min_element(haplotypes[h].begin(), haplotypes[h].end(),
                                                  more_deleterious);
        }
    }

    // Unphased: report the higher-activity allele first ("*1/*4")
    if (!result.phased && result.alleles[1].activity > result.alleles[0].activity) {
        std::swap(result.alleles[0], result.alleles[1]);
    }

    result.activity_score = round4(combine(def->combine_rule,
                                           result.alleles[0].activity,
                                           result.alleles[1].activity));

    log(LogLevel::DEBUG, "Diplotype " + result.gene + " " + result.diplotype() +
        " activity " + std::to_string(result.activity_score));

    return result;
}

std::map<std::string, std::vector<AnnotatedVariant>> group_by_gene(
    const std::vector<AnnotatedVariant>& variants
) {
    std::map<std::string, std::vector<AnnotatedVariant>> grouped;
    for (const auto& av : variants) {
        grouped[av.gene].push_back(av);
    }
    return grouped;
}

} // namespace pgx
