/**
 * Variant Annotator
 *
 * Resolves each called variant against the reference store and, for
 * variants inside a monitored gene region with no curated match, against
 * the fallback classifier:
 *
 *   curated hit                 -> MATCHED
 *   in gene region, model ok    -> ML_RESOLVED
 *   in gene region, otherwise   -> UNRESOLVED (treated as wild-type)
 *   outside every gene region   -> dropped
 */

#ifndef PGX_ANNOTATOR_HPP
#define PGX_ANNOTATOR_HPP

#include "pgx_engine.hpp"
#include "reference_store.hpp"
#include "window_encoder.hpp"
#include "model_state.hpp"
#include "quality_metrics.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace pgx {

class VariantAnnotator {
public:
    VariantAnnotator(
        std::shared_ptr<const ReferenceStore> store,
        std::shared_ptr<const WindowEncoder> encoder,
        std::shared_ptr<const ModelState> model,
        bool ml_fallback = true
    );

    /**
     * Annotate all PGx-relevant variants, preserving input order.
     * Hom-ref and no-call records are never annotated.
     * @throws RequestCancelledError if `cancel` is raised during inference
     */
    std::vector<AnnotatedVariant> annotate(
        const std::vector<Variant>& variants,
        QualityMetrics& metrics,
        const std::atomic<bool>* cancel = nullptr
    ) const;

    /**
     * Annotate a single variant; std::nullopt if it is not PGx-relevant
     */
    std::optional<AnnotatedVariant> annotate_one(
        const Variant& variant,
        QualityMetrics& metrics,
        const std::atomic<bool>* cancel = nullptr
    ) const;

    bool ml_fallback_enabled() const { return ml_fallback_; }

private:
    std::shared_ptr<const ReferenceStore> store_;
    std::shared_ptr<const WindowEncoder> encoder_;
    std::shared_ptr<const ModelState> model_;
    bool ml_fallback_;
};

} // namespace pgx

#endif // PGX_ANNOTATOR_HPP
