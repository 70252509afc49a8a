/**
 * Variant Annotator implementation
 */

#include "annotator.hpp"
#include "errors.hpp"

namespace pgx {

VariantAnnotator::VariantAnnotator(
    std::shared_ptr<const ReferenceStore> store,
    std::shared_ptr<const WindowEncoder> encoder,
    std::shared_ptr<const ModelState> model,
    bool ml_fallback
) : store_(std::move(store)),
    encoder_(std::move(encoder)),
    model_(std::move(model)),
    ml_fallback_(ml_fallback) {
    if (!store_) {
        throw ConfigError("annotator requires a reference store");
    }
    if (ml_fallback_ && (!encoder_ || !model_)) {
        throw ConfigError("ML fallback requires a window encoder and a model");
    }
}

std::optional<AnnotatedVariant> VariantAnnotator::annotate_one(
    const Variant& variant,
    QualityMetrics& metrics,
    const std::atomic<bool>* cancel
) const {
    if (variant.zygosity == Zygosity::HOM_REF || variant.zygosity == Zygosity::NO_CALL) {
        return std::nullopt;
    }
    if (variant.alt == "." || variant.alt == "*") {
        return std::nullopt;
    }

    AnnotatedVariant annotated;
    annotated.variant = variant;

    // Curated table first
    auto entry = store_->lookup(variant.chrom, variant.pos, variant.ref, variant.alt);
    if (entry) {
        annotated.gene = entry->gene;
        annotated.resolution = Resolution::MATCHED;
        annotated.entry = std::move(entry);
        metrics.record_curated_match();
        log(LogLevel::DEBUG, "Curated match " + variant.key() + " -> " + annotated.gene + " " +
            annotated.entry->star_allele);
        return annotated;
    }

    auto gene = store_->region_for(variant.chrom, variant.pos);
    if (!gene) {
        return std::nullopt;
    }
    annotated.gene = *gene;

    if (!ml_fallback_) {
        annotated.resolution = Resolution::UNRESOLVED;
        annotated.unresolved_reason = "ML fallback disabled";
        metrics.record_unresolved();
        return annotated;
    }

    try {
        SequenceTensor window = encoder_->encode(variant);
        annotated.prediction = model_->predict(window, cancel);
        annotated.resolution = Resolution::ML_RESOLVED;
        metrics.record_model_prediction();
        log(LogLevel::DEBUG, "Model prediction " + variant.key() + " -> " +
            function_class_to_string(annotated.prediction->function_class) +
            " (confidence " + std::to_string(annotated.prediction->confidence) + ")");
    } catch (const InferenceError& e) {
        annotated.resolution = Resolution::UNRESOLVED;
        annotated.prediction.reset();
        annotated.unresolved_reason = e.what();
        metrics.record_inference_failure();
        metrics.record_unresolved();
        log(LogLevel::WARNING, "Variant " + variant.key() + " left unresolved: " + e.what());
    }

    return annotated;
}

std::vector<AnnotatedVariant> VariantAnnotator::annotate(
    const std::vector<Variant>& variants,
    QualityMetrics& metrics,
    const std::atomic<bool>* cancel
) const {
    std::vector<AnnotatedVariant> annotated;
    size_t matched = 0, predicted = 0, unresolved = 0;

    for (const auto& variant : variants) {
        auto result = annotate_one(variant, metrics, cancel);
        if (!result) continue;

        switch (result->resolution) {
            case Resolution::MATCHED: ++matched; break;
            case Resolution::ML_RESOLVED: ++predicted; break;
            case Resolution::UNRESOLVED: ++unresolved; break;
        }
        annotated.push_back(std::move(*result));
    }

    log(LogLevel::INFO, "Annotated " + std::to_string(annotated.size()) +
        " PGx-relevant variants: " + std::to_string(matched) + " curated, " +
        std::to_string(predicted) + " model, " + std::to_string(unresolved) + " unresolved");

    return annotated;
}

} // namespace pgx
