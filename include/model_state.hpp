/**
 * Model State
 *
 * Owns the fallback classifier for the life of the process. The checkpoint
 * is loaded once; on any failure (or with no checkpoint configured) the state
 * is permanently in demo mode and every prediction is capped at
 * kDemoConfidenceCap. Immutable after construction.
 */

#ifndef PGX_MODEL_STATE_HPP
#define PGX_MODEL_STATE_HPP

#include "variant_classifier.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace pgx {

enum class ModelMode {
    TRAINED,
    DEMO
};

std::string model_mode_to_string(ModelMode mode);

class ModelState {
public:
    /**
     * Load a checkpoint, or fall back to demo mode
     * @param checkpoint_path Empty for demo mode
     * @param demo_config Architecture used when no checkpoint can be loaded
     */
    static std::shared_ptr<const ModelState> create(
        const std::string& checkpoint_path,
        const ClassifierConfig& demo_config = ClassifierConfig()
    );

    /**
     * Process-wide instance. The first call wins; later calls are no-ops
     * and return the existing state.
     */
    static std::shared_ptr<const ModelState> initialize_global(const std::string& checkpoint_path);

    /**
     * Process-wide instance, initialized in demo mode if nobody did so first
     */
    static std::shared_ptr<const ModelState> global();

    /**
     * Thread-safe inference; demo mode caps confidence
     */
    MlPrediction predict(const SequenceTensor& input,
                         const std::atomic<bool>* cancel = nullptr) const;

    ModelMode mode() const { return mode_; }
    bool is_demo() const { return mode_ == ModelMode::DEMO; }
    bool is_loaded() const { return mode_ == ModelMode::TRAINED; }
    const std::string& checkpoint_path() const { return checkpoint_path_; }
    const std::string& load_error() const { return load_error_; }
    std::string device() const { return "cpu"; }
    std::string simd_instructions() const;

    const VariantClassifier& classifier() const { return *classifier_; }

    /**
     * Health summary: mode, checkpoint, device, SIMD, parameter count
     */
    std::string status_string() const;

    ModelState(std::unique_ptr<VariantClassifier> classifier, ModelMode mode,
               std::string checkpoint_path, std::string load_error);

private:
    std::unique_ptr<VariantClassifier> classifier_;
    ModelMode mode_;
    std::string checkpoint_path_;
    std::string load_error_;
};

} // namespace pgx

#endif // PGX_MODEL_STATE_HPP
