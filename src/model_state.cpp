/**
 * Model State implementation
 */

#include "model_state.hpp"
#include "errors.hpp"
#include <mutex>
#include <sstream>

namespace pgx {

namespace {

std::once_flag g_model_once;
std::shared_ptr<const ModelState> g_model_state;

} // namespace

std::string model_mode_to_string(ModelMode mode) {
    switch (mode) {
        case ModelMode::TRAINED: return "trained";
        case ModelMode::DEMO: return "demo";
        default: return "unknown";
    }
}

ModelState::ModelState(std::unique_ptr<VariantClassifier> classifier, ModelMode mode,
                       std::string checkpoint_path, std::string load_error)
    : classifier_(std::move(classifier)),
      mode_(mode),
      checkpoint_path_(std::move(checkpoint_path)),
      load_error_(std::move(load_error)) {}

std::shared_ptr<const ModelState> ModelState::create(
    const std::string& checkpoint_path,
    const ClassifierConfig& demo_config
) {
    if (!checkpoint_path.empty()) {
        try {
            auto classifier = VariantClassifier::load_checkpoint(checkpoint_path);
            log(LogLevel::INFO, "Loaded classifier checkpoint: " + checkpoint_path + " (" +
                std::to_string(classifier->parameter_count()) + " parameters, device cpu)");
            return std::make_shared<ModelState>(std::move(classifier), ModelMode::TRAINED,
                                                checkpoint_path, "");
        } catch (const CheckpointError& e) {
            log(LogLevel::WARNING, std::string(e.what()) + ". Running in demo mode; "
                "ML confidence capped at 0.50");
            return std::make_shared<ModelState>(
                std::make_unique<VariantClassifier>(demo_config), ModelMode::DEMO,
                checkpoint_path, e.what());
        }
    }

    log(LogLevel::INFO, "No classifier checkpoint configured. Running in demo mode; "
        "ML confidence capped at 0.50");
    return std::make_shared<ModelState>(
        std::make_unique<VariantClassifier>(demo_config), ModelMode::DEMO, "", "");
}

std::shared_ptr<const ModelState> ModelState::initialize_global(const std::string& checkpoint_path) {
    std::call_once(g_model_once, [&checkpoint_path]() {
        g_model_state = create(checkpoint_path);
    });
    return g_model_state;
}

std::shared_ptr<const ModelState> ModelState::global() {
    return initialize_global("");
}

MlPrediction ModelState::predict(const SequenceTensor& input,
                                 const std::atomic<bool>* cancel) const {
    return classifier_->predict(input, is_demo(), cancel);
}

std::string ModelState::simd_instructions() const {
    return Eigen::SimdInstructionSetsInUse();
}

std::string ModelState::status_string() const {
    std::ostringstream oss;
    oss << "Model mode: " << model_mode_to_string(mode_) << "\n";
    oss << "Checkpoint: " << (checkpoint_path_.empty() ? "(none)" : checkpoint_path_) << "\n";
    if (!load_error_.empty()) {
        oss << "Load error: " << load_error_ << "\n";
    }
    oss << "Device: " << device() << "\n";
    oss << "SIMD: " << simd_instructions() << "\n";
    oss << "Parameters: " << classifier_->parameter_count() << "\n";
    oss << "Window length: " << classifier_->config().input_length << "\n";
    if (is_demo()) {
        oss << "Confidence cap: " << kDemoConfidenceCap << "\n";
    }
    return oss.str();
}

} // namespace pgx
