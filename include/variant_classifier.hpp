/**
 * Neural Fallback Classifier
 *
 * 1D-CNN + BiLSTM variant function classifier evaluated with Eigen:
 *
 *   input (4 x L one-hot window)
 *   conv block x N       Conv1d(same padding) -> BatchNorm -> ReLU -> MaxPool(2)
 *   BiLSTM x layers      hidden H per direction, gate order i, f, g, o
 *   LayerNorm(2H)        per time step
 *   mean over time
 *   Dense(2H -> D) -> BatchNorm -> ReLU -> Dense(D -> 4)
 *   log-softmax          log-sum-exp normalized
 *
 * Output classes follow FunctionClass order: normal, decreased, increased,
 * no_function. Inference never mutates parameters, so one instance can serve
 * concurrent callers.
 */

#ifndef PGX_VARIANT_CLASSIFIER_HPP
#define PGX_VARIANT_CLASSIFIER_HPP

#include "pgx_engine.hpp"
#include "window_encoder.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pgx {

/**
 * Highest confidence a prediction may report without trained weights
 */
constexpr double kDemoConfidenceCap = 0.50;

constexpr uint32_t kDemoInitSeed = 42;

struct ClassifierConfig {
    int input_length = 2 * kDefaultFlankLength + 1;
    std::vector<int> conv_channels = {64, 128, 256};
    int kernel_size = 7;
    int lstm_hidden = 128;
    int lstm_layers = 2;
    int dense_hidden = 128;

    /**
     * @throws ConfigError for an architecture that cannot be evaluated
     *         (even kernel, empty conv stack, window pooled down to nothing)
     */
    void validate() const;

    bool operator==(const ClassifierConfig& other) const;
};

class VariantClassifier {
public:
    /**
     * Build the network with deterministic pseudo-random parameters
     */
    explicit VariantClassifier(const ClassifierConfig& config = ClassifierConfig(),
                               uint32_t seed = kDemoInitSeed);
    ~VariantClassifier();

    VariantClassifier(const VariantClassifier&) = delete;
    VariantClassifier& operator=(const VariantClassifier&) = delete;

    /**
     * Load architecture and weights from a checkpoint written by save_checkpoint()
     * @throws CheckpointError on a missing, truncated or shape-mismatched file
     */
    static std::unique_ptr<VariantClassifier> load_checkpoint(const std::string& path);

    /**
     * Write a gzip-compressed checkpoint
     * @throws CheckpointError if the file cannot be written
     */
    void save_checkpoint(const std::string& path) const;

    /**
     * Log-probabilities over the four function classes
     * @param cancel Optional flag polled between layers
     * @throws InferenceError on a tensor that is not 4 x input_length or a
     *         non-finite output
     * @throws RequestCancelledError if `cancel` is raised
     */
    Eigen::VectorXf forward(const SequenceTensor& input,
                            const std::atomic<bool>* cancel = nullptr) const;

    /**
     * Arg-max class and its probability. With `demo_mode` the confidence is
     * capped at kDemoConfidenceCap. Confidence is rounded to 4 decimals.
     */
    MlPrediction predict(const SequenceTensor& input, bool demo_mode,
                         const std::atomic<bool>* cancel = nullptr) const;

    const ClassifierConfig& config() const;
    size_t parameter_count() const;

    /**
     * Names of all parameter tensors in serialization order
     */
    std::vector<std::string> tensor_names() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace pgx

#endif // PGX_VARIANT_CLASSIFIER_HPP
