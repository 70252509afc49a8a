/**
 * Neural Fallback Classifier implementation
 */

#include "variant_classifier.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <new>
#include <stdexcept>
#include <random>
#include <zlib.h>

namespace pgx {

namespace {

using Matrix = Eigen::MatrixXf;
using RowMajorMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr float kNormEps = 1e-5f;
constexpr char kCheckpointMagic[8] = {'P', 'G', 'X', 'C', 'K', 'P', 'T', '1'};
constexpr uint32_t kMaxTensorElements = 1u << 26;

// Upper bounds on architecture values read from a checkpoint header
constexpr int32_t kMaxCheckpointWidth = 4096;
constexpr int32_t kMaxCheckpointInputLength = 100001;
constexpr int32_t kMaxCheckpointLayers = 16;

void check_header_value(const char* field, int32_t value, int32_t upper) {
    if (value < 1 || value > upper) {
        throw CheckpointError(std::string("implausible ") + field + " " + std::to_string(value) +
                              " in checkpoint header");
    }
}

enum class Init { UNIFORM, ONES, ZEROS };

/**
 * A parameter tensor as it appears in a checkpoint
 */
struct NamedTensor {
    std::string name;
    Matrix* tensor;
    Init init;
    int fan_in;
};

struct ConvBlock {
    int in_channels = 0;
    int out_channels = 0;
    int kernel = 0;
    Matrix weight;          // out x (in * kernel)
    Matrix bias;            // out x 1
    Matrix bn_weight;
    Matrix bn_bias;
    Matrix bn_mean;
    Matrix bn_var;
};

struct LstmDirection {
    Matrix w_ih;            // 4H x input
    Matrix w_hh;            // 4H x H
    Matrix b_ih;            // 4H x 1
    Matrix b_hh;
};

struct LstmLayer {
    int input_size = 0;
    LstmDirection forward;
    LstmDirection reverse;
};

Eigen::ArrayXf sigmoid(const Eigen::ArrayXf& v) {
    return (1.0f + (-v).exp()).inverse();
}

void check_cancel(const std::atomic<bool>* cancel) {
    if (cancel && cancel->load(std::memory_order_relaxed)) {
        throw RequestCancelledError();
    }
}

// Affine form of inference-time batch norm: y * scale + shift
void batch_norm_coefficients(const Matrix& weight, const Matrix& bias,
                             const Matrix& mean, const Matrix& var,
                             Eigen::ArrayXf& scale, Eigen::ArrayXf& shift) {
    scale = weight.col(0).array() / (var.col(0).array() + kNormEps).sqrt();
    shift = bias.col(0).array() - mean.col(0).array() * scale;
}

Matrix conv_block_forward(const ConvBlock& block, const Matrix& x) {
    const int length = static_cast<int>(x.cols());
    const int pad = (block.kernel - 1) / 2;

    // im2col: row c * kernel + j holds x(c, t + j - pad)
    Matrix cols = Matrix::Zero(block.in_channels * block.kernel, length);
    for (int c = 0; c < block.in_channels; ++c) {
        for (int j = 0; j < block.kernel; ++j) {
            for (int t = 0; t < length; ++t) {
                int src = t + j - pad;
                if (src >= 0 && src < length) {
                    cols(c * block.kernel + j, t) = x(c, src);
                }
            }
        }
    }

    Matrix y = block.weight * cols;
    y.colwise() += block.bias.col(0);

    Eigen::ArrayXf scale, shift;
    batch_norm_coefficients(block.bn_weight, block.bn_bias, block.bn_mean, block.bn_var,
                            scale, shift);
    y.array().colwise() *= scale;
    y.array().colwise() += shift;
    y = y.cwiseMax(0.0f);

    const int pooled_length = length / 2;
    Matrix pooled(block.out_channels, pooled_length);
    for (int t = 0; t < pooled_length; ++t) {
        pooled.col(t) = y.col(2 * t).cwiseMax(y.col(2 * t + 1));
    }
    return pooled;
}

Matrix lstm_direction_forward(const LstmDirection& dir, const Matrix& x, int hidden, bool reverse) {
    const int steps = static_cast<int>(x.cols());

    Matrix pre = dir.w_ih * x;
    pre.colwise() += (dir.b_ih + dir.b_hh).col(0);

    Matrix out(hidden, steps);
    Eigen::VectorXf h = Eigen::VectorXf::Zero(hidden);
    Eigen::ArrayXf c = Eigen::ArrayXf::Zero(hidden);

    for (int step = 0; step < steps; ++step) {
        const int t = reverse ? steps - 1 - step : step;
        Eigen::VectorXf gates = pre.col(t) + dir.w_hh * h;

        Eigen::ArrayXf i = sigmoid(gates.segment(0, hidden).array());
        Eigen::ArrayXf f = sigmoid(gates.segment(hidden, hidden).array());
        Eigen::ArrayXf g = gates.segment(2 * hidden, hidden).array().tanh();
        Eigen::ArrayXf o = sigmoid(gates.segment(3 * hidden, hidden).array());

        c = f * c + i * g;
        h = (o * c.tanh()).matrix();
        out.col(t) = h;
    }
    return out;
}

template <typename T>
void write_value(gzFile gz, const T& value) {
    if (gzwrite(gz, &value, sizeof(T)) != static_cast<int>(sizeof(T))) {
        throw CheckpointError("write failed");
    }
}

template <typename T>
T read_value(gzFile gz) {
    T value{};
    if (gzread(gz, &value, sizeof(T)) != static_cast<int>(sizeof(T))) {
        throw CheckpointError("unexpected end of file");
    }
    return value;
}

void read_bytes(gzFile gz, void* dest, size_t size) {
    if (size == 0) return;
    if (gzread(gz, dest, static_cast<unsigned>(size)) != static_cast<int>(size)) {
        throw CheckpointError("unexpected end of file");
    }
}

/**
 * Closes the gz handle on scope exit
 */
class GzFileGuard {
public:
    explicit GzFileGuard(gzFile gz) : gz_(gz) {}
    ~GzFileGuard() { if (gz_) gzclose(gz_); }
    GzFileGuard(const GzFileGuard&) = delete;
    GzFileGuard& operator=(const GzFileGuard&) = delete;

    // Explicit close so write errors surface
    int close() {
        int rc = gzclose(gz_);
        gz_ = nullptr;
        return rc;
    }

private:
    gzFile gz_;
};

} // namespace

// ============================================================================
// ClassifierConfig
// ============================================================================

void ClassifierConfig::validate() const {
    if (conv_channels.empty()) {
        throw ConfigError("classifier needs at least one convolution block");
    }
    if (kernel_size < 1 || kernel_size % 2 == 0) {
        throw ConfigError("convolution kernel must be odd, got " + std::to_string(kernel_size));
    }
    for (int channels : conv_channels) {
        if (channels < 1) throw ConfigError("convolution channels must be positive");
    }
    if (lstm_hidden < 1 || lstm_layers < 1 || dense_hidden < 1) {
        throw ConfigError("recurrent and dense sizes must be positive");
    }
    int length = input_length;
    for (size_t i = 0; i < conv_channels.size(); ++i) {
        length /= 2;
    }
    if (length < 1) {
        throw ConfigError("input length " + std::to_string(input_length) +
                          " is too short for " + std::to_string(conv_channels.size()) +
                          " pooling stages");
    }
}

bool ClassifierConfig::operator==(const ClassifierConfig& other) const {
    return input_length == other.input_length &&
           conv_channels == other.conv_channels &&
           kernel_size == other.kernel_size &&
           lstm_hidden == other.lstm_hidden &&
           lstm_layers == other.lstm_layers &&
           dense_hidden == other.dense_hidden;
}

// ============================================================================
// VariantClassifier
// ============================================================================

struct VariantClassifier::Impl {
    ClassifierConfig config;

    std::vector<ConvBlock> conv_blocks;
    std::vector<LstmLayer> lstm_layers;
    Matrix ln_weight, ln_bias;                          // 2H x 1
    Matrix dense1_weight, dense1_bias;                  // D x 2H, D x 1
    Matrix bn_weight, bn_bias, bn_mean, bn_var;         // D x 1
    Matrix dense2_weight, dense2_bias;                  // 4 x D, 4 x 1

    std::vector<NamedTensor> tensors;

    explicit Impl(const ClassifierConfig& cfg) : config(cfg) {
        config.validate();
        allocate();
    }

    void add(const std::string& name, Matrix& m, int rows, int cols, Init init, int fan_in) {
        m = Matrix::Zero(rows, cols);
        tensors.push_back({name, &m, init, fan_in});
    }

    void add_batch_norm(const std::string& prefix, int channels,
                        Matrix& weight, Matrix& bias, Matrix& mean, Matrix& var) {
        add(prefix + ".weight", weight, channels, 1, Init::ONES, 0);
        add(prefix + ".bias", bias, channels, 1, Init::ZEROS, 0);
        add(prefix + ".running_mean", mean, channels, 1, Init::ZEROS, 0);
        add(prefix + ".running_var", var, channels, 1, Init::ONES, 0);
    }

    void allocate() {
        const int k = config.kernel_size;
        const int hidden = config.lstm_hidden;

        // Sized up front so the tensor registry can hold stable pointers
        conv_blocks.resize(config.conv_channels.size());
        lstm_layers.resize(config.lstm_layers);

        int in_channels = 4;
        for (size_t b = 0; b < conv_blocks.size(); ++b) {
            ConvBlock& block = conv_blocks[b];
            block.in_channels = in_channels;
            block.out_channels = config.conv_channels[b];
            block.kernel = k;

            std::string prefix = "conv" + std::to_string(b);
            int fan_in = in_channels * k;
            add(prefix + ".weight", block.weight, block.out_channels, fan_in, Init::UNIFORM, fan_in);
            add(prefix + ".bias", block.bias, block.out_channels, 1, Init::UNIFORM, fan_in);
            add_batch_norm(prefix + ".bn", block.out_channels,
                           block.bn_weight, block.bn_bias, block.bn_mean, block.bn_var);
            in_channels = block.out_channels;
        }

        int input_size = in_channels;
        for (size_t l = 0; l < lstm_layers.size(); ++l) {
            LstmLayer& layer = lstm_layers[l];
            layer.input_size = input_size;
            for (int d = 0; d < 2; ++d) {
                LstmDirection& dir = (d == 0) ? layer.forward : layer.reverse;
                std::string prefix = "lstm.l" + std::to_string(l) + (d == 0 ? ".fwd" : ".rev");
                add(prefix + ".w_ih", dir.w_ih, 4 * hidden, input_size, Init::UNIFORM, hidden);
                add(prefix + ".w_hh", dir.w_hh, 4 * hidden, hidden, Init::UNIFORM, hidden);
                add(prefix + ".b_ih", dir.b_ih, 4 * hidden, 1, Init::UNIFORM, hidden);
                add(prefix + ".b_hh", dir.b_hh, 4 * hidden, 1, Init::UNIFORM, hidden);
            }
            input_size = 2 * hidden;
        }

        add("layer_norm.weight", ln_weight, 2 * hidden, 1, Init::ONES, 0);
        add("layer_norm.bias", ln_bias, 2 * hidden, 1, Init::ZEROS, 0);

        const int dense = config.dense_hidden;
        add("dense1.weight", dense1_weight, dense, 2 * hidden, Init::UNIFORM, 2 * hidden);
        add("dense1.bias", dense1_bias, dense, 1, Init::UNIFORM, 2 * hidden);
        add_batch_norm("dense1.bn", dense, bn_weight, bn_bias, bn_mean, bn_var);
        add("dense2.weight", dense2_weight, static_cast<int>(kNumFunctionClasses), dense,
            Init::UNIFORM, dense);
        add("dense2.bias", dense2_bias, static_cast<int>(kNumFunctionClasses), 1,
            Init::UNIFORM, dense);
    }

    void initialize(uint32_t seed) {
        std::mt19937 rng(seed);
        for (auto& t : tensors) {
            Matrix& m = *t.tensor;
            switch (t.init) {
                case Init::ONES:
                    m.setOnes();
                    break;
                case Init::ZEROS:
                    m.setZero();
                    break;
                case Init::UNIFORM: {
                    float bound = 1.0f / std::sqrt(static_cast<float>(t.fan_in));
                    std::uniform_real_distribution<float> dist(-bound, bound);
                    for (Eigen::Index r = 0; r < m.rows(); ++r) {
                        for (Eigen::Index c = 0; c < m.cols(); ++c) {
                            m(r, c) = dist(rng);
                        }
                    }
                    break;
                }
            }
        }
    }

    Eigen::VectorXf forward(const SequenceTensor& input, const std::atomic<bool>* cancel) const {
        if (input.rows() != 4) {
            throw InferenceError("expected 4 nucleotide channels, got " +
                                 std::to_string(input.rows()));
        }
        if (input.cols() != config.input_length) {
            throw InferenceError("expected window of " + std::to_string(config.input_length) +
                                 " positions, got " + std::to_string(input.cols()));
        }

        Matrix x = input;
        for (const auto& block : conv_blocks) {
            check_cancel(cancel);
            x = conv_block_forward(block, x);
        }

        const int hidden = config.lstm_hidden;
        for (const auto& layer : lstm_layers) {
            check_cancel(cancel);
            Matrix out(2 * hidden, x.cols());
            out.topRows(hidden) = lstm_direction_forward(layer.forward, x, hidden, false);
            out.bottomRows(hidden) = lstm_direction_forward(layer.reverse, x, hidden, true);
            x = std::move(out);
        }
        check_cancel(cancel);

        // Layer norm over features at each time step
        for (Eigen::Index t = 0; t < x.cols(); ++t) {
            Eigen::ArrayXf col = x.col(t).array();
            float mean = col.mean();
            float var = (col - mean).square().mean();
            x.col(t) = (((col - mean) / std::sqrt(var + kNormEps)) * ln_weight.col(0).array() +
                        ln_bias.col(0).array()).matrix();
        }

        Eigen::VectorXf pooled = x.rowwise().mean();

        Eigen::VectorXf hidden_out = dense1_weight * pooled + dense1_bias.col(0);
        Eigen::ArrayXf scale, shift;
        batch_norm_coefficients(bn_weight, bn_bias, bn_mean, bn_var, scale, shift);
        hidden_out = (hidden_out.array() * scale + shift).max(0.0f).matrix();

        Eigen::VectorXf logits = dense2_weight * hidden_out + dense2_bias.col(0);

        // log-softmax via log-sum-exp
        float max_logit = logits.maxCoeff();
        float lse = max_logit + std::log((logits.array() - max_logit).exp().sum());
        Eigen::VectorXf log_probs = (logits.array() - lse).matrix();

        if (!log_probs.allFinite()) {
            throw InferenceError("non-finite classifier output");
        }
        return log_probs;
    }
};

VariantClassifier::VariantClassifier(const ClassifierConfig& config, uint32_t seed)
    : pimpl_(std::make_unique<Impl>(config)) {
    pimpl_->initialize(seed);
}

VariantClassifier::~VariantClassifier() = default;

const ClassifierConfig& VariantClassifier::config() const {
    return pimpl_->config;
}

size_t VariantClassifier::parameter_count() const {
    size_t count = 0;
    for (const auto& t : pimpl_->tensors) {
        count += static_cast<size_t>(t.tensor->size());
    }
    return count;
}

std::vector<std::string> VariantClassifier::tensor_names() const {
    std::vector<std::string> names;
    names.reserve(pimpl_->tensors.size());
    for (const auto& t : pimpl_->tensors) {
        names.push_back(t.name);
    }
    return names;
}

Eigen::VectorXf VariantClassifier::forward(const SequenceTensor& input,
                                           const std::atomic<bool>* cancel) const {
    return pimpl_->forward(input, cancel);
}

MlPrediction VariantClassifier::predict(const SequenceTensor& input, bool demo_mode,
                                        const std::atomic<bool>* cancel) const {
    Eigen::VectorXf log_probs = forward(input, cancel);

    MlPrediction prediction;
    prediction.demo_mode = demo_mode;

    Eigen::Index best = 0;
    log_probs.maxCoeff(&best);
    for (size_t i = 0; i < kNumFunctionClasses; ++i) {
        prediction.probabilities[i] = std::exp(static_cast<double>(log_probs(i)));
    }
    prediction.function_class = static_cast<FunctionClass>(best);

    double confidence = prediction.probabilities[best];
    if (demo_mode) {
        confidence = std::min(confidence, kDemoConfidenceCap);
    }
    prediction.confidence = std::round(confidence * 10000.0) / 10000.0;
    return prediction;
}

// ============================================================================
// Checkpoint I/O
//
// gzip stream, native little-endian:
//   char[8]  "PGXCKPT1"
//   int32    input_length, kernel_size, lstm_hidden, lstm_layers, dense_hidden
//   int32    number of conv blocks, then each block's channel count
//   uint32   tensor count
//   per tensor: uint32 name length, name, uint32 rows, uint32 cols,
//               rows * cols float32 in row-major order
// ============================================================================

void VariantClassifier::save_checkpoint(const std::string& path) const {
    gzFile gz = gzopen(path.c_str(), "wb");
    if (!gz) {
        throw CheckpointError("cannot open for writing: " + path);
    }
    GzFileGuard guard(gz);

    const ClassifierConfig& cfg = pimpl_->config;
    if (gzwrite(gz, kCheckpointMagic, sizeof(kCheckpointMagic)) != static_cast<int>(sizeof(kCheckpointMagic))) {
        throw CheckpointError("write failed: " + path);
    }
    write_value<int32_t>(gz, cfg.input_length);
    write_value<int32_t>(gz, cfg.kernel_size);
    write_value<int32_t>(gz, cfg.lstm_hidden);
    write_value<int32_t>(gz, cfg.lstm_layers);
    write_value<int32_t>(gz, cfg.dense_hidden);
    write_value<int32_t>(gz, static_cast<int32_t>(cfg.conv_channels.size()));
    for (int channels : cfg.conv_channels) {
        write_value<int32_t>(gz, channels);
    }

    write_value<uint32_t>(gz, static_cast<uint32_t>(pimpl_->tensors.size()));
    for (const auto& t : pimpl_->tensors) {
        write_value<uint32_t>(gz, static_cast<uint32_t>(t.name.size()));
        if (gzwrite(gz, t.name.data(), static_cast<unsigned>(t.name.size())) !=
            static_cast<int>(t.name.size())) {
            throw CheckpointError("write failed: " + path);
        }
        write_value<uint32_t>(gz, static_cast<uint32_t>(t.tensor->rows()));
        write_value<uint32_t>(gz, static_cast<uint32_t>(t.tensor->cols()));

        RowMajorMatrix row_major = *t.tensor;
        unsigned bytes = static_cast<unsigned>(row_major.size() * sizeof(float));
        if (bytes > 0 && gzwrite(gz, row_major.data(), bytes) != static_cast<int>(bytes)) {
            throw CheckpointError("write failed: " + path);
        }
    }

    if (guard.close() != Z_OK) {
        throw CheckpointError("failed to finalize: " + path);
    }
    log(LogLevel::INFO, "Saved classifier checkpoint: " + path + " (" +
        std::to_string(parameter_count()) + " parameters)");
}

std::unique_ptr<VariantClassifier> VariantClassifier::load_checkpoint(const std::string& path) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        throw CheckpointError("cannot open: " + path);
    }
    GzFileGuard guard(gz);

    char magic[sizeof(kCheckpointMagic)];
    if (gzread(gz, magic, sizeof(magic)) != static_cast<int>(sizeof(magic)) ||
        !std::equal(magic, magic + sizeof(magic), kCheckpointMagic)) {
        throw CheckpointError("not a classifier checkpoint: " + path);
    }

    ClassifierConfig cfg;
    cfg.input_length = read_value<int32_t>(gz);
    cfg.kernel_size = read_value<int32_t>(gz);
    cfg.lstm_hidden = read_value<int32_t>(gz);
    cfg.lstm_layers = read_value<int32_t>(gz);
    cfg.dense_hidden = read_value<int32_t>(gz);
    int32_t num_blocks = read_value<int32_t>(gz);
    if (num_blocks < 1 || num_blocks > 16) {
        throw CheckpointError("implausible convolution block count " + std::to_string(num_blocks));
    }
    cfg.conv_channels.clear();
    for (int32_t b = 0; b < num_blocks; ++b) {
        int32_t channels = read_value<int32_t>(gz);
        check_header_value("conv_channels", channels, kMaxCheckpointWidth);
        cfg.conv_channels.push_back(channels);
    }
    check_header_value("input_length", cfg.input_length, kMaxCheckpointInputLength);
    check_header_value("kernel_size", cfg.kernel_size, kMaxCheckpointInputLength);
    check_header_value("lstm_hidden", cfg.lstm_hidden, kMaxCheckpointWidth);
    check_header_value("lstm_layers", cfg.lstm_layers, kMaxCheckpointLayers);
    check_header_value("dense_hidden", cfg.dense_hidden, kMaxCheckpointWidth);

    std::unique_ptr<VariantClassifier> classifier;
    try {
        classifier = std::make_unique<VariantClassifier>(cfg);
    } catch (const ConfigError& e) {
        throw CheckpointError(std::string("invalid architecture: ") + e.what());
    } catch (const std::bad_alloc&) {
        throw CheckpointError("cannot allocate the architecture in " + path);
    } catch (const std::length_error&) {
        throw CheckpointError("cannot allocate the architecture in " + path);
    }

    std::map<std::string, Matrix*> expected;
    for (auto& t : classifier->pimpl_->tensors) {
        expected[t.name] = t.tensor;
    }

    uint32_t count = read_value<uint32_t>(gz);
    if (count != expected.size()) {
        throw CheckpointError("expected " + std::to_string(expected.size()) +
                              " tensors, found " + std::to_string(count));
    }

    for (uint32_t i = 0; i < count; ++i) {
        uint32_t name_len = read_value<uint32_t>(gz);
        if (name_len == 0 || name_len > 256) {
            throw CheckpointError("corrupt tensor name length");
        }
        std::string name(name_len, '\0');
        read_bytes(gz, &name[0], name_len);

        auto it = expected.find(name);
        if (it == expected.end()) {
            throw CheckpointError("unexpected tensor '" + name + "'");
        }
        Matrix& target = *it->second;

        uint32_t rows = read_value<uint32_t>(gz);
        uint32_t cols = read_value<uint32_t>(gz);
        if (static_cast<Eigen::Index>(rows) != target.rows() ||
            static_cast<Eigen::Index>(cols) != target.cols()) {
            throw CheckpointError("shape mismatch for '" + name + "': expected " +
                                  std::to_string(target.rows()) + "x" + std::to_string(target.cols()) +
                                  ", found " + std::to_string(rows) + "x" + std::to_string(cols));
        }
        if (static_cast<uint64_t>(rows) * cols > kMaxTensorElements) {
            throw CheckpointError("tensor '" + name + "' too large");
        }

        RowMajorMatrix values(rows, cols);
        read_bytes(gz, values.data(), static_cast<size_t>(values.size()) * sizeof(float));
        if (!values.allFinite()) {
            throw CheckpointError("non-finite values in '" + name + "'");
        }
        target = values;
        expected.erase(it);
    }

    return classifier;
}

} // namespace pgx
