/**
 * Sequence Window Encoder implementation
 */

#include "window_encoder.hpp"
#include "errors.hpp"
#include <cctype>

namespace pgx {

namespace {

int base_index(char base) {
    switch (std::toupper(static_cast<unsigned char>(base))) {
        case 'A': return 0;
        case 'C': return 1;
        case 'G': return 2;
        case 'T': return 3;
        default:  return -1;
    }
}

} // namespace

WindowEncoder::WindowEncoder(std::shared_ptr<const SequenceSource> source, int flank_length)
    : source_(std::move(source)), flank_(flank_length) {
    if (!source_) {
        throw ConfigError("window encoder requires a sequence source");
    }
    if (flank_ < 1) {
        throw ConfigError("flank_length must be positive, got " + std::to_string(flank_));
    }
}

char WindowEncoder::centre_base(const std::string& ref, const std::string& alt) {
    if (!alt.empty() && base_index(alt[0]) >= 0) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(alt[0])));
    }
    if (!ref.empty() && base_index(ref[0]) >= 0) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(ref[0])));
    }
    return 'N';
}

std::string WindowEncoder::window_sequence(const Variant& variant) const {
    int start = variant.pos - flank_;
    int end = variant.pos + flank_;
    std::string seq = source_->fetch(variant.chrom, start, end);

    // Sources pad with N, but guard against a short read
    seq.resize(window_length(), 'N');
    seq[flank_] = centre_base(variant.ref, variant.alt);
    return seq;
}

SequenceTensor WindowEncoder::one_hot(const std::string& sequence) {
    SequenceTensor tensor = SequenceTensor::Zero(4, static_cast<Eigen::Index>(sequence.size()));
    for (size_t i = 0; i < sequence.size(); ++i) {
        int idx = base_index(sequence[i]);
        if (idx >= 0) {
            tensor(idx, static_cast<Eigen::Index>(i)) = 1.0f;
        }
    }
    return tensor;
}

SequenceTensor WindowEncoder::encode(const Variant& variant) const {
    return one_hot(window_sequence(variant));
}

} // namespace pgx
