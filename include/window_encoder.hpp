/**
 * Sequence Window Encoder
 *
 * Builds a variant-centred nucleotide window of odd length (2 * flank + 1)
 * with the ALT base at the centre, and one-hot encodes it as a
 * 4 x window_length matrix (rows A, C, G, T; N is an all-zero column).
 */

#ifndef PGX_WINDOW_ENCODER_HPP
#define PGX_WINDOW_ENCODER_HPP

#include "pgx_engine.hpp"
#include "sequence_source.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace pgx {

/**
 * Encoded window, channels x positions
 */
using SequenceTensor = Eigen::MatrixXf;

constexpr int kDefaultFlankLength = 50;

class WindowEncoder {
public:
    explicit WindowEncoder(std::shared_ptr<const SequenceSource> source,
                           int flank_length = kDefaultFlankLength);

    /**
     * Encode the window around a variant. Identical (chrom, pos, ref, alt)
     * always gives an identical tensor.
     */
    SequenceTensor encode(const Variant& variant) const;

    /**
     * Window nucleotides (upper-case, ALT substituted at the centre)
     */
    std::string window_sequence(const Variant& variant) const;

    /**
     * One-hot encode an arbitrary nucleotide string
     */
    static SequenceTensor one_hot(const std::string& sequence);

    /**
     * Base placed at the centre: first ALT base, else first REF base, else N
     */
    static char centre_base(const std::string& ref, const std::string& alt);

    int flank_length() const { return flank_; }
    int window_length() const { return 2 * flank_ + 1; }
    const SequenceSource& source() const { return *source_; }

private:
    std::shared_ptr<const SequenceSource> source_;
    int flank_;
};

} // namespace pgx

#endif // PGX_WINDOW_ENCODER_HPP
