/**
 * Flanking Sequence Sources
 *
 * Swappable providers of reference sequence for the window encoder:
 * - SyntheticSequenceSource:     deterministic per-position pseudo-sequence (default)
 * - FastaSequenceSource:         whole FASTA (.fa / .fa.gz) held in memory
 * - IndexedFastaSequenceSource:  on-disk faidx access (requires htslib)
 */

#ifndef PGX_SEQUENCE_SOURCE_HPP
#define PGX_SEQUENCE_SOURCE_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace pgx {

class SequenceSource {
public:
    virtual ~SequenceSource() = default;

    virtual std::string name() const = 0;

    /**
     * Get sequence for a 1-based inclusive range
     * @return Upper-case sequence of exactly (end - start + 1) bases.
     *         Positions outside the contig (or an unknown contig) are 'N'.
     */
    virtual std::string fetch(const std::string& chrom, int start, int end) const = 0;
};

// ============================================================================
// Synthetic
// ============================================================================

/**
 * Pseudo-sequence derived from a hash of (chromosome, position). Not real
 * genomic sequence: identical coordinates always give identical bases, and
 * overlapping windows agree on shared positions.
 */
class SyntheticSequenceSource : public SequenceSource {
public:
    explicit SyntheticSequenceSource(uint64_t seed = 0x5047585249534bULL);

    std::string name() const override { return "synthetic"; }
    std::string fetch(const std::string& chrom, int start, int end) const override;

    char base_at(const std::string& chrom, int pos) const;

private:
    uint64_t seed_;
};

// ============================================================================
// In-memory FASTA
// ============================================================================

class FastaSequenceSource : public SequenceSource {
public:
    /**
     * Load every contig of a FASTA file
     * @param fasta_path Path to .fa or .fa.gz file
     */
    explicit FastaSequenceSource(const std::string& fasta_path);
    ~FastaSequenceSource() override;

    FastaSequenceSource(const FastaSequenceSource&) = delete;
    FastaSequenceSource& operator=(const FastaSequenceSource&) = delete;

    std::string name() const override;
    std::string fetch(const std::string& chrom, int start, int end) const override;

    bool has_chromosome(const std::string& chrom) const;
    int get_chromosome_length(const std::string& chrom) const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

// ============================================================================
// Indexed FASTA (htslib faidx)
// ============================================================================

#ifdef PGX_HAVE_HTSLIB
class IndexedFastaSequenceSource : public SequenceSource {
public:
    /**
     * Open a bgzip or plain FASTA with a .fai index (built if absent)
     */
    explicit IndexedFastaSequenceSource(const std::string& fasta_path);
    ~IndexedFastaSequenceSource() override;

    IndexedFastaSequenceSource(const IndexedFastaSequenceSource&) = delete;
    IndexedFastaSequenceSource& operator=(const IndexedFastaSequenceSource&) = delete;

    std::string name() const override;
    std::string fetch(const std::string& chrom, int start, int end) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};
#endif

/**
 * Create a sequence source
 * @param fasta_path Empty for the synthetic source
 * @param indexed Prefer faidx access; falls back to in-memory loading when
 *        htslib support is not compiled in
 */
std::shared_ptr<SequenceSource> create_sequence_source(const std::string& fasta_path, bool indexed);

} // namespace pgx

#endif // PGX_SEQUENCE_SOURCE_HPP
