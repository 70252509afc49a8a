/**
 * Flanking sequence source implementations
 */

#include "sequence_source.hpp"
#include "pgx_engine.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <zlib.h>

#ifdef PGX_HAVE_HTSLIB
#include <htslib/faidx.h>
#endif

namespace pgx {

namespace {

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

uint64_t fnv1a(const std::string& s) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

} // namespace

// ============================================================================
// SyntheticSequenceSource
// ============================================================================

SyntheticSequenceSource::SyntheticSequenceSource(uint64_t seed) : seed_(seed) {}

char SyntheticSequenceSource::base_at(const std::string& chrom, int pos) const {
    static const char kBases[4] = {'A', 'C', 'G', 'T'};
    if (pos < 1) return 'N';
    uint64_t h = splitmix64(seed_ ^ fnv1a(normalize_chrom(chrom)) ^
                            (static_cast<uint64_t>(pos) * 0x2545f4914f6cdd1dULL));
    return kBases[h & 3];
}

std::string SyntheticSequenceSource::fetch(const std::string& chrom, int start, int end) const {
    if (end < start) return "";
    std::string seq;
    seq.reserve(end - start + 1);
    for (int pos = start; pos <= end; ++pos) {
        seq += base_at(chrom, pos);
    }
    return seq;
}

// ============================================================================
// FastaSequenceSource
// ============================================================================

struct FastaSequenceSource::Impl {
    std::unordered_map<std::string, std::string> sequences;
    std::string fasta_path;

    void add_contig(std::string& chrom, std::string& seq) {
        if (!chrom.empty() && !seq.empty()) {
            sequences[chrom] = std::move(seq);
        }
        seq.clear();
    }

    void consume_line(std::string& line, std::string& current_chrom, std::string& current_seq) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        if (line.empty()) return;

        if (line[0] == '>') {
            add_contig(current_chrom, current_seq);
            size_t space_pos = line.find_first_of(" \t");
            current_chrom = normalize_chrom(line.substr(1, space_pos == std::string::npos
                                                              ? std::string::npos
                                                              : space_pos - 1));
        } else {
            std::transform(line.begin(), line.end(), line.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            current_seq += line;
        }
    }
};

FastaSequenceSource::FastaSequenceSource(const std::string& fasta_path)
    : pimpl_(std::make_unique<Impl>()) {

    pimpl_->fasta_path = fasta_path;
    log(LogLevel::INFO, "Loading reference FASTA into memory: " + fasta_path);

    std::string current_chrom;
    std::string current_seq;

    bool is_gzipped = (fasta_path.size() >= 3 &&
                       fasta_path.substr(fasta_path.size() - 3) == ".gz");

    if (is_gzipped) {
        gzFile gz = gzopen(fasta_path.c_str(), "rb");
        if (!gz) {
            throw std::runtime_error("Cannot open gzipped FASTA file: " + fasta_path);
        }

        char buffer[8192];
        std::string line;
        while (gzgets(gz, buffer, sizeof(buffer)) != nullptr) {
            line += buffer;
            if (line.back() != '\n') continue;   // partial line, keep reading
            pimpl_->consume_line(line, current_chrom, current_seq);
            line.clear();
        }
        if (!line.empty()) {
            pimpl_->consume_line(line, current_chrom, current_seq);
        }
        gzclose(gz);
    } else {
        std::ifstream file(fasta_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open FASTA file: " + fasta_path);
        }

        std::string line;
        while (std::getline(file, line)) {
            pimpl_->consume_line(line, current_chrom, current_seq);
        }
    }

    pimpl_->add_contig(current_chrom, current_seq);

    if (pimpl_->sequences.empty()) {
        throw std::runtime_error("No sequences found in FASTA file: " + fasta_path);
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(pimpl_->sequences.size()) + " contigs");
}

FastaSequenceSource::~FastaSequenceSource() = default;

std::string FastaSequenceSource::name() const {
    return "fasta:" + pimpl_->fasta_path;
}

std::string FastaSequenceSource::fetch(const std::string& chrom, int start, int end) const {
    if (end < start) return "";
    std::string seq(end - start + 1, 'N');

    auto it = pimpl_->sequences.find(normalize_chrom(chrom));
    if (it == pimpl_->sequences.end()) return seq;

    const std::string& contig = it->second;
    int length = static_cast<int>(contig.size());
    for (int pos = std::max(start, 1); pos <= std::min(end, length); ++pos) {
        seq[pos - start] = contig[pos - 1];
    }
    return seq;
}

bool FastaSequenceSource::has_chromosome(const std::string& chrom) const {
    return pimpl_->sequences.count(normalize_chrom(chrom)) > 0;
}

int FastaSequenceSource::get_chromosome_length(const std::string& chrom) const {
    auto it = pimpl_->sequences.find(normalize_chrom(chrom));
    return (it != pimpl_->sequences.end()) ? static_cast<int>(it->second.size()) : 0;
}

// ============================================================================
// IndexedFastaSequenceSource
// ============================================================================

#ifdef PGX_HAVE_HTSLIB

struct IndexedFastaSequenceSource::Impl {
    faidx_t* fai = nullptr;
    std::string fasta_path;
    mutable std::mutex mutex;   // faidx_t is not safe for concurrent reads

    // Contig name as spelled in the index ("chr22" or "22")
    std::string resolve(const std::string& chrom) const {
        if (faidx_has_seq(fai, chrom.c_str())) return chrom;
        std::string norm = normalize_chrom(chrom);
        if (faidx_has_seq(fai, norm.c_str())) return norm;
        std::string prefixed = "chr" + norm;
        if (faidx_has_seq(fai, prefixed.c_str())) return prefixed;
        return "";
    }

    ~Impl() {
        if (fai) fai_destroy(fai);
    }
};

IndexedFastaSequenceSource::IndexedFastaSequenceSource(const std::string& fasta_path)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->fasta_path = fasta_path;
    pimpl_->fai = fai_load(fasta_path.c_str());
    if (!pimpl_->fai) {
        throw std::runtime_error("Cannot load FASTA index for: " + fasta_path);
    }
    log(LogLevel::INFO, "Opened indexed FASTA: " + fasta_path + " (" +
        std::to_string(faidx_nseq(pimpl_->fai)) + " contigs)");
}

IndexedFastaSequenceSource::~IndexedFastaSequenceSource() = default;

std::string IndexedFastaSequenceSource::name() const {
    return "faidx:" + pimpl_->fasta_path;
}

std::string IndexedFastaSequenceSource::fetch(const std::string& chrom, int start, int end) const {
    if (end < start) return "";
    std::string seq(end - start + 1, 'N');

    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    std::string contig = pimpl_->resolve(chrom);
    if (contig.empty()) return seq;

    int first = std::max(start, 1);
    hts_pos_t len = 0;
    // faidx coordinates are 0-based inclusive
    char* raw = faidx_fetch_seq64(pimpl_->fai, contig.c_str(), first - 1, end - 1, &len);
    if (!raw) return seq;

    for (hts_pos_t i = 0; i < len && (first - start + i) < static_cast<hts_pos_t>(seq.size()); ++i) {
        seq[first - start + i] = static_cast<char>(std::toupper(static_cast<unsigned char>(raw[i])));
    }
    free(raw);
    return seq;
}

#endif // PGX_HAVE_HTSLIB

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<SequenceSource> create_sequence_source(const std::string& fasta_path, bool indexed) {
    if (fasta_path.empty()) {
        log(LogLevel::INFO, "Using synthetic flanking sequence (not reference genome)");
        return std::make_shared<SyntheticSequenceSource>();
    }

#ifdef PGX_HAVE_HTSLIB
    if (indexed) {
        return std::make_shared<IndexedFastaSequenceSource>(fasta_path);
    }
#else
    if (indexed) {
        log(LogLevel::WARNING, "faidx support not compiled in. Build with htslib. "
                              "Falling back to in-memory loading for: " + fasta_path);
    }
#endif

    return std::make_shared<FastaSequenceSource>(fasta_path);
}

} // namespace pgx
