/**
 * Variant Record Loader
 *
 * Parses single-sample VCF (4.1 / 4.2) text into Variant records.
 * Reads plain or gzip-compressed files, or an already-open stream.
 */

#ifndef PGX_VCF_LOADER_HPP
#define PGX_VCF_LOADER_HPP

#include "pgx_engine.hpp"
#include "quality_metrics.hpp"
#include <istream>
#include <string>
#include <vector>
#include <map>
#include <tuple>

namespace pgx {

class VCFLoader {
public:
    /**
     * Parse VCF text from a stream
     * @param input Stream positioned at the first header line
     * @param metrics Receives parsed / malformed counters and the success flag
     * @return Records in file order
     * @throws FormatError if the ##fileformat=VCF signature is missing or no
     *         usable record remains after skipping malformed ones
     */
    static std::vector<Variant> parse(std::istream& input, QualityMetrics& metrics);

    /**
     * Parse a .vcf or .vcf.gz file
     */
    static std::vector<Variant> parse_file(const std::string& path, QualityMetrics& metrics);

    /**
     * Quick signature check on the first line
     */
    static bool has_vcf_signature(const std::string& first_line);

    /**
     * Parse a GT string ("0|1", "1/1", "./.") into (allele1, allele2, phased)
     */
    static std::tuple<int, int, bool> parse_genotype(const std::string& gt);

    static Zygosity zygosity_of(int allele1, int allele2);

    static std::map<std::string, std::string> parse_info(const std::string& info_str);
};

} // namespace pgx

#endif // PGX_VCF_LOADER_HPP
