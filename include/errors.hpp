/**
 * Error taxonomy
 *
 * Request-fatal:  FormatError, NoDrugsSpecifiedError, RequestCancelledError
 * Drug-local:     UnsupportedGeneError
 * Variant-local:  InferenceError
 * Startup:        ConfigError, CheckpointError
 */

#ifndef PGX_ERRORS_HPP
#define PGX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pgx {

class PgxError : public std::runtime_error {
public:
    explicit PgxError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Variant file lacks the VCF signature or has no usable record
 */
class FormatError : public PgxError {
public:
    explicit FormatError(const std::string& message)
        : PgxError("Invalid VCF: " + message) {}
};

class NoDrugsSpecifiedError : public PgxError {
public:
    NoDrugsSpecifiedError() : PgxError("No drugs specified for analysis") {}
};

/**
 * A drug maps to no modelled gene, or the gene has no phenotype bands
 */
class UnsupportedGeneError : public PgxError {
public:
    UnsupportedGeneError(const std::string& gene, const std::string& detail)
        : PgxError(detail), gene_(gene) {}

    const std::string& gene() const { return gene_; }

private:
    std::string gene_;
};

/**
 * Classifier could not score a window (bad tensor shape, non-finite output)
 */
class InferenceError : public PgxError {
public:
    explicit InferenceError(const std::string& message)
        : PgxError("Inference failed: " + message) {}
};

class ConfigError : public PgxError {
public:
    explicit ConfigError(const std::string& message)
        : PgxError("Configuration error: " + message) {}
};

class CheckpointError : public PgxError {
public:
    explicit CheckpointError(const std::string& message)
        : PgxError("Checkpoint error: " + message) {}
};

class RequestCancelledError : public PgxError {
public:
    RequestCancelledError() : PgxError("Request cancelled") {}
};

} // namespace pgx

#endif // PGX_ERRORS_HPP
