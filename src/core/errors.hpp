#pragma once

#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace ragquery {

const char* error_kind_name(ErrorKind kind);

// Base for every error the pipeline raises on purpose. Anything else reaching
// the orchestrator is treated as ErrorKind::Internal.
class RagError : public std::runtime_error {
public:
    RagError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidRequestError : public RagError {
public:
    explicit InvalidRequestError(const std::string& message) : RagError(ErrorKind::InvalidRequest, message) {}
};

class EmbeddingError : public RagError {
public:
    explicit EmbeddingError(const std::string& message) : RagError(ErrorKind::EmbeddingUnavailable, message) {}
};

enum class IndexErrorKind { DimensionMismatch, InvalidTenant, InvalidChunk, Unavailable };

const char* index_error_kind_name(IndexErrorKind kind);

class IndexError : public RagError {
public:
    IndexError(IndexErrorKind index_kind, const std::string& message)
        : RagError(index_kind == IndexErrorKind::Unavailable ? ErrorKind::IndexUnavailable
                                                             : ErrorKind::InvalidRequest,
                   message),
          index_kind_(index_kind) {}

    IndexErrorKind index_kind() const noexcept { return index_kind_; }

private:
    IndexErrorKind index_kind_;
};

class ProviderError : public RagError {
public:
    ProviderError(const std::string& message, bool timed_out = false)
        : RagError(ErrorKind::GenerationProviderFailure, message), timed_out_(timed_out) {}

    bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

class StoreError : public RagError {
public:
    explicit StoreError(const std::string& message) : RagError(ErrorKind::StoreUnavailable, message) {}
};

}  // namespace ragquery
