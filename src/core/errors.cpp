#include "core/errors.hpp"

namespace ragquery {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest:
            return "INVALID_REQUEST";
        case ErrorKind::EmbeddingUnavailable:
            return "EMBEDDING_UNAVAILABLE";
        case ErrorKind::IndexUnavailable:
            return "INDEX_UNAVAILABLE";
        case ErrorKind::GenerationProviderFailure:
            return "GENERATION_PROVIDER_FAILURE";
        case ErrorKind::StoreUnavailable:
            return "STORE_UNAVAILABLE";
        case ErrorKind::Internal:
            return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

const char* index_error_kind_name(IndexErrorKind kind) {
    switch (kind) {
        case IndexErrorKind::DimensionMismatch:
            return "DIMENSION_MISMATCH";
        case IndexErrorKind::InvalidTenant:
            return "INVALID_TENANT";
        case IndexErrorKind::InvalidChunk:
            return "INVALID_CHUNK";
        case IndexErrorKind::Unavailable:
            return "INDEX_UNAVAILABLE";
    }
    return "UNKNOWN";
}

}  // namespace ragquery
