#include "retrieval/retrieval_index.hpp"

#include "core/errors.hpp"
#include "util/text.hpp"

namespace ragquery {
namespace {

constexpr std::size_t kMaxTenantIdLength = 64;

}  // namespace

void validate_tenant_id(const std::string& tenant_id) {
    if (tenant_id.empty()) {
        throw IndexError(IndexErrorKind::InvalidTenant, "tenant_id must not be empty");
    }
    if (!text::is_identifier(tenant_id, kMaxTenantIdLength)) {
        throw IndexError(IndexErrorKind::InvalidTenant, "tenant_id contains unsupported characters: " + tenant_id);
    }
}

void validate_chunk(const Chunk& chunk, std::size_t dimension) {
    validate_tenant_id(chunk.tenant_id);
    if (chunk.chunk_id.empty()) {
        throw IndexError(IndexErrorKind::InvalidChunk, "chunk_id must not be empty");
    }
    if (chunk.embedding.size() != dimension) {
        throw IndexError(IndexErrorKind::DimensionMismatch,
                         "embedding dimension " + std::to_string(chunk.embedding.size()) + " != index dimension " +
                             std::to_string(dimension));
    }
}

void validate_query_embedding(const std::vector<float>& embedding, std::size_t dimension) {
    if (embedding.size() != dimension) {
        throw IndexError(IndexErrorKind::DimensionMismatch,
                         "query embedding dimension " + std::to_string(embedding.size()) + " != index dimension " +
                             std::to_string(dimension));
    }
}

}  // namespace ragquery
