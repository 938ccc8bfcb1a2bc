#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ragquery {

// Turns text into a query vector. Implementations throw EmbeddingError on
// any failure, timeouts included.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> embed(const std::string& text, const std::string& tenant_id) = 0;
    virtual std::size_t dimension() const noexcept = 0;
};

}  // namespace ragquery
