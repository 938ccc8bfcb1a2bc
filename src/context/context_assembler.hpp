#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"

namespace ragquery {

// Token estimate is ceil(utf8_bytes / kBytesPerToken). English text averages
// about four bytes per token, so the estimate over-counts ordinary prose.
constexpr int kBytesPerToken = 3;

// Upper bound, in estimated tokens, by which an assembled context may exceed
// its budget (the first-chunk exemption aside).
constexpr int kEstimatorSafetyMargin = 16;

inline constexpr std::string_view kTruncationMarker = " [truncated]";

int estimate_tokens(std::string_view text);

class ContextAssembler {
public:
    explicit ContextAssembler(ContextConfig defaults = {});

    const ContextConfig& defaults() const noexcept { return defaults_; }

    AssembledContext assemble(const std::vector<RetrievedChunk>& chunks) const;
    AssembledContext assemble(const std::vector<RetrievedChunk>& chunks, const ContextConfig& config) const;

    // Whitespace collapse, duplicate-sentence removal and word-boundary
    // truncation to config.max_tokens. optimize(optimize(x)) == optimize(x).
    std::string optimize(std::string_view text) const;
    std::string optimize(std::string_view text, const ContextConfig& config) const;

    // avg_relevance covers every candidate, including the ones filtering
    // discarded. A candidate is used when its rendering under config is a
    // whole chunk_separator-delimited segment of assembled_text.
    ContextStats stats(const std::vector<RetrievedChunk>& chunks,
                       std::string_view assembled_text,
                       const ContextConfig& config) const;

    std::string render(const RetrievedChunk& chunk, const ContextConfig& config) const;

private:
    ContextConfig defaults_;
};

}  // namespace ragquery
