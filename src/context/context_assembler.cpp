#include "context/context_assembler.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <unordered_set>
#include <utility>

#include "util/log.hpp"
#include "util/text.hpp"

namespace ragquery {
namespace {

constexpr std::string_view kSentenceBreak = ". ";
constexpr std::array<std::string_view, 6> kContextMetadataKeys = {"section", "page",  "chapter",
                                                                  "author",  "date", "category"};

std::string scalar_to_string(const MetadataValue& value) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                oss << (v ? "true" : "false");
            } else {
                oss << v;
            }
        },
        value);
    return oss.str();
}

const std::string* metadata_string(const Metadata& metadata, const char* key) {
    const auto it = metadata.find(key);
    if (it == metadata.end()) {
        return nullptr;
    }
    return std::get_if<std::string>(&it->second);
}

bool is_context_metadata(const std::string& key) {
    return std::find(kContextMetadataKeys.begin(), kContextMetadataKeys.end(), key) != kContextMetadataKeys.end();
}

std::string dedupe_sentences(std::string_view text) {
    std::vector<std::string_view> kept;
    std::unordered_set<std::string_view> seen;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = text.find(kSentenceBreak, start);
        const std::string_view sentence =
            text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (seen.insert(sentence).second) {
            kept.push_back(sentence);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + kSentenceBreak.size();
    }

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            out.append(kSentenceBreak);
        }
        out.append(kept[i]);
    }
    return out;
}

// Collapse and dedupe until neither changes the text. Each non-final round
// strictly shortens it.
std::string normalize(std::string_view text) {
    std::string current = text::collapse_whitespace(text);
    while (true) {
        std::string next = text::collapse_whitespace(dedupe_sentences(current));
        if (next == current) {
            return current;
        }
        current = std::move(next);
    }
}

std::string truncate_to_budget(const std::string& text, int budget_tokens) {
    const std::string_view bare_marker = kTruncationMarker.substr(1);
    const long target = static_cast<long>(budget_tokens) * kBytesPerToken - static_cast<long>(kTruncationMarker.size());
    if (target <= 0) {
        return std::string{bare_marker};
    }

    const std::size_t cut = text::utf8_floor(text, static_cast<std::size_t>(target));
    std::size_t end = cut;
    const std::size_t space = text.rfind(' ', cut);
    if (space != std::string::npos && space > 0) {
        end = space;
    }
    if (end == 0) {
        return std::string{bare_marker};
    }
    return text.substr(0, end) + std::string{kTruncationMarker};
}

}  // namespace

int estimate_tokens(std::string_view text) {
    return static_cast<int>((text.size() + kBytesPerToken - 1) / kBytesPerToken);
}

ContextAssembler::ContextAssembler(ContextConfig defaults) : defaults_(std::move(defaults)) {}

AssembledContext ContextAssembler::assemble(const std::vector<RetrievedChunk>& chunks) const {
    return assemble(chunks, defaults_);
}

AssembledContext ContextAssembler::assemble(const std::vector<RetrievedChunk>& chunks,
                                            const ContextConfig& config) const {
    AssembledContext result;
    if (chunks.empty()) {
        log::debug("context assembly skipped: no candidates");
        return result;
    }

    std::vector<const RetrievedChunk*> relevant;
    relevant.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        if (chunk.relevance_score >= config.relevance_threshold) {
            relevant.push_back(&chunk);
        }
    }
    if (relevant.empty()) {
        std::ostringstream oss;
        oss << "context assembly: no candidate clears relevance_threshold=" << config.relevance_threshold
            << " candidates=" << chunks.size();
        log::warn(oss.str());
        return result;
    }

    std::stable_sort(relevant.begin(), relevant.end(), [](const RetrievedChunk* a, const RetrievedChunk* b) {
        return a->relevance_score > b->relevance_score;
    });

    const int separator_tokens = estimate_tokens(config.chunk_separator);
    int used_tokens = 0;
    std::unordered_set<std::string> seen_content;
    std::size_t duplicates = 0;
    for (const auto* chunk : relevant) {
        // Identical content under different ids is rendered once; the
        // higher-scored copy wins.
        if (!seen_content.insert(text::collapse_whitespace(chunk->chunk.content)).second) {
            ++duplicates;
            continue;
        }
        const std::string rendered = render(*chunk, config);
        const int cost = estimate_tokens(rendered) + (result.used_chunk_ids.empty() ? 0 : separator_tokens);
        if (!result.used_chunk_ids.empty() && used_tokens + cost > config.max_tokens) {
            std::ostringstream oss;
            oss << "context token budget reached used=" << result.used_chunk_ids.size() << '/' << relevant.size()
                << " tokens=" << used_tokens << " max_tokens=" << config.max_tokens;
            log::debug(oss.str());
            break;
        }
        if (!result.used_chunk_ids.empty()) {
            result.text.append(config.chunk_separator);
        }
        result.text.append(rendered);
        result.used_chunk_ids.push_back(chunk->chunk.chunk_id);
        used_tokens += cost;
    }

    double relevance_sum = 0.0;
    for (const auto& chunk : chunks) {
        relevance_sum += chunk.relevance_score;
    }
    result.stats.total_candidates = static_cast<int>(chunks.size());
    result.stats.used_candidates = static_cast<int>(result.used_chunk_ids.size());
    result.stats.estimated_tokens = estimate_tokens(result.text);
    result.stats.avg_relevance = relevance_sum / static_cast<double>(chunks.size());
    result.stats.max_tokens = config.max_tokens;

    std::ostringstream oss;
    oss << "context assembled used=" << result.stats.used_candidates << " candidates=" << result.stats.total_candidates
        << " duplicates=" << duplicates << " estimated_tokens=" << result.stats.estimated_tokens;
    log::debug(oss.str());
    return result;
}

std::string ContextAssembler::render(const RetrievedChunk& chunk, const ContextConfig& config) const {
    std::ostringstream out;
    const Metadata& metadata = chunk.chunk.metadata;

    if (config.include_metadata) {
        if (const auto* title = metadata_string(metadata, "title")) {
            out << "Document: " << *title << '\n';
            if (const auto* type = metadata_string(metadata, "document_type")) {
                out << "Type: " << *type << '\n';
            }
            out << "Relevance: " << std::fixed << std::setprecision(2) << chunk.relevance_score << '\n';
            out << "---\n";
        }
    }

    out << chunk.chunk.content;

    if (config.include_metadata) {
        std::string tags;
        for (const auto& [key, value] : metadata) {
            if (is_context_metadata(key)) {
                tags += key + '=' + scalar_to_string(value) + ' ';
            }
        }
        if (!tags.empty()) {
            tags.pop_back();
            out << "\n[Metadata: " << tags << ']';
        }
    }
    return out.str();
}

std::string ContextAssembler::optimize(std::string_view text) const { return optimize(text, defaults_); }

std::string ContextAssembler::optimize(std::string_view text, const ContextConfig& config) const {
    std::string out = normalize(text);
    if (config.max_tokens <= 0) {
        return out;
    }

    const int budget = std::max(config.max_tokens, estimate_tokens(kTruncationMarker.substr(1)));
    if (estimate_tokens(out) > budget) {
        const int before = estimate_tokens(out);
        out = normalize(truncate_to_budget(out, budget));
        std::ostringstream oss;
        oss << "context truncated from " << before << " to " << estimate_tokens(out) << " estimated tokens";
        log::debug(oss.str());
    }
    return out;
}

ContextStats ContextAssembler::stats(const std::vector<RetrievedChunk>& chunks,
                                     std::string_view assembled_text,
                                     const ContextConfig& config) const {
    ContextStats stats;
    stats.max_tokens = config.max_tokens;
    if (chunks.empty()) {
        return stats;
    }

    // A candidate counts as used when its rendering is one whole segment of
    // the text. Each segment is claimed by at most one candidate.
    std::unordered_multiset<std::string_view> segments;
    if (!assembled_text.empty()) {
        std::size_t start = 0;
        while (true) {
            const std::size_t pos = config.chunk_separator.empty()
                                        ? std::string_view::npos
                                        : assembled_text.find(config.chunk_separator, start);
            segments.insert(assembled_text.substr(
                start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
            if (pos == std::string_view::npos) {
                break;
            }
            start = pos + config.chunk_separator.size();
        }
    }

    double relevance_sum = 0.0;
    for (const auto& chunk : chunks) {
        relevance_sum += chunk.relevance_score;
        if (chunk.relevance_score < config.relevance_threshold) {
            continue;
        }
        const std::string rendered = render(chunk, config);
        if (const auto it = segments.find(rendered); it != segments.end()) {
            segments.erase(it);
            ++stats.used_candidates;
        }
    }
    stats.total_candidates = static_cast<int>(chunks.size());
    stats.estimated_tokens = estimate_tokens(assembled_text);
    stats.avg_relevance = relevance_sum / static_cast<double>(chunks.size());
    return stats;
}

}  // namespace ragquery
