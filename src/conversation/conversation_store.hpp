#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace ragquery {

struct RetentionPolicy {
    std::size_t max_turns = 20;
    std::chrono::seconds max_age = std::chrono::hours(24);
};

struct ConversationStats {
    std::size_t total_turns = 0;
    std::size_t unique_sources = 0;
    std::optional<Clock::time_point> oldest;
    std::optional<Clock::time_point> newest;
    double avg_answer_length = 0.0;
};

// Append-only turn history keyed by (tenant_id, conversation_id). Retention
// is applied lazily: turns beyond max_turns or older than max_age are
// evicted on the next append or read of that conversation.
class ConversationStore {
public:
    virtual ~ConversationStore() = default;

    // Returns the stored turn with its sequence assigned. Throws StoreError.
    virtual ConversationTurn append(ConversationTurn turn) = 0;

    // Last max_turns turns, oldest first. Unknown conversations yield an
    // empty list. Throws StoreError.
    virtual std::vector<ConversationTurn> recent(const std::string& tenant_id,
                                                 const std::string& conversation_id,
                                                 std::size_t max_turns) = 0;

    // False when nothing was stored under the key.
    virtual bool erase(const std::string& tenant_id, const std::string& conversation_id) = 0;

    virtual ConversationStats stats(const std::string& tenant_id, const std::string& conversation_id) = 0;

    virtual const RetentionPolicy& retention() const noexcept = 0;
};

// Shared by the implementations so both report the same numbers.
ConversationStats summarize_turns(const std::vector<ConversationTurn>& turns);

}  // namespace ragquery
