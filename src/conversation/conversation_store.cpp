#include "conversation/conversation_store.hpp"

#include <algorithm>
#include <unordered_set>

namespace ragquery {

ConversationStats summarize_turns(const std::vector<ConversationTurn>& turns) {
    ConversationStats stats;
    if (turns.empty()) {
        return stats;
    }

    std::unordered_set<std::string> sources;
    std::size_t answer_bytes = 0;
    for (const auto& turn : turns) {
        sources.insert(turn.sources.begin(), turn.sources.end());
        answer_bytes += turn.answer.size();
        if (!stats.oldest || turn.created_at < *stats.oldest) {
            stats.oldest = turn.created_at;
        }
        if (!stats.newest || turn.created_at > *stats.newest) {
            stats.newest = turn.created_at;
        }
    }
    stats.total_turns = turns.size();
    stats.unique_sources = sources.size();
    stats.avg_answer_length = static_cast<double>(answer_bytes) / static_cast<double>(turns.size());
    return stats;
}

}  // namespace ragquery
