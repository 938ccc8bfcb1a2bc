#include "conversation/in_memory_store.hpp"

#include <algorithm>

namespace ragquery {

InMemoryConversationStore::InMemoryConversationStore(RetentionPolicy retention, NowFn now)
    : retention_(retention), now_(std::move(now)) {}

void InMemoryConversationStore::evict(Conversation& conversation, Clock::time_point now) const {
    const auto cutoff = now - retention_.max_age;
    while (!conversation.turns.empty() && conversation.turns.front().created_at < cutoff) {
        conversation.turns.pop_front();
    }
    while (conversation.turns.size() > retention_.max_turns) {
        conversation.turns.pop_front();
    }
}

ConversationTurn InMemoryConversationStore::append(ConversationTurn turn) {
    const auto now = now_();
    if (turn.created_at == Clock::time_point{}) {
        turn.created_at = now;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = conversations_.try_emplace(Key{turn.tenant_id, turn.conversation_id}).first;
    turn.sequence = it->second.next_sequence++;
    it->second.turns.push_back(turn);
    evict(it->second, now);
    if (it->second.turns.empty()) {
        conversations_.erase(it);
    }
    return turn;
}

std::vector<ConversationTurn> InMemoryConversationStore::recent(const std::string& tenant_id,
                                                                const std::string& conversation_id,
                                                                std::size_t max_turns) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = conversations_.find(Key{tenant_id, conversation_id});
    if (it == conversations_.end()) {
        return {};
    }
    evict(it->second, now_());
    if (it->second.turns.empty()) {
        conversations_.erase(it);
        return {};
    }

    const auto& turns = it->second.turns;
    const std::size_t count = std::min(max_turns, turns.size());
    return std::vector<ConversationTurn>(turns.end() - static_cast<std::ptrdiff_t>(count), turns.end());
}

bool InMemoryConversationStore::erase(const std::string& tenant_id, const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.erase(Key{tenant_id, conversation_id}) > 0;
}

ConversationStats InMemoryConversationStore::stats(const std::string& tenant_id, const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = conversations_.find(Key{tenant_id, conversation_id});
    if (it == conversations_.end()) {
        return {};
    }
    evict(it->second, now_());
    if (it->second.turns.empty()) {
        conversations_.erase(it);
        return {};
    }
    return summarize_turns(std::vector<ConversationTurn>(it->second.turns.begin(), it->second.turns.end()));
}

std::size_t InMemoryConversationStore::conversation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

}  // namespace ragquery
