#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "conversation/conversation_store.hpp"

namespace ragquery {

class InMemoryConversationStore final : public ConversationStore {
public:
    using NowFn = std::function<Clock::time_point()>;

    explicit InMemoryConversationStore(RetentionPolicy retention = {}, NowFn now = &Clock::now);

    ConversationTurn append(ConversationTurn turn) override;
    std::vector<ConversationTurn> recent(const std::string& tenant_id,
                                         const std::string& conversation_id,
                                         std::size_t max_turns) override;
    bool erase(const std::string& tenant_id, const std::string& conversation_id) override;
    ConversationStats stats(const std::string& tenant_id, const std::string& conversation_id) override;
    const RetentionPolicy& retention() const noexcept override { return retention_; }

    // Conversations whose every turn has aged out are dropped, and a later
    // append starts again at sequence 1.
    std::size_t conversation_count() const;

private:
    using Key = std::pair<std::string, std::string>;

    struct Conversation {
        std::deque<ConversationTurn> turns;
        std::int64_t next_sequence = 1;
    };

    // Caller holds mutex_.
    void evict(Conversation& conversation, Clock::time_point now) const;

    RetentionPolicy retention_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<Key, Conversation> conversations_;
};

}  // namespace ragquery
