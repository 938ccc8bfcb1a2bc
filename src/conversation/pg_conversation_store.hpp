#pragma once

#include <memory>
#include <string>
#include <vector>

#include "conversation/conversation_store.hpp"
#include "db/pg_pool.hpp"

namespace ragquery
{

    // Turns live in rag_conversation_turn; rag_conversation hands out the
    // per-conversation sequence under a row lock.
    class PgConversationStore final : public ConversationStore
    {
    public:
        PgConversationStore(std::shared_ptr<PgConnectionPool> pool, RetentionPolicy retention);

        // Creates the tables when missing. Throws StoreError.
        void ensure_schema();

        ConversationTurn append(ConversationTurn turn) override;
        std::vector<ConversationTurn> recent(const std::string &tenant_id,
                                             const std::string &conversation_id,
                                             std::size_t max_turns) override;
        bool erase(const std::string &tenant_id, const std::string &conversation_id) override;
        ConversationStats stats(const std::string &tenant_id, const std::string &conversation_id) override;
        const RetentionPolicy &retention() const noexcept override { return retention_; }

    private:
        std::vector<ConversationTurn> load_turns(const std::string &tenant_id,
                                                 const std::string &conversation_id,
                                                 std::size_t limit);

        std::shared_ptr<PgConnectionPool> pool_;
        RetentionPolicy retention_;
    };

} // namespace ragquery
