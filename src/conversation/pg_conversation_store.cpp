#include "conversation/pg_conversation_store.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "util/time.hpp"

namespace ragquery {
namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS rag_conversation ("
    "  tenant_id TEXT NOT NULL,"
    "  conversation_id TEXT NOT NULL,"
    "  next_sequence BIGINT NOT NULL,"
    "  PRIMARY KEY (tenant_id, conversation_id));"
    "CREATE TABLE IF NOT EXISTS rag_conversation_turn ("
    "  tenant_id TEXT NOT NULL,"
    "  conversation_id TEXT NOT NULL,"
    "  sequence BIGINT NOT NULL,"
    "  user_id TEXT NOT NULL,"
    "  question TEXT NOT NULL,"
    "  answer TEXT NOT NULL,"
    "  sources TEXT NOT NULL,"
    "  created_at_ms BIGINT NOT NULL,"
    "  PRIMARY KEY (tenant_id, conversation_id, sequence));";

std::string sources_to_text(const std::vector<std::string>& sources) {
    return nlohmann::json(sources).dump();
}

std::vector<std::string> sources_from_text(const std::string& text) {
    try {
        return nlohmann::json::parse(text).get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& ex) {
        throw StoreError(std::string{"corrupt sources column: "} + ex.what());
    }
}

std::int64_t age_cutoff_ms(const RetentionPolicy& retention) {
    return time::to_epoch_millis(Clock::now() - retention.max_age);
}

template <typename Fn>
auto with_store_errors(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& ex) {
        throw StoreError(std::string{"postgres "} + operation + " failed: " + ex.what());
    }
}

}  // namespace

PgConversationStore::PgConversationStore(std::shared_ptr<PgConnectionPool> pool, RetentionPolicy retention)
    : pool_(std::move(pool)), retention_(retention) {
    if (!pool_) {
        throw std::invalid_argument("postgres conversation store requires a pool");
    }
}

void PgConversationStore::ensure_schema() {
    with_store_errors("schema", [&] {
        auto connection = pool_->acquire();
        pqxx::work txn{*connection};
        txn.exec(kSchema);
        txn.commit();
    });
}

ConversationTurn PgConversationStore::append(ConversationTurn turn) {
    if (turn.created_at == Clock::time_point{}) {
        turn.created_at = Clock::now();
    }

    return with_store_errors("append", [&] {
        auto connection = pool_->acquire();
        pqxx::work txn{*connection};
        const auto sequence_row = txn.exec_params(
            "INSERT INTO rag_conversation (tenant_id, conversation_id, next_sequence) "
            "VALUES ($1, $2, 2) "
            "ON CONFLICT (tenant_id, conversation_id) "
            "DO UPDATE SET next_sequence = rag_conversation.next_sequence + 1 "
            "RETURNING next_sequence - 1;",
            turn.tenant_id,
            turn.conversation_id);
        turn.sequence = sequence_row[0][0].as<std::int64_t>();

        txn.exec_params(
            "INSERT INTO rag_conversation_turn "
            "(tenant_id, conversation_id, sequence, user_id, question, answer, sources, created_at_ms) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8);",
            turn.tenant_id,
            turn.conversation_id,
            turn.sequence,
            turn.user_id,
            turn.question,
            turn.answer,
            sources_to_text(turn.sources),
            time::to_epoch_millis(turn.created_at));

        // Sequences are contiguous, so the count cap is a sequence cutoff.
        txn.exec_params(
            "DELETE FROM rag_conversation_turn "
            "WHERE tenant_id = $1 AND conversation_id = $2 "
            "AND (sequence <= $3 OR created_at_ms < $4);",
            turn.tenant_id,
            turn.conversation_id,
            turn.sequence - static_cast<std::int64_t>(retention_.max_turns),
            age_cutoff_ms(retention_));
        txn.commit();
        return turn;
    });
}

std::vector<ConversationTurn> PgConversationStore::load_turns(const std::string& tenant_id,
                                                              const std::string& conversation_id,
                                                              std::size_t limit) {
    auto connection = pool_->acquire();
    pqxx::work txn{*connection};
    txn.exec_params(
        "DELETE FROM rag_conversation_turn "
        "WHERE tenant_id = $1 AND conversation_id = $2 AND created_at_ms < $3;",
        tenant_id,
        conversation_id,
        age_cutoff_ms(retention_));
    const auto result = txn.exec_params(
        "SELECT sequence, user_id, question, answer, sources, created_at_ms "
        "FROM rag_conversation_turn "
        "WHERE tenant_id = $1 AND conversation_id = $2 "
        "ORDER BY sequence DESC "
        "LIMIT $3;",
        tenant_id,
        conversation_id,
        static_cast<std::int64_t>(std::min(limit, retention_.max_turns)));
    txn.commit();

    std::vector<ConversationTurn> turns;
    turns.reserve(result.size());
    for (const auto& row : result) {
        ConversationTurn turn;
        turn.tenant_id = tenant_id;
        turn.conversation_id = conversation_id;
        turn.sequence = row[0].as<std::int64_t>();
        turn.user_id = row[1].c_str();
        turn.question = row[2].c_str();
        turn.answer = row[3].c_str();
        turn.sources = sources_from_text(row[4].c_str());
        turn.created_at = time::from_epoch_millis(row[5].as<std::int64_t>());
        turns.push_back(std::move(turn));
    }
    std::reverse(turns.begin(), turns.end());
    return turns;
}

std::vector<ConversationTurn> PgConversationStore::recent(const std::string& tenant_id,
                                                          const std::string& conversation_id,
                                                          std::size_t max_turns) {
    if (max_turns == 0) {
        return {};
    }
    return with_store_errors("recent", [&] { return load_turns(tenant_id, conversation_id, max_turns); });
}

bool PgConversationStore::erase(const std::string& tenant_id, const std::string& conversation_id) {
    return with_store_errors("erase", [&] {
        auto connection = pool_->acquire();
        pqxx::work txn{*connection};
        const auto turns = txn.exec_params(
            "DELETE FROM rag_conversation_turn WHERE tenant_id = $1 AND conversation_id = $2;",
            tenant_id,
            conversation_id);
        const auto header = txn.exec_params(
            "DELETE FROM rag_conversation WHERE tenant_id = $1 AND conversation_id = $2;",
            tenant_id,
            conversation_id);
        txn.commit();
        return turns.affected_rows() > 0 || header.affected_rows() > 0;
    });
}

ConversationStats PgConversationStore::stats(const std::string& tenant_id, const std::string& conversation_id) {
    return with_store_errors("stats", [&] {
        return summarize_turns(load_turns(tenant_id, conversation_id, retention_.max_turns));
    });
}

}  // namespace ragquery
