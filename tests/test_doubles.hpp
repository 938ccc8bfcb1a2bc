#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "conversation/in_memory_store.hpp"
#include "core/errors.hpp"
#include "embedding/embedder.hpp"
#include "generation/provider.hpp"
#include "retrieval/retrieval_index.hpp"
#include "service/failure_reporter.hpp"

namespace ragquery::test {

constexpr std::size_t kTestDimension = 4;

inline std::vector<float> axis(std::size_t i, std::size_t dimension = kTestDimension) {
    std::vector<float> v(dimension, 0.0F);
    v[i % dimension] = 1.0F;
    return v;
}

inline Chunk make_chunk(const std::string& tenant_id,
                        const std::string& chunk_id,
                        std::vector<float> embedding,
                        const std::string& content = "content") {
    Chunk chunk;
    chunk.tenant_id = tenant_id;
    chunk.chunk_id = chunk_id;
    chunk.content = content.empty() ? chunk_id : content;
    chunk.embedding = std::move(embedding);
    return chunk;
}

inline RetrievedChunk scored(const std::string& chunk_id, double score, const std::string& content) {
    RetrievedChunk retrieved;
    retrieved.chunk.chunk_id = chunk_id;
    retrieved.chunk.tenant_id = "t1";
    retrieved.chunk.content = content;
    retrieved.relevance_score = score;
    return retrieved;
}

// Embeds every text onto the first axis unless told to fail.
class FakeEmbedder final : public Embedder {
public:
    explicit FakeEmbedder(std::size_t dimension = kTestDimension) : dimension_(dimension) {}

    std::vector<float> embed(const std::string& text, const std::string&) override {
        ++calls;
        last_text = text;
        if (fail) {
            throw EmbeddingError("embedding service down");
        }
        return axis(0, dimension_);
    }

    std::size_t dimension() const noexcept override { return dimension_; }

    bool fail = false;
    int calls = 0;
    std::string last_text;

private:
    std::size_t dimension_;
};

class UnavailableIndex final : public RetrievalIndex {
public:
    void index(const Chunk&) override { throw IndexError(IndexErrorKind::Unavailable, "index offline"); }
    bool tombstone(const std::string&, const std::string&) override {
        throw IndexError(IndexErrorKind::Unavailable, "index offline");
    }
    std::vector<RetrievedChunk> search(const std::string&, const std::vector<float>&, int, double) override {
        ++searches;
        throw IndexError(IndexErrorKind::Unavailable, "index offline");
    }
    bool is_available() override { return false; }
    HealthDetail health() override { return {}; }
    std::size_t dimension() const noexcept override { return kTestDimension; }

    int searches = 0;
};

// In-memory store whose writes, and optionally reads, fail on demand.
class FlakyConversationStore final : public ConversationStore {
public:
    ConversationTurn append(ConversationTurn turn) override {
        ++appends;
        if (fail_append) {
            throw StoreError("store offline");
        }
        return inner.append(std::move(turn));
    }
    std::vector<ConversationTurn> recent(const std::string& tenant_id,
                                         const std::string& conversation_id,
                                         std::size_t max_turns) override {
        if (fail_recent) {
            throw StoreError("store offline");
        }
        return inner.recent(tenant_id, conversation_id, max_turns);
    }
    bool erase(const std::string& tenant_id, const std::string& conversation_id) override {
        return inner.erase(tenant_id, conversation_id);
    }
    ConversationStats stats(const std::string& tenant_id, const std::string& conversation_id) override {
        return inner.stats(tenant_id, conversation_id);
    }
    const RetentionPolicy& retention() const noexcept override { return inner.retention(); }

    InMemoryConversationStore inner;
    bool fail_append = false;
    bool fail_recent = false;
    int appends = 0;
};

class RecordingReporter final : public FailureReporter {
public:
    void report_persist_failure(const PersistFailure& failure) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failures.push_back(failure);
    }

    std::vector<PersistFailure> failures;

private:
    std::mutex mutex_;
};

// Provider that streams the given deltas and completes.
inline Provider scripted_provider(const std::string& name,
                                  std::vector<std::string> deltas,
                                  std::shared_ptr<int> calls = nullptr) {
    return CallbackProvider(name, [deltas = std::move(deltas), calls](const ProviderRequest&, ProviderCall& call) {
        if (calls) {
            ++*calls;
        }
        for (const auto& delta : deltas) {
            if (!call.emit(delta)) {
                return;
            }
        }
    });
}

inline Provider failing_provider(const std::string& name, std::shared_ptr<int> calls = nullptr) {
    return CallbackProvider(name, [name, calls](const ProviderRequest&, ProviderCall&) {
        if (calls) {
            ++*calls;
        }
        throw ProviderError(name + " returned HTTP 500");
    });
}

// Emits the given deltas, then waits until cancelled or out of time.
inline Provider stalling_provider(const std::string& name,
                                  std::vector<std::string> before_stall = {},
                                  std::shared_ptr<int> calls = nullptr) {
    return CallbackProvider(name, [before = std::move(before_stall), calls](const ProviderRequest&, ProviderCall& call) {
        if (calls) {
            ++*calls;
        }
        for (const auto& delta : before) {
            if (!call.emit(delta)) {
                return;
            }
        }
        while (!call.should_stop()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });
}

}  // namespace ragquery::test
