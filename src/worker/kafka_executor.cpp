#include "worker/kafka_executor.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "mq/kafka_consumer.hpp"
#include "mq/kafka_producer.hpp"
#include "util/log.hpp"
#include "wire/json_codec.hpp"

namespace ragquery {
namespace {

constexpr std::string_view kQueryRequestTopic = "rag_query_request";
constexpr std::string_view kChunkIndexTopic = "rag_chunk_index";
constexpr std::string_view kQueryResultTopic = "rag_query_result";
constexpr std::string_view kFailureTopic = "rag_failed";

constexpr int kPollTimeoutMs = 1000;
constexpr int kMaxRetries = 3;

enum class TaskType { Query, ChunkIndex };

struct RequestContext {
    TaskType type = TaskType::Query;
    std::string request_id;
    std::string trace_id;
    std::string tenant_id;
    std::string topic;
    int partition = 0;
    long long offset = 0;
};

std::string task_type_name(TaskType type) {
    return (type == TaskType::Query) ? "QUERY" : "CHUNK_INDEX";
}

std::string read_payload(const RdKafka::Message& message) {
    if (message.len() == 0 || message.payload() == nullptr) {
        return {};
    }
    const char* ptr = static_cast<const char*>(message.payload());
    return std::string(ptr, ptr + message.len());
}

std::string optional_field(const nlohmann::json& json, const char* field) {
    const auto it = json.find(field);
    if (it == json.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

bool is_retryable(const std::exception& ex) {
    const auto* index_error = dynamic_cast<const IndexError*>(&ex);
    return index_error != nullptr && index_error->index_kind() == IndexErrorKind::Unavailable;
}

template <typename Fn>
auto execute_with_retry(Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1; attempt <= kMaxRetries; ++attempt) {
        try {
            return fn();
        } catch (const std::exception& ex) {
            if (attempt == kMaxRetries || !is_retryable(ex)) {
                throw;
            }
            const auto backoff = std::chrono::milliseconds(500 * attempt);
            std::this_thread::sleep_for(backoff);
        }
    }
    throw std::runtime_error("retry attempts exhausted");
}

std::string classify_error_code(const std::exception& ex) {
    if (const auto* rag = dynamic_cast<const RagError*>(&ex)) {
        return error_kind_name(rag->kind());
    }
    return error_kind_name(ErrorKind::Internal);
}

nlohmann::json envelope(const RequestContext& ctx) {
    nlohmann::json body;
    body["request_id"] = ctx.request_id;
    body["trace_id"] = ctx.trace_id;
    body["type"] = task_type_name(ctx.type);
    return body;
}

void produce_failure(KafkaProducer& producer,
                     const RequestContext& ctx,
                     const std::string& code,
                     const std::string& message) {
    nlohmann::json body = envelope(ctx);
    body["status"] = "ERROR";
    body["error"] = {{"code", code}, {"message", message}};
    producer.send(std::string{kFailureTopic}, body.dump(), ctx.tenant_id);
}

// Completed answers go to the result topic. Anything else, partial text
// included, goes to the failure topic.
void produce_answer(KafkaProducer& producer, const RequestContext& ctx, const QueryAnswer& answer) {
    nlohmann::json body = envelope(ctx);
    body["status"] = answer_status(answer);
    body.update(answer_to_json(answer));
    const bool completed = answer.state == QueryState::Completed;
    producer.send(std::string{completed ? kQueryResultTopic : kFailureTopic}, body.dump(), ctx.tenant_id);
}

void log_completion(const RequestContext& ctx, long latency_ms, bool success, const std::string& code) {
    std::ostringstream oss;
    oss << "kafka_worker type=" << task_type_name(ctx.type) << " request_id=" << ctx.request_id
        << " trace_id=" << ctx.trace_id << " tenant_id=" << ctx.tenant_id << " topic=" << ctx.topic
        << " partition=" << ctx.partition << " offset=" << ctx.offset << " status=" << (success ? "OK" : "ERROR")
        << " code=" << code << " latency_ms=" << latency_ms;
    if (success) {
        log::info(oss.str());
    } else {
        log::error(oss.str());
    }
}

// Returns the error code when the query ended without a complete answer.
std::string handle_query(const Pipeline& pipeline,
                         KafkaProducer& producer,
                         RequestContext& ctx,
                         const nlohmann::json& json) {
    const auto request = request_from_json(json);
    ctx.tenant_id = request.tenant_id;
    const auto answer = pipeline.orchestrator->answer(request);
    produce_answer(producer, ctx, answer);
    if (answer.state == QueryState::Completed) {
        return {};
    }
    return answer.error_kind ? error_kind_name(*answer.error_kind) : std::string{answer_status(answer)};
}

void handle_chunk(const Pipeline& pipeline, RequestContext& ctx, const nlohmann::json& json) {
    const auto record = chunk_record_from_json(json);
    ctx.tenant_id = record.chunk.tenant_id;
    execute_with_retry([&]() { pipeline.index->index(record.chunk); });
    if (record.supersedes && *record.supersedes != record.chunk.chunk_id) {
        execute_with_retry([&]() { return pipeline.index->tombstone(record.chunk.tenant_id, *record.supersedes); });
    }
}

}  // namespace

int run_kafka_executor(const Config& config, const Pipeline& pipeline) {
    try {
        KafkaConsumerSettings settings;
        settings.brokers = config.kafka_brokers();
        settings.group_id = config.kafka_worker_group();
        settings.topics = {std::string{kQueryRequestTopic}, std::string{kChunkIndexTopic}};
        KafkaConsumer consumer(settings);
        auto producer = pipeline.producer ? pipeline.producer : std::make_shared<KafkaProducer>(config.kafka_brokers());

        while (true) {
            auto message = consumer.poll(kPollTimeoutMs);
            if (!message) {
                continue;
            }

            const auto start = std::chrono::steady_clock::now();
            RequestContext ctx;
            ctx.topic = message->topic_name();
            ctx.partition = message->partition();
            ctx.offset = message->offset();

            if (ctx.topic == kQueryRequestTopic) {
                ctx.type = TaskType::Query;
            } else if (ctx.topic == kChunkIndexTopic) {
                ctx.type = TaskType::ChunkIndex;
            } else {
                log::error("kafka_worker received message from unexpected topic: " + ctx.topic);
                try {
                    consumer.commit(*message);
                } catch (const std::exception& ex) {
                    log::error(std::string{"commit failed: "} + ex.what());
                }
                continue;
            }

            bool success = false;
            std::string code = "OK";

            try {
                const auto json = parse_json_body(read_payload(*message));
                ctx.request_id = optional_field(json, "request_id");
                ctx.trace_id = optional_field(json, "trace_id");

                if (ctx.type == TaskType::Query) {
                    const std::string failure = handle_query(pipeline, *producer, ctx, json);
                    success = failure.empty();
                    if (!success) {
                        code = failure;
                    }
                } else {
                    handle_chunk(pipeline, ctx, json);
                    success = true;
                }
            } catch (const std::exception& ex) {
                code = classify_error_code(ex);
                try {
                    produce_failure(*producer, ctx, code, ex.what());
                } catch (const std::exception& produce_ex) {
                    log::error(std::string{"failure report not produced: "} + produce_ex.what());
                }
            }

            try {
                consumer.commit(*message);
            } catch (const std::exception& ex) {
                log::error(std::string{"commit failed: "} + ex.what());
            }

            const auto latency_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
            log_completion(ctx, latency_ms, success, code);
        }
    } catch (const std::exception& ex) {
        log::error(std::string{"kafka executor failed: "} + ex.what());
        return 2;
    }
}

}  // namespace ragquery
