#include "config/config.hpp"
#include "core/errors.hpp"
#include "http/internal_server.hpp"
#include "service/pipeline.hpp"
#include "util/log.hpp"
#include "util/text.hpp"
#include "worker/kafka_executor.hpp"
#include "wire/json_codec.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ragquery {
namespace {

constexpr std::size_t kContentPreviewLength = 200;

struct CliOptions {
    bool serve_mode = false;
    bool kafka_worker_mode = false;
    bool health_mode = false;
    std::string answer_question;
    std::string tenant_id = "tenant-001";
    std::string user_id = "cli";
    std::optional<std::string> conversation_id;
    int topk = 10;
};

int run_answer(const Pipeline& pipeline, const CliOptions& options) {
    RagQueryRequest request;
    request.tenant_id = options.tenant_id;
    request.user_id = options.user_id;
    request.query = options.answer_question;
    request.conversation_id = options.conversation_id;
    request.options.top_k = options.topk;

    // Deltas go straight to stdout; the rest is printed once the stream ends.
    std::vector<std::string> sources;
    std::optional<AnswerMetadata> metadata;
    std::optional<Failed> failure;
    const auto outcome = pipeline.orchestrator->handle(
        request,
        [&](const GenerationEvent& event) {
            if (const auto* delta = std::get_if<TextDelta>(&event)) {
                std::cout << delta->text << std::flush;
            } else if (const auto* announced = std::get_if<SourcesAnnounced>(&event)) {
                sources = announced->chunk_ids;
            } else if (const auto* completed = std::get_if<Completed>(&event)) {
                metadata = completed->metadata;
            } else if (const auto* failed = std::get_if<Failed>(&event)) {
                failure = *failed;
            }
        },
        CancelToken{});
    std::cout << "\n";

    if (failure) {
        log::error(std::string{"answer failed kind="} + error_kind_name(failure->error_kind) +
                   " error=" + failure->message);
        if (!failure->partial_text.empty()) {
            std::cout << "(incomplete answer: " << text::preview(failure->partial_text, kContentPreviewLength)
                      << ")\n";
        }
        return 2;
    }

    std::cout << "\nSources:\n";
    if (sources.empty()) {
        std::cout << "- (no sources)\n";
    } else {
        for (const auto& source : sources) {
            std::cout << "- " << source << "\n";
        }
    }
    if (metadata) {
        std::cout << "\nconversation_id=" << outcome.conversation_id << " provider=" << metadata->provider
                  << " failover=" << metadata->used_failover << " persisted=" << metadata->persisted
                  << " total_ms=" << metadata->timings.total_ms << "\n";
    }
    return 0;
}

int run_health(const Pipeline& pipeline) {
    try {
        const auto detail = pipeline.index->health();
        std::cout << health_to_json(detail, pipeline.generation->provider_status()).dump(2) << "\n";
        return detail.connected ? 0 : 2;
    } catch (const std::exception& ex) {
        log::error(std::string{"health check failed: "} + ex.what());
        return 2;
    }
}

// Returns an exit code when argument parsing fails.
std::optional<int> parse_args(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const auto require_value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                log::error(std::string{flag} + " requires a value");
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--serve") {
            options.serve_mode = true;
        } else if (arg == "--kafka-worker") {
            options.kafka_worker_mode = true;
        } else if (arg == "--health") {
            options.health_mode = true;
        } else if (arg == "--answer") {
            const char* value = require_value("--answer");
            if (!value) {
                return 1;
            }
            options.answer_question = value;
        } else if (arg == "--tenant") {
            const char* value = require_value("--tenant");
            if (!value) {
                return 1;
            }
            options.tenant_id = value;
        } else if (arg == "--user") {
            const char* value = require_value("--user");
            if (!value) {
                return 1;
            }
            options.user_id = value;
        } else if (arg == "--conversation") {
            const char* value = require_value("--conversation");
            if (!value) {
                return 1;
            }
            options.conversation_id = value;
        } else if (arg == "--topk") {
            const char* value = require_value("--topk");
            if (!value) {
                return 1;
            }
            try {
                options.topk = std::stoi(value);
            } catch (const std::exception&) {
                log::error("--topk requires an integer value");
                return 1;
            }
        } else {
            log::error("unknown argument: " + std::string{arg});
            return 1;
        }
    }

    const int modes = static_cast<int>(options.serve_mode) + static_cast<int>(options.kafka_worker_mode) +
                      static_cast<int>(options.health_mode) + static_cast<int>(!options.answer_question.empty());
    if (modes > 1) {
        log::error("--serve, --kafka-worker, --health and --answer are mutually exclusive");
        return 1;
    }
    return std::nullopt;
}

}  // namespace
}  // namespace ragquery

int main(int argc, char** argv) {
    try {
        ragquery::log::info(std::string{"rag-query starting (version "} + ragquery::kVersion + ')');

        ragquery::CliOptions options;
        if (const auto exit_code = ragquery::parse_args(argc, argv, options)) {
            return *exit_code;
        }

        const auto config = ragquery::Config::load();
        const auto pipeline = ragquery::build_pipeline(config);

        if (options.serve_mode) {
            return ragquery::run_http_server(pipeline, config.http_host(), config.http_port());
        }

        if (options.kafka_worker_mode) {
            return ragquery::run_kafka_executor(config, pipeline);
        }

        if (options.health_mode) {
            return ragquery::run_health(pipeline);
        }

        if (!options.answer_question.empty()) {
            return ragquery::run_answer(pipeline, options);
        }

        ragquery::log::info("rag-query exiting (no mode given: --serve, --kafka-worker, --health, --answer <q>)");
        return 0;
    } catch (const std::exception& ex) {
        ragquery::log::error(std::string{"fatal error: "} + ex.what());
        return 1;
    }
}
