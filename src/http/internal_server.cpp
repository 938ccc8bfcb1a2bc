#include "http/internal_server.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "util/log.hpp"
#include "util/time.hpp"
#include "util/uuid.hpp"
#include "wire/json_codec.hpp"

namespace ragquery
{
    namespace
    {

        constexpr std::string_view kJson = "application/json";
        constexpr const char *kEventStream = "text/event-stream";
        constexpr const char *kTenantChunkPath = R"(/internal/tenants/([A-Za-z0-9_-]+)/chunks/([^/]+))";
        constexpr const char *kConversationPath = R"(/internal/tenants/([A-Za-z0-9_-]+)/conversations/([A-Za-z0-9_-]+))";

        struct HttpError
        {
            int status = 500;
            std::string code = "INTERNAL";
            std::string message = "internal server error";
        };

        HttpError classify_exception(const std::exception &ex)
        {
            if (const auto *rag = dynamic_cast<const RagError *>(&ex))
            {
                return HttpError{http_status_for(rag->kind()), error_kind_name(rag->kind()), rag->what()};
            }
            return HttpError{500, error_kind_name(ErrorKind::Internal), ex.what()};
        }

        void set_error_response(httplib::Response &res, const HttpError &error)
        {
            res.status = error.status;
            res.set_content(error_to_json(error.code, error.message).dump(), std::string{kJson});
        }

        void set_success(httplib::Response &res, const nlohmann::json &json, int status = 200)
        {
            res.status = status;
            res.set_content(json.dump(), std::string{kJson});
        }

        std::string sse_frame(const GenerationEvent &event)
        {
            std::string frame = "event: ";
            frame += event_name(event);
            frame += "\ndata: ";
            frame += event_to_json(event).dump();
            frame += "\n\n";
            return frame;
        }

        void log_request(const std::string &action,
                         const std::string &trace_id,
                         const std::string &tenant_id,
                         std::chrono::steady_clock::time_point start,
                         int status)
        {
            std::ostringstream oss;
            oss << action << " trace_id=" << trace_id << " tenant_id=" << tenant_id << " status=" << status
                << " latency_ms=" << time::elapsed_ms(start);
            log::info(oss.str());
        }

        // Runs one handler body, turning exceptions into error responses and
        // logging the request either way.
        template <typename Fn>
        void serve(const char *action,
                   const httplib::Request &req,
                   httplib::Response &res,
                   std::string tenant_id,
                   Fn &&fn)
        {
            const auto trace_id = uuid::generate();
            const auto start = std::chrono::steady_clock::now();
            try
            {
                fn(tenant_id);
            }
            catch (const std::exception &ex)
            {
                const auto error = classify_exception(ex);
                set_error_response(res, error);
                std::ostringstream oss;
                oss << action << " trace_id=" << trace_id << " path=" << req.path << " failed: " << ex.what();
                if (error.status >= 500)
                {
                    log::error(oss.str());
                }
                else
                {
                    log::warn(oss.str());
                }
            }
            log_request(action, trace_id, tenant_id, start, res.status);
        }

    } // namespace

    int http_status_for(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::InvalidRequest:
            return 400;
        case ErrorKind::EmbeddingUnavailable:
        case ErrorKind::IndexUnavailable:
        case ErrorKind::StoreUnavailable:
            return 503;
        case ErrorKind::GenerationProviderFailure:
            return 502;
        case ErrorKind::Internal:
            return 500;
        }
        return 500;
    }

    int run_http_server(const Pipeline &pipeline, const std::string &host, int port)
    {
        const auto orchestrator = pipeline.orchestrator;
        const auto index = pipeline.index;
        const auto conversations = pipeline.conversations;
        const auto generation = pipeline.generation;

        httplib::Server server;

        server.Post("/internal/query", [&](const httplib::Request &req, httplib::Response &res)
                    { serve("query_http", req, res, {}, [&](std::string &tenant_id) {
            const auto request = request_from_json(parse_json_body(req.body));
            tenant_id = request.tenant_id;
            orchestrator->validate(request);

            const CancelToken cancel;
            res.status = 200;
            res.set_header("Cache-Control", "no-cache");
            res.set_chunked_content_provider(
                kEventStream,
                [orchestrator, request, cancel](std::size_t, httplib::DataSink& sink) {
                    const auto outcome = orchestrator->handle(
                        request,
                        [&sink, &cancel](const GenerationEvent& event) {
                            if (cancel.cancelled()) {
                                return;
                            }
                            const std::string frame = sse_frame(event);
                            if (!sink.write(frame.data(), frame.size())) {
                                log::info("query stream client disconnected, cancelling");
                                cancel.cancel();
                            }
                        },
                        cancel);
                    std::ostringstream oss;
                    oss << "query_stream tenant_id=" << request.tenant_id
                        << " conversation_id=" << outcome.conversation_id
                        << " state=" << query_state_name(outcome.state) << " persisted=" << outcome.persisted;
                    log::info(oss.str());
                    sink.done();
                    return true;
                }); }); });

        server.Post("/internal/answer", [&](const httplib::Request &req, httplib::Response &res)
                    { serve("answer_http", req, res, {}, [&](std::string &tenant_id) {
            const auto request = request_from_json(parse_json_body(req.body));
            tenant_id = request.tenant_id;
            const auto answer = orchestrator->answer(request);
            const int status = answer.error_kind ? http_status_for(*answer.error_kind) : 200;
            set_success(res, answer_to_json(answer), status); }); });

        server.Post("/internal/chunks", [&](const httplib::Request &req, httplib::Response &res)
                    { serve("chunk_index_http", req, res, {}, [&](std::string &tenant_id) {
            const auto record = chunk_record_from_json(parse_json_body(req.body));
            tenant_id = record.chunk.tenant_id;
            index->index(record.chunk);
            nlohmann::json body = {{"chunk_id", record.chunk.chunk_id}, {"indexed", true}};
            if (record.supersedes && *record.supersedes != record.chunk.chunk_id) {
                body["superseded"] = index->tombstone(record.chunk.tenant_id, *record.supersedes);
            }
            set_success(res, body, 201); }); });

        server.Delete(kTenantChunkPath, [&](const httplib::Request &req, httplib::Response &res)
                      { serve("chunk_tombstone_http", req, res, req.matches[1], [&](const std::string &tenant_id) {
            const std::string chunk_id = req.matches[2];
            if (!index->tombstone(tenant_id, chunk_id)) {
                set_error_response(res, HttpError{404, "NOT_FOUND", "chunk not found: " + chunk_id});
                return;
            }
            set_success(res, {{"chunk_id", chunk_id}, {"tombstoned", true}}); }); });

        server.Get(kConversationPath, [&](const httplib::Request &req, httplib::Response &res)
                   { serve("conversation_get_http", req, res, req.matches[1], [&](const std::string &tenant_id) {
            const std::string conversation_id = req.matches[2];
            const auto turns = conversations->recent(tenant_id, conversation_id, conversations->retention().max_turns);
            nlohmann::json body;
            body["conversation_id"] = conversation_id;
            body["turns"] = nlohmann::json::array();
            for (const auto& turn : turns) {
                body["turns"].push_back(turn_to_json(turn));
            }
            body["stats"] = conversation_stats_to_json(summarize_turns(turns));
            set_success(res, body); }); });

        server.Delete(kConversationPath, [&](const httplib::Request &req, httplib::Response &res)
                      { serve("conversation_delete_http", req, res, req.matches[1], [&](const std::string &tenant_id) {
            const std::string conversation_id = req.matches[2];
            if (!conversations->erase(tenant_id, conversation_id)) {
                set_error_response(res, HttpError{404, "NOT_FOUND", "conversation not found: " + conversation_id});
                return;
            }
            set_success(res, {{"conversation_id", conversation_id}, {"erased", true}}); }); });

        server.Get("/internal/health", [&](const httplib::Request &req, httplib::Response &res)
                   { serve("health_http", req, res, {}, [&](const std::string &) {
            const auto detail = index->health();
            set_success(res, health_to_json(detail, generation->provider_status()), detail.connected ? 200 : 503); }); });

        server.set_error_handler([](const httplib::Request &, httplib::Response &res)
                                 {
            if (res.status == 404) {
                set_error_response(res, HttpError{404, "NOT_FOUND", "no such endpoint"});
                return;
            }
            set_error_response(res, HttpError{}); });

        log::info("http server listening on " + host + ":" + std::to_string(port));
        if (!server.listen(host.c_str(), port))
        {
            log::error("http server failed to start");
            return 2;
        }
        return 0;
    }

} // namespace ragquery
