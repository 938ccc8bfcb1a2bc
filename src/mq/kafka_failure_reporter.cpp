#include "mq/kafka_failure_reporter.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "util/log.hpp"
#include "util/time.hpp"

namespace ragquery {

KafkaFailureReporter::KafkaFailureReporter(std::shared_ptr<KafkaProducer> producer, std::string topic)
    : producer_(std::move(producer)), topic_(std::move(topic)) {
    if (!producer_) {
        throw std::invalid_argument("kafka failure reporter requires a producer");
    }
}

void KafkaFailureReporter::report_persist_failure(const PersistFailure& failure) {
    nlohmann::json body;
    body["type"] = "PERSIST_FAILED";
    body["tenant_id"] = failure.tenant_id;
    body["user_id"] = failure.user_id;
    body["conversation_id"] = failure.conversation_id;
    body["question"] = failure.question;
    body["answer"] = failure.answer;
    body["sources"] = failure.sources;
    body["error"] = failure.error;
    body["occurred_at"] = time::to_iso8601(failure.occurred_at);

    producer_->send(topic_, body.dump(), failure.tenant_id + ":" + failure.conversation_id);
    log::info("persist failure reported to " + topic_ + " conversation_id=" + failure.conversation_id);
}

}  // namespace ragquery
