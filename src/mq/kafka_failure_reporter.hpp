#pragma once

#include <memory>
#include <string>

#include "mq/kafka_producer.hpp"
#include "service/failure_reporter.hpp"

namespace ragquery {

// Publishes persistence failures to a Kafka topic so the turn can be replayed.
class KafkaFailureReporter final : public FailureReporter {
public:
    KafkaFailureReporter(std::shared_ptr<KafkaProducer> producer, std::string topic);

    void report_persist_failure(const PersistFailure& failure) override;

private:
    std::shared_ptr<KafkaProducer> producer_;
    std::string topic_;
};

}  // namespace ragquery
