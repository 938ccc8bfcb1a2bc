#pragma once

#include <memory>
#include <string>

#include <librdkafka/rdkafkacpp.h>

namespace ragquery {

class KafkaProducer {
public:
    KafkaProducer(const std::string& brokers, int flush_timeout_ms = 5000);

    // Sends the given message to topic, blocking until delivery succeeds or fails.
    // A non-empty key keeps messages of one conversation on one partition.
    void send(const std::string& topic, const std::string& message, const std::string& key = {});

private:
    std::unique_ptr<RdKafka::Producer> producer_;
    int flush_timeout_ms_;
};

}  // namespace ragquery
