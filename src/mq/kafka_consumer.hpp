#pragma once

#include <memory>
#include <string>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

namespace ragquery
{

    struct KafkaConsumerSettings
    {
        std::string brokers;
        std::string group_id;
        std::vector<std::string> topics;
        std::string offset_reset = "earliest";
    };

    // Manual-commit consumer: offsets advance only through commit().
    class KafkaConsumer
    {
    public:
        explicit KafkaConsumer(const KafkaConsumerSettings &settings);
        ~KafkaConsumer();

        KafkaConsumer(const KafkaConsumer &) = delete;
        KafkaConsumer &operator=(const KafkaConsumer &) = delete;

        // Null on timeout or partition EOF; throws on consumer errors.
        std::unique_ptr<RdKafka::Message> poll(int timeout_ms);
        void commit(const RdKafka::Message &message);

    private:
        std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
        std::unique_ptr<RdKafka::RebalanceCb> rebalance_cb_;
    };

} // namespace ragquery
