#include "mq/kafka_consumer.hpp"

#include <stdexcept>

#include "util/log.hpp"

namespace ragquery {

namespace {

class AssignRebalanceCb final : public RdKafka::RebalanceCb {
public:
    void rebalance_cb(RdKafka::KafkaConsumer* consumer,
                      RdKafka::ErrorCode err,
                      std::vector<RdKafka::TopicPartition*>& partitions) override {
        if (err == RdKafka::ERR__ASSIGN_PARTITIONS) {
            log::info("kafka partitions assigned count=" + std::to_string(partitions.size()));
            consumer->assign(partitions);
        } else {
            log::info("kafka partitions revoked count=" + std::to_string(partitions.size()));
            consumer->unassign();
        }
    }
};

void set_or_throw(RdKafka::Conf& conf, const std::string& name, const std::string& value) {
    std::string errstr;
    if (conf.set(name, value, errstr) != RdKafka::Conf::CONF_OK) {
        throw std::runtime_error("failed to set kafka consumer " + name + ": " + errstr);
    }
}

}  // namespace

KafkaConsumer::KafkaConsumer(const KafkaConsumerSettings& settings) {
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
    if (!conf) {
        throw std::runtime_error("failed to allocate kafka conf");
    }
    set_or_throw(*conf, "bootstrap.servers", settings.brokers);
    set_or_throw(*conf, "group.id", settings.group_id);
    set_or_throw(*conf, "enable.auto.commit", "false");
    set_or_throw(*conf, "auto.offset.reset", settings.offset_reset);

    std::string errstr;
    rebalance_cb_ = std::make_unique<AssignRebalanceCb>();
    if (conf->set("rebalance_cb", rebalance_cb_.get(), errstr) != RdKafka::Conf::CONF_OK) {
        throw std::runtime_error("failed to set rebalance_cb: " + errstr);
    }

    consumer_.reset(RdKafka::KafkaConsumer::create(conf.get(), errstr));
    if (!consumer_) {
        throw std::runtime_error("failed to create kafka consumer: " + errstr);
    }

    const RdKafka::ErrorCode subscribe_err = consumer_->subscribe(settings.topics);
    if (subscribe_err != RdKafka::ERR_NO_ERROR) {
        throw std::runtime_error("failed to subscribe: " + RdKafka::err2str(subscribe_err));
    }
}

KafkaConsumer::~KafkaConsumer() {
    if (consumer_) {
        consumer_->close();
    }
}

std::unique_ptr<RdKafka::Message> KafkaConsumer::poll(int timeout_ms) {
    std::unique_ptr<RdKafka::Message> message(consumer_->consume(timeout_ms));
    if (!message) {
        return nullptr;
    }

    switch (message->err()) {
        case RdKafka::ERR_NO_ERROR:
            return message;
        case RdKafka::ERR__TIMED_OUT:
        case RdKafka::ERR__PARTITION_EOF:
            return nullptr;
        default:
            throw std::runtime_error("kafka consume error: " + message->errstr());
    }
}

void KafkaConsumer::commit(const RdKafka::Message& message) {
    const auto err = consumer_->commitSync(const_cast<RdKafka::Message*>(&message));
    if (err != RdKafka::ERR_NO_ERROR) {
        throw std::runtime_error("failed to commit offset: " + RdKafka::err2str(err));
    }
}

}  // namespace ragquery
