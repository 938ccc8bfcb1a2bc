#include "mq/kafka_producer.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace ragquery
{

    namespace
    {

        std::unique_ptr<RdKafka::Conf> make_conf()
        {
            return std::unique_ptr<RdKafka::Conf>(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
        }

        void set_or_throw(RdKafka::Conf &conf, const std::string &name, const std::string &value)
        {
            std::string errstr;
            if (conf.set(name, value, errstr) != RdKafka::Conf::CONF_OK)
            {
                throw std::runtime_error("failed to set kafka producer " + name + ": " + errstr);
            }
        }

    } // namespace

    KafkaProducer::KafkaProducer(const std::string &brokers, int flush_timeout_ms)
        : flush_timeout_ms_(flush_timeout_ms)
    {
        auto conf = make_conf();
        if (!conf)
        {
            throw std::runtime_error("failed to allocate kafka conf");
        }
        set_or_throw(*conf, "bootstrap.servers", brokers);
        set_or_throw(*conf, "enable.idempotence", "false");
        set_or_throw(*conf, "message.timeout.ms", std::to_string(flush_timeout_ms_));

        std::string errstr;
        producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
        if (!producer_)
        {
            throw std::runtime_error("failed to create kafka producer: " + errstr);
        }
    }

    void KafkaProducer::send(const std::string &topic_name, const std::string &message, const std::string &key)
    {
        const auto error = producer_->produce(topic_name,
                                              RdKafka::Topic::PARTITION_UA,
                                              RdKafka::Producer::RK_MSG_COPY,
                                              const_cast<char *>(message.data()),
                                              message.size(),
                                              key.empty() ? nullptr : key.data(),
                                              key.size(),
                                              0,
                                              nullptr);
        if (error != RdKafka::ERR_NO_ERROR)
        {
            throw std::runtime_error("failed to produce message to " + topic_name + ": " + RdKafka::err2str(error));
        }

        const auto flush_error = producer_->flush(flush_timeout_ms_);
        if (flush_error != RdKafka::ERR_NO_ERROR)
        {
            throw std::runtime_error("kafka flush failed: " + RdKafka::err2str(flush_error));
        }
    }

} // namespace ragquery
