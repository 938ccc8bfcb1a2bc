#include "db/pg_pool.hpp"

#include <stdexcept>
#include <utility>

#include "util/log.hpp"

namespace ragquery
{

    PgConnectionPool::Lease::Lease(PgConnectionPool *pool, std::unique_ptr<pqxx::connection> connection)
        : pool_(pool), connection_(std::move(connection))
    {
    }

    PgConnectionPool::Lease::Lease(Lease &&other) noexcept
        : pool_(other.pool_), connection_(std::move(other.connection_))
    {
        other.pool_ = nullptr;
    }

    PgConnectionPool::Lease::~Lease()
    {
        if (pool_ != nullptr && connection_)
        {
            pool_->release(std::move(connection_));
        }
    }

    PgConnectionPool::PgConnectionPool(std::string conninfo, std::size_t size, std::chrono::milliseconds acquire_timeout)
        : conninfo_(std::move(conninfo)), size_(size == 0 ? 1 : size), acquire_timeout_(acquire_timeout)
    {
    }

    PgConnectionPool::Lease PgConnectionPool::acquire()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool ready = available_.wait_for(lock, acquire_timeout_, [this]
                                               { return !idle_.empty() || open_ < size_; });
        if (!ready)
        {
            throw std::runtime_error("postgres pool exhausted: no connection within " +
                                     std::to_string(acquire_timeout_.count()) + "ms");
        }

        if (!idle_.empty())
        {
            auto connection = std::move(idle_.back());
            idle_.pop_back();
            return Lease{this, std::move(connection)};
        }

        ++open_;
        lock.unlock();
        try
        {
            auto connection = std::make_unique<pqxx::connection>(conninfo_);
            if (!connection->is_open())
            {
                throw std::runtime_error("failed to open postgres connection");
            }
            return Lease{this, std::move(connection)};
        }
        catch (const std::exception &ex)
        {
            {
                std::lock_guard<std::mutex> relock(mutex_);
                --open_;
            }
            available_.notify_one();
            throw std::runtime_error(std::string{"postgres connect failed: "} + ex.what());
        }
    }

    void PgConnectionPool::release(std::unique_ptr<pqxx::connection> connection)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connection->is_open())
            {
                idle_.push_back(std::move(connection));
            }
            else
            {
                log::warn("postgres connection dropped from pool");
                --open_;
            }
        }
        available_.notify_one();
    }

} // namespace ragquery
