#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace ragquery
{

    // Bounded set of Postgres connections. Connections are opened lazily and
    // reopened when a lease hands back a broken one.
    class PgConnectionPool
    {
    public:
        class Lease
        {
        public:
            Lease(PgConnectionPool *pool, std::unique_ptr<pqxx::connection> connection);
            Lease(Lease &&other) noexcept;
            Lease &operator=(Lease &&) = delete;
            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;
            ~Lease();

            pqxx::connection &operator*() const noexcept { return *connection_; }
            pqxx::connection *operator->() const noexcept { return connection_.get(); }

        private:
            PgConnectionPool *pool_;
            std::unique_ptr<pqxx::connection> connection_;
        };

        PgConnectionPool(std::string conninfo, std::size_t size, std::chrono::milliseconds acquire_timeout);

        // Throws std::runtime_error when no connection frees up in time or a
        // new one cannot be opened.
        Lease acquire();

        std::size_t size() const noexcept { return size_; }

    private:
        void release(std::unique_ptr<pqxx::connection> connection);

        std::string conninfo_;
        std::size_t size_;
        std::chrono::milliseconds acquire_timeout_;
        std::mutex mutex_;
        std::condition_variable available_;
        std::vector<std::unique_ptr<pqxx::connection>> idle_;
        std::size_t open_ = 0;
    };

} // namespace ragquery
