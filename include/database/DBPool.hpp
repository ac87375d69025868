#pragma once

#include "database/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace vc::database {

// Reader connections. The writer connection lives outside the pool behind the write gate.
class DBPool {
  public:
    DBPool(const config::DatabaseConfig& cfg, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            auto conn = std::make_unique<DBConnection>(cfg);
            conn->initPrepared();
            pool_.push(std::move(conn));
        }
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

// Returns the connection to the pool on scope exit, including on throw.
class PooledConnection {
  public:
    explicit PooledConnection(DBPool& pool) : pool_(pool), conn_(pool.acquire()) {}
    ~PooledConnection() { pool_.release(std::move(conn_)); }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    DBConnection* operator->() const { return conn_.get(); }
    DBConnection& operator*() const { return *conn_; }

  private:
    DBPool& pool_;
    std::unique_ptr<DBConnection> conn_;
};

}
