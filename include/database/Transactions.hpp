#pragma once

#include "config/Config.hpp"
#include "database/DBConnection.hpp"
#include "database/DBPool.hpp"
#include "database/errors.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

namespace vc::database {

// Single-writer discipline over the catalog: one writer connection behind a
// process-wide gate, reads through a small pool so they never wait on it.
// Transient contention is retried with exponential backoff; the gate is never
// held while sleeping.
class Transactions {
  public:
    Transactions(const config::DatabaseConfig& cfg, std::shared_ptr<spdlog::logger> log)
        : cfg_(cfg), log_(std::move(log)), writer_(std::make_unique<DBConnection>(cfg)) {}

    // Must be called after migrations: prepares statements and opens the readers.
    void init() {
        std::lock_guard gate(writeGate_);
        writer_->initPrepared();
        readers_ = std::make_unique<DBPool>(cfg_, cfg_.pool_size);
    }

    // Unprepared access to the writer, for migrations.
    template <typename Func>
    auto withWriter(Func&& func) -> decltype(func(std::declval<pqxx::connection&>())) {
        std::lock_guard gate(writeGate_);
        return func(writer_->get());
    }

    template <typename Func>
    auto write(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        return withRetry(ctx, [&]() -> decltype(func(std::declval<pqxx::work&>())) {
            std::lock_guard gate(writeGate_);
            if (!writer_->isOpen()) writer_->reconnect();

            log_->trace("[Transactions::write] Starting transaction: {}", ctx);
            pqxx::work txn(writer_->get());
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
            } else {
                auto result = func(txn);
                txn.commit();
                return result;
            }
        });
    }

    template <typename Func>
    auto read(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::read_transaction&>())) {
        if (!readers_) throw std::runtime_error("Transactions not initialized!");

        return withRetry(ctx, [&]() -> decltype(func(std::declval<pqxx::read_transaction&>())) {
            PooledConnection conn(*readers_);
            if (!conn->isOpen()) conn->reconnect();

            log_->trace("[Transactions::read] Starting transaction: {}", ctx);
            pqxx::read_transaction txn(conn->get());
            return func(txn);
        });
    }

    [[nodiscard]] const config::DatabaseConfig& config() const { return cfg_; }

  private:
    config::DatabaseConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;
    std::unique_ptr<DBConnection> writer_;
    std::unique_ptr<DBPool> readers_;
    std::mutex writeGate_;

    static bool isLockNotAvailable(const pqxx::sql_error& e) { return e.sqlstate() == "55P03"; }

    // Sleeps base * 2^attempt, or throws StoreBusy once the budget is spent.
    void backoff(const std::string& ctx, const unsigned int attempt, const std::string& cause) const {
        if (attempt >= cfg_.max_retries) {
            log_->error("[Transactions] store_busy ctx={} attempts={} cause={}", ctx, attempt + 1, cause);
            throw StoreBusy(ctx, attempt + 1, cause);
        }
        const auto delay = std::chrono::milliseconds(cfg_.retry_base_delay_ms) *
                           (1u << std::min(attempt, config::kMaxStoreRetries));
        log_->warn("[Transactions] retry ctx={} attempt={} delay_ms={} cause={}", ctx, attempt + 1, delay.count(), cause);
        std::this_thread::sleep_for(delay);
    }

    template <typename Attempt>
    auto withRetry(const std::string& ctx, Attempt&& attempt) -> decltype(attempt()) {
        for (unsigned int n = 0;; ++n) {
            try {
                return attempt();
            } catch (const pqxx::broken_connection& e) {
                backoff(ctx, n, e.what());
            } catch (const pqxx::transaction_rollback& e) {
                // serialization_failure, deadlock_detected
                backoff(ctx, n, e.what());
            } catch (const pqxx::sql_error& e) {
                if (!isLockNotAvailable(e)) {
                    log_->error("[Transactions] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
                    throw;
                }
                backoff(ctx, n, e.what());
            }
        }
    }
};

}
