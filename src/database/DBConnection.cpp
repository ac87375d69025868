#include "database/DBConnection.hpp"

#include <pqxx/pqxx>
#include <fmt/format.h>

namespace vc::database {

DBConnection::DBConnection(config::DatabaseConfig cfg) : cfg_(std::move(cfg)) { open(); }

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const {
    if (!conn_) throw std::runtime_error("Database connection is not open");
    return *conn_;
}

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::open() {
    conn_ = std::make_unique<pqxx::connection>(cfg_.connectionString());
    configureSession();
}

void DBConnection::configureSession() const {
    pqxx::nontransaction tx(*conn_);
    tx.exec("SET TIME ZONE 'UTC'");
    tx.exec(fmt::format("SET lock_timeout = '{}ms'", cfg_.busy_timeout_ms));
    tx.exec(fmt::format("SET search_path TO {}", conn_->quote_name(cfg_.schema)));
}

void DBConnection::reconnect() {
    if (conn_ && conn_->is_open()) conn_->close();
    open();
    if (prepared_) {
        prepared_ = false;
        initPrepared();
    }
}

void DBConnection::initPrepared() {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedEvents();
    initPreparedVolumes();
    initPreparedFiles();
    initPreparedJobs();
    prepared_ = true;
}

}
