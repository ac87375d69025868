#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace vc::database {

class DBConnection {
  public:
    explicit DBConnection(config::DatabaseConfig cfg);
    ~DBConnection();

    DBConnection(const DBConnection&) = delete;
    DBConnection& operator=(const DBConnection&) = delete;

    [[nodiscard]] pqxx::connection& get() const;
    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] const std::string& schema() const { return cfg_.schema; }

    // Registers every named statement. Tables must exist, so this runs after migrations.
    void initPrepared();

    // Drops and reopens the session, restoring settings and prepared statements.
    void reconnect();

  private:
    config::DatabaseConfig cfg_;
    std::unique_ptr<pqxx::connection> conn_;
    bool prepared_ = false;

    void open();
    void configureSession() const;

    void initPreparedEvents() const;
    void initPreparedVolumes() const;
    void initPreparedFiles() const;
    void initPreparedJobs() const;
};

}
