#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace pqxx { class connection; }

namespace vc::database {

struct MigrationReport {
    std::vector<std::string> applied;
    std::vector<std::string> already_applied;
    std::vector<std::string> changed;   // applied earlier, content differs now; never re-run
};

// Applies ordered *.sql files exactly once each, recording them in schema_migrations.
class Migrator {
  public:
    Migrator(std::filesystem::path dir, std::string schema, std::shared_ptr<spdlog::logger> log);

    MigrationReport apply(pqxx::connection& conn) const;

    static std::vector<std::filesystem::path> listMigrations(const std::filesystem::path& dir);
    static std::string sha256Hex(const std::string& s);

  private:
    std::filesystem::path dir_;
    std::string schema_;
    std::shared_ptr<spdlog::logger> log_;
};

}
