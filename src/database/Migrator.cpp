#include "database/Migrator.hpp"
#include "database/errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <openssl/evp.h>
#include <pqxx/pqxx>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace vc::database {

namespace {

std::string readFileToString(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) throw MigrationError("Failed to open SQL file: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void ensureMigrationsTable(pqxx::work& txn) {
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            filename   TEXT PRIMARY KEY,
            sha256     TEXT NOT NULL,
            applied_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
        );
    )");
}

}

Migrator::Migrator(fs::path dir, std::string schema, std::shared_ptr<spdlog::logger> log)
    : dir_(std::move(dir)), schema_(std::move(schema)), log_(std::move(log)) {}

std::string Migrator::sha256Hex(const std::string& s) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(s.data(), s.size(), hash, &len, EVP_sha256(), nullptr) != 1)
        throw MigrationError("SHA-256 digest failed");

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out[i * 2 + 0] = hex[(hash[i] >> 4) & 0xF];
        out[i * 2 + 1] = hex[(hash[i] >> 0) & 0xF];
    }
    return out;
}

std::vector<fs::path> Migrator::listMigrations(const fs::path& dir) {
    if (!fs::exists(dir)) throw MigrationError("Migrations dir does not exist: " + dir.string());
    if (!fs::is_directory(dir)) throw MigrationError("Migrations path is not a directory: " + dir.string());

    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (!e.is_regular_file()) continue;
        if (e.path().extension() == ".sql") files.push_back(e.path());
    }

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

MigrationReport Migrator::apply(pqxx::connection& conn) const {
    const auto files = listMigrations(dir_);
    MigrationReport report;

    try {
        pqxx::work txn(conn);
        // One migrator at a time across processes sharing the database
        txn.exec("SELECT pg_advisory_xact_lock(hashtext('volcat.schema_migrations'))");
        txn.exec(fmt::format("CREATE SCHEMA IF NOT EXISTS {}", txn.quote_name(schema_)));
        txn.exec(fmt::format("SET LOCAL search_path TO {}", txn.quote_name(schema_)));
        ensureMigrationsTable(txn);

        for (const auto& p : files) {
            const std::string sql = readFileToString(p);
            const std::string hash = sha256Hex(sql);
            const std::string filename = p.filename().string();

            const auto res = txn.exec(pqxx::zview{"SELECT sha256 FROM schema_migrations WHERE filename = $1"},
                                      pqxx::params{filename});
            if (!res.empty()) {
                if (res.one_field().as<std::string>() != hash) {
                    log_->warn("[Migrator] migration_changed file={} (applied version kept, not re-run)", filename);
                    report.changed.push_back(filename);
                } else {
                    report.already_applied.push_back(filename);
                }
                continue;
            }

            log_->info("[Migrator] applying file={}", filename);
            txn.exec(sql);
            txn.exec(pqxx::zview{"INSERT INTO schema_migrations (filename, sha256) VALUES ($1, $2)"},
                     pqxx::params{filename, hash});
            report.applied.push_back(filename);
        }

        txn.commit();
    } catch (const pqxx::sql_error& e) {
        throw MigrationError(fmt::format("Migration failed in schema '{}': {}", schema_, e.what()));
    }

    log_->debug("[Migrator] done applied={} already={} changed={}",
                report.applied.size(), report.already_applied.size(), report.changed.size());
    return report;
}

}
