#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace pqxx { class transaction_base; }
namespace vc::types { struct FileRecord; }

namespace vc::database {

struct FileQueries {
    static void upsert(pqxx::transaction_base& txn, const types::FileRecord& file);
    static void markDeleted(pqxx::transaction_base& txn, const std::string& volumeId, const std::string& path,
                            const std::string& directory, std::time_t at);
    static std::optional<types::FileRecord> get(pqxx::transaction_base& txn, const std::string& volumeId,
                                                const std::string& path);
    static std::vector<types::FileRecord> list(pqxx::transaction_base& txn, const std::string& volumeId,
                                               unsigned int limit);
};

}
