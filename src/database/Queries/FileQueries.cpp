#include "database/Queries/FileQueries.hpp"
#include "types/FileRecord.hpp"
#include "util/timestamp.hpp"

#include <pqxx/pqxx>

using namespace vc::database;
using namespace vc::types;
using namespace vc::util;

namespace {
    std::optional<std::string> tsParam(const std::optional<std::time_t>& t) {
        return t ? std::optional<std::string>(timestampToString(*t)) : std::nullopt;
    }
}

void FileQueries::upsert(pqxx::transaction_base& txn, const FileRecord& file) {
    const pqxx::params p {
        file.volume_id,
        file.path,
        file.directory,
        file.size_bytes,
        tsParam(file.modified_time),
        tsParam(file.created_time),
        timestampToString(file.last_event_timestamp ? file.last_event_timestamp : now()),
        std::string(Event::toString(file.last_event_type))
    };
    txn.exec(pqxx::prepped{"file.upsert"}, p);
}

void FileQueries::markDeleted(pqxx::transaction_base& txn, const std::string& volumeId, const std::string& path,
                              const std::string& directory, const std::time_t at) {
    txn.exec(pqxx::prepped{"file.mark_deleted"}, pqxx::params{volumeId, path, directory, timestampToString(at)}).no_rows();
}

std::optional<FileRecord> FileQueries::get(pqxx::transaction_base& txn, const std::string& volumeId,
                                           const std::string& path) {
    const auto res = txn.exec(pqxx::prepped{"file.get"}, pqxx::params{volumeId, path});
    if (res.empty()) return std::nullopt;
    return FileRecord(res.one_row());
}

std::vector<FileRecord> FileQueries::list(pqxx::transaction_base& txn, const std::string& volumeId,
                                          const unsigned int limit) {
    const std::optional<int64_t> lim = limit == 0 ? std::nullopt : std::optional<int64_t>(limit);
    std::vector<FileRecord> out;
    for (const auto& row : txn.exec(pqxx::prepped{"file.list"}, pqxx::params{volumeId, lim})) out.emplace_back(row);
    return out;
}
