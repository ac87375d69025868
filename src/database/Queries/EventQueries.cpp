#include "database/Queries/EventQueries.hpp"
#include "types/Event.hpp"
#include "util/timestamp.hpp"

#include <pqxx/pqxx>

using namespace vc::database;
using namespace vc::types;
using namespace vc::util;

namespace {
    std::optional<int64_t> limitParam(const unsigned int limit) {
        return limit == 0 ? std::nullopt : std::optional<int64_t>(limit);
    }
}

int64_t EventQueries::insert(pqxx::transaction_base& txn, const Event& event) {
    const pqxx::params p {
        timestampToString(event.timestamp),
        std::string(Event::toString(event.type)),
        event.path,
        event.directory,
        event.volume_id,
        event.process_id
    };
    return txn.exec(pqxx::prepped{"event.insert"}, p).one_field().as<int64_t>();
}

std::vector<Event> EventQueries::listRecent(pqxx::transaction_base& txn, const std::optional<std::time_t> since,
                                            const unsigned int limit) {
    const std::optional<std::string> sinceParam =
        since ? std::optional<std::string>(timestampToString(*since)) : std::nullopt;

    std::vector<Event> out;
    for (const auto& row : txn.exec(pqxx::prepped{"event.list_recent"}, pqxx::params{sinceParam, limitParam(limit)}))
        out.emplace_back(row);
    return out;
}

EventCounts EventQueries::tally(pqxx::transaction_base& txn, const std::string& volumeId) {
    const auto row = txn.exec(pqxx::prepped{"event.tally_for_volume"}, pqxx::params{volumeId}).one_row();
    return {
        row["total"].as<int64_t>(),
        row["created"].as<int64_t>(),
        row["modified"].as<int64_t>(),
        row["deleted"].as<int64_t>(),
        row["discovered"].as<int64_t>()
    };
}
