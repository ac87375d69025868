#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace pqxx { class transaction_base; }
namespace vc::types { struct Event; }

namespace vc::database {

struct EventCounts {
    int64_t total{0};
    int64_t created{0};
    int64_t modified{0};
    int64_t deleted{0};
    int64_t discovered{0};
};

struct EventQueries {
    static int64_t insert(pqxx::transaction_base& txn, const types::Event& event);
    static std::vector<types::Event> listRecent(pqxx::transaction_base& txn, std::optional<std::time_t> since, unsigned int limit);
    static EventCounts tally(pqxx::transaction_base& txn, const std::string& volumeId);
};

}
