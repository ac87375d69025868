#pragma once

#include <stdexcept>
#include <string>

namespace vc::database {

// Transient contention (lock timeout, serialization failure, deadlock,
// dropped connection) that outlasted the retry budget.
class StoreBusy : public std::runtime_error {
public:
    StoreBusy(const std::string& context, unsigned int attempts, const std::string& cause)
        : std::runtime_error("Catalog store busy in " + context + " after " + std::to_string(attempts) +
                             " attempts: " + cause),
          attempts_(attempts) {}

    [[nodiscard]] unsigned int attempts() const noexcept { return attempts_; }

private:
    unsigned int attempts_;
};

class MigrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
