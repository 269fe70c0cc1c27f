// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>

namespace parking {

enum class StoreErrorKind {
    UpstreamUnavailable, // broker unreachable, timed out or answered 5xx; safe to retry
    NotFound,            // entity absent
    ConflictOrRejected,  // broker refused the write
    PartialFailure       // multi-step operation stopped half way
};

/// \brief Failure talking to the entity store. Carries the HTTP status when one was received (0 otherwise).
class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorKind kind, const std::string& message, long http_status = 0)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

    StoreErrorKind kind() const { return kind_; }
    long http_status() const { return http_status_; }

private:
    StoreErrorKind kind_;
    long http_status_;
};

const char* to_string(StoreErrorKind kind);

/// \brief Map a non-2xx broker answer to an error kind.
StoreErrorKind kind_from_http_status(long http_status);

} // namespace parking
