// SPDX-License-Identifier: Apache-2.0
#include "store_error.hpp"

namespace parking {

const char* to_string(StoreErrorKind kind) {
    switch (kind) {
    case StoreErrorKind::UpstreamUnavailable:
        return "UpstreamUnavailable";
    case StoreErrorKind::NotFound:
        return "NotFound";
    case StoreErrorKind::ConflictOrRejected:
        return "ConflictOrRejected";
    case StoreErrorKind::PartialFailure:
        return "PartialFailure";
    }
    return "Unknown";
}

StoreErrorKind kind_from_http_status(long http_status) {
    if (http_status == 404) return StoreErrorKind::NotFound;
    if (http_status >= 500 || http_status <= 0) return StoreErrorKind::UpstreamUnavailable;
    return StoreErrorKind::ConflictOrRejected;
}

} // namespace parking
