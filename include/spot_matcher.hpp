// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "parking_types.hpp"

#include <optional>
#include <vector>

namespace parking {

/// \brief Pure constraint matcher: picks the least specialised free spot that satisfies a request.
class SpotMatcher {
public:
    /// \brief Number of reserved-category tags on the spot (0 = general, up to 3).
    static int weight(const Spot& spot);

    /// \brief Whether \p spot may be handed to \p request. Spots without an id or with unreadable status/categories never are.
    static bool is_eligible(const Spot& spot, const BookingRequest& request);

    /// \brief Minimum-weight eligible spot; ties go to the first one in store order.
    /// An empty result means no availability, which is a normal outcome.
    static std::optional<Spot> find_best_spot(const std::vector<Spot>& spots, const BookingRequest& request);
};

} // namespace parking
