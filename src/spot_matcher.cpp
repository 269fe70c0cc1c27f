// SPDX-License-Identifier: Apache-2.0
#include "spot_matcher.hpp"

namespace parking {

int SpotMatcher::weight(const Spot& spot) {
    int w = 0;
    if (spot.has_category(SpotCategory::ElectricCharging)) ++w;
    if (spot.has_category(SpotCategory::Disabled)) ++w;
    if (spot.has_category(SpotCategory::Women)) ++w;
    return w;
}

bool SpotMatcher::is_eligible(const Spot& spot, const BookingRequest& request) {
    if (spot.id.empty() || spot.status != SpotStatus::Free || !spot.categories) {
        return false;
    }
    if (request.requires_ev && !spot.has_category(SpotCategory::ElectricCharging)) {
        return false;
    }
    if (request.requires_disabled && !spot.has_category(SpotCategory::Disabled)) {
        return false;
    }
    if (request.requires_female && !spot.has_category(SpotCategory::Women)) {
        return false;
    }
    // Reserved spots are withheld from generic requesters; EV-only spots stay open to them.
    if (!request.requires_disabled && !request.requires_female) {
        if (spot.has_category(SpotCategory::Disabled) || spot.has_category(SpotCategory::Women)) {
            return false;
        }
    }
    return true;
}

std::optional<Spot> SpotMatcher::find_best_spot(const std::vector<Spot>& spots, const BookingRequest& request) {
    const Spot* best = nullptr;
    int best_weight = 0;
    for (const auto& spot : spots) {
        if (!is_eligible(spot, request)) continue;
        const int w = weight(spot);
        if (!best || w < best_weight) {
            best = &spot;
            best_weight = w;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

} // namespace parking
