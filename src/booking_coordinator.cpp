// SPDX-License-Identifier: Apache-2.0
#include "booking_coordinator.hpp"
#include "ngsi_entity.hpp"
#include "spot_matcher.hpp"

#include <chrono>
#include <utility>

#include <everest/logging.hpp>

namespace parking {

BookingCoordinator::BookingCoordinator(BrokerConfig cfg, std::shared_ptr<EntityStoreClient> store,
                                       std::shared_ptr<ConnectionRegistry> registry)
    : cfg_(std::move(cfg)), store_(std::move(store)), registry_(std::move(registry)) {}

std::optional<Spot> BookingCoordinator::allocate(const BookingRequest& request) {
    const auto spots = fetch_spots();
    auto best = SpotMatcher::find_best_spot(spots, request);
    if (!best) {
        EVLOG_info << "No suitable spot among " << spots.size() << " (ev=" << request.requires_ev
                   << " disabled=" << request.requires_disabled << " female=" << request.requires_female << ")";
        return std::nullopt;
    }
    EVLOG_debug << "Matched spot " << best->id << " weight=" << SpotMatcher::weight(*best);
    return best;
}

BookingConfirmation BookingCoordinator::confirm_booking(const std::string& spot_id) {
    // The allocation snapshot may be stale; another requester can have taken the spot since.
    const auto spot = parse_spot(store_->get_entity(spot_id), cfg_.garage_relationship);
    if (spot.status != SpotStatus::Free) {
        EVLOG_info << "Booking of " << spot_id << " refused: status " << to_string(spot.status);
        throw StoreError(StoreErrorKind::ConflictOrRejected,
                         "Spot " + spot_id + " is not free (" + to_string(spot.status) + ")", 409);
    }
    if (!spot.coordinates) {
        EVLOG_warning << "Spot " << spot_id << " has no usable location; dispatching origin";
    }

    const auto now = std::chrono::system_clock::now();
    store_->update_attributes(spot_id, make_status_patch(SpotStatus::Occupied, now));

    // Only a write the store accepted may reach the machines.
    DispatchEvent event;
    event.spot_id = spot_id;
    event.coordinates = spot.position();
    event.timestamp = now;
    BookingConfirmation confirmation{spot_id, event.coordinates, registry_->broadcast(event)};
    EVLOG_info << "Spot " << spot_id << " booked; dispatched to " << confirmation.machines_notified << " machine(s)";
    return confirmation;
}

void BookingCoordinator::release_spot(const std::string& spot_id) {
    store_->update_attributes(spot_id, make_status_patch(SpotStatus::Free, std::chrono::system_clock::now()));
    EVLOG_info << "Spot " << spot_id << " released";
}

ReleaseSummary BookingCoordinator::release_all_spots() {
    ReleaseSummary summary;
    const auto spots = fetch_spots();
    summary.total = spots.size();
    for (const auto& spot : spots) {
        if (spot.status == SpotStatus::Free || spot.id.empty()) continue;
        store_->update_attributes(spot.id, make_status_patch(SpotStatus::Free, std::chrono::system_clock::now()));
        ++summary.released;
    }
    EVLOG_info << "Released " << summary.released << " of " << summary.total << " spots";
    return summary;
}

std::vector<Spot> BookingCoordinator::fetch_spots() {
    const auto records = store_->list_entities(cfg_.spot_type);
    std::vector<Spot> spots;
    spots.reserve(records.size());
    for (const auto& record : records) {
        spots.push_back(parse_spot(record, cfg_.garage_relationship));
    }
    return spots;
}

} // namespace parking
