// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "connection_registry.hpp"
#include "entity_store_client.hpp"
#include "parking_types.hpp"
#include "service_config.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parking {

struct BookingConfirmation {
    std::string spot_id;
    Coordinates coordinates{0.0, 0.0};
    std::size_t machines_notified{0};
};

struct ReleaseSummary {
    std::size_t released{0}; // spots moved back to free
    std::size_t total{0};     // spots seen in the store
};

/// \brief Allocation and booking flow against the entity store.
///
/// Holds no spot state between calls. Exclusivity comes from the store accepting exactly one
/// occupy write per spot; the dispatch broadcast only follows a write the store confirmed.
class BookingCoordinator {
public:
    BookingCoordinator(BrokerConfig cfg, std::shared_ptr<EntityStoreClient> store,
                       std::shared_ptr<ConnectionRegistry> registry);

    /// \brief Snapshot all spots and pick the best match. Empty result => no availability.
    std::optional<Spot> allocate(const BookingRequest& request);

    /// \brief Re-read, mark occupied, then notify machines. Throws StoreError without broadcasting on any failure.
    BookingConfirmation confirm_booking(const std::string& spot_id);

    void release_spot(const std::string& spot_id);
    ReleaseSummary release_all_spots();

private:
    BrokerConfig cfg_;
    std::shared_ptr<EntityStoreClient> store_;
    std::shared_ptr<ConnectionRegistry> registry_;

    std::vector<Spot> fetch_spots();
};

} // namespace parking
