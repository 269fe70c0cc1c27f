// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace parking {

using Coordinates = std::array<double, 2>;

enum class SpotStatus { Free, Occupied, Unknown };

enum class SpotCategory { ElectricCharging, Disabled, Women };

/// \brief Snapshot of one SmartIndoorParkingSpot entity as read from the store.
struct Spot {
    std::string id;
    SpotStatus status{SpotStatus::Unknown};
    std::optional<std::set<SpotCategory>> categories; // nullopt => attribute missing or unreadable
    std::optional<Coordinates> coordinates;
    std::optional<std::string> spot_number; // advisory label only
    std::optional<std::string> garage_ref;

    bool has_category(SpotCategory category) const {
        return categories && categories->count(category) > 0;
    }

    /// \brief Location of the spot, or the origin when the entity carries none.
    Coordinates position() const { return coordinates.value_or(Coordinates{0.0, 0.0}); }
};

struct BookingRequest {
    bool requires_disabled{false};
    bool requires_female{false};
    bool requires_ev{false};
};

/// \brief Payload fanned out to every connected retrieval machine after a confirmed booking.
struct DispatchEvent {
    std::string spot_id;
    Coordinates coordinates{0.0, 0.0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

const char* to_string(SpotStatus status);
const char* to_string(SpotCategory category);

} // namespace parking
