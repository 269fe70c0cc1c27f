// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "parking_types.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace parking {

inline constexpr const char* kDispatchEventName = "NEW_BOOKING";

/// \brief One attribute of an NGSI-LD entity, tagged by how the broker wrapped it.
///
/// Normalized entities wrap attributes as {"type":"Property","value":X}, relationships as
/// {"type":"Relationship","object":X}; keyValues entities carry X directly (Bare).
class NgsiAttribute {
public:
    enum class Kind { Absent, Property, Relationship, GeoProperty, Bare };

    NgsiAttribute() = default;
    explicit NgsiAttribute(const nlohmann::json& raw);

    /// \brief Look up attribute \p name on \p entity; missing or null attributes are Absent.
    static NgsiAttribute of(const nlohmann::json& entity, const std::string& name);

    Kind kind() const { return kind_; }

    /// \brief Payload of the attribute with the wrapper removed; empty when Absent.
    std::optional<nlohmann::json> unwrap() const;

private:
    Kind kind_{Kind::Absent};
    nlohmann::json raw_;
};

/// \brief Build a typed Spot from a broker record. Never throws on missing or odd-shaped attributes.
Spot parse_spot(const nlohmann::json& entity, const std::string& garage_relationship = "refParkingGarage");

/// \brief PATCH body moving a spot to \p status, stamped with \p modified_at.
nlohmann::json make_status_patch(SpotStatus status, std::chrono::system_clock::time_point modified_at);

nlohmann::json to_json(const DispatchEvent& event);

std::string format_iso8601_utc(std::chrono::system_clock::time_point tp);

std::optional<SpotStatus> status_from_string(const std::string& value);
std::optional<SpotCategory> category_from_string(const std::string& value);

} // namespace parking
