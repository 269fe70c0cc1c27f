// SPDX-License-Identifier: Apache-2.0
#include "ngsi_entity.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace parking {

namespace {

std::optional<std::string> scalar_to_string(const nlohmann::json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number() || j.is_boolean()) return j.dump();
    return std::nullopt;
}

std::optional<std::set<SpotCategory>> parse_categories(const nlohmann::json& j) {
    std::set<SpotCategory> out;
    auto add = [&out](const std::string& tag) {
        if (const auto c = category_from_string(tag)) {
            out.insert(*c);
        }
    };
    if (j.is_string()) {
        add(j.get<std::string>());
        return out;
    }
    if (!j.is_array()) return std::nullopt;
    for (const auto& item : j) {
        if (!item.is_string()) return std::nullopt;
        add(item.get<std::string>());
    }
    return out;
}

std::optional<Coordinates> parse_coordinates(const nlohmann::json& location) {
    // GeoJSON geometry: {"type":"Point","coordinates":[x,y]}
    if (!location.is_object()) return std::nullopt;
    const auto it = location.find("coordinates");
    if (it == location.end() || !it->is_array() || it->size() != 2) return std::nullopt;
    if (!(*it)[0].is_number() || !(*it)[1].is_number()) return std::nullopt;
    return Coordinates{(*it)[0].get<double>(), (*it)[1].get<double>()};
}

} // namespace

NgsiAttribute::NgsiAttribute(const nlohmann::json& raw) : raw_(raw) {
    if (raw.is_null()) {
        kind_ = Kind::Absent;
        return;
    }
    if (!raw.is_object()) {
        kind_ = Kind::Bare;
        return;
    }
    const auto type_it = raw.find("type");
    const std::string type = (type_it != raw.end() && type_it->is_string()) ? type_it->get<std::string>() : "";
    if (type == "Relationship" || (type.empty() && raw.contains("object"))) {
        kind_ = Kind::Relationship;
    } else if (type == "GeoProperty") {
        kind_ = Kind::GeoProperty;
    } else if (raw.contains("value")) {
        kind_ = Kind::Property;
    } else {
        kind_ = Kind::Bare;
    }
}

NgsiAttribute NgsiAttribute::of(const nlohmann::json& entity, const std::string& name) {
    if (!entity.is_object()) return NgsiAttribute{};
    const auto it = entity.find(name);
    if (it == entity.end()) return NgsiAttribute{};
    return NgsiAttribute(*it);
}

std::optional<nlohmann::json> NgsiAttribute::unwrap() const {
    switch (kind_) {
    case Kind::Absent:
        return std::nullopt;
    case Kind::Relationship: {
        const auto it = raw_.find("object");
        if (it == raw_.end() || it->is_null()) return std::nullopt;
        return *it;
    }
    case Kind::Property:
    case Kind::GeoProperty: {
        const auto it = raw_.find("value");
        if (it == raw_.end() || it->is_null()) return std::nullopt;
        return *it;
    }
    case Kind::Bare:
        return raw_;
    }
    return std::nullopt;
}

Spot parse_spot(const nlohmann::json& entity, const std::string& garage_relationship) {
    Spot spot;
    if (!entity.is_object()) return spot;
    if (const auto id = entity.find("id"); id != entity.end() && id->is_string()) {
        spot.id = id->get<std::string>();
    }

    if (const auto status = NgsiAttribute::of(entity, "status").unwrap()) {
        if (status->is_string()) {
            spot.status = status_from_string(status->get<std::string>()).value_or(SpotStatus::Unknown);
        }
    }
    if (const auto categories = NgsiAttribute::of(entity, "category").unwrap()) {
        spot.categories = parse_categories(*categories);
    }
    if (const auto location = NgsiAttribute::of(entity, "location").unwrap()) {
        spot.coordinates = parse_coordinates(*location);
    }
    if (const auto number = NgsiAttribute::of(entity, "spotNumber").unwrap()) {
        spot.spot_number = scalar_to_string(*number);
    }
    if (const auto garage = NgsiAttribute::of(entity, garage_relationship).unwrap()) {
        spot.garage_ref = scalar_to_string(*garage);
    }
    return spot;
}

nlohmann::json make_status_patch(SpotStatus status, std::chrono::system_clock::time_point modified_at) {
    return {
        {"status", {{"type", "Property"}, {"value", to_string(status)}}},
        {"occupancyModified",
         {{"type", "Property"},
          {"value", {{"@type", "DateTime"}, {"@value", format_iso8601_utc(modified_at)}}}}},
    };
}

nlohmann::json to_json(const DispatchEvent& event) {
    return {
        {"event", kDispatchEventName},
        {"spot_id", event.spot_id},
        {"coordinates", {event.coordinates[0], event.coordinates[1]}},
        {"timestamp", format_iso8601_utc(event.timestamp)},
    };
}

std::string format_iso8601_utc(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return oss.str();
}

std::optional<SpotStatus> status_from_string(const std::string& value) {
    if (value == "free") return SpotStatus::Free;
    if (value == "occupied") return SpotStatus::Occupied;
    return std::nullopt;
}

std::optional<SpotCategory> category_from_string(const std::string& value) {
    if (value == "forElectricCharging") return SpotCategory::ElectricCharging;
    if (value == "forDisabled") return SpotCategory::Disabled;
    if (value == "forWomen") return SpotCategory::Women;
    return std::nullopt;
}

const char* to_string(SpotStatus status) {
    switch (status) {
    case SpotStatus::Free:
        return "free";
    case SpotStatus::Occupied:
        return "occupied";
    case SpotStatus::Unknown:
        break;
    }
    return "unknown";
}

const char* to_string(SpotCategory category) {
    switch (category) {
    case SpotCategory::ElectricCharging:
        return "forElectricCharging";
    case SpotCategory::Disabled:
        return "forDisabled";
    case SpotCategory::Women:
        return "forWomen";
    }
    return "unknown";
}

} // namespace parking
