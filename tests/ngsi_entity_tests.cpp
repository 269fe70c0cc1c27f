// SPDX-License-Identifier: Apache-2.0
#include "ngsi_entity.hpp"

#include <cassert>
#include <iostream>

using namespace parking;
using json = nlohmann::json;

int main() {
    // Attribute wrapper kinds
    assert(NgsiAttribute(json{{"type", "Property"}, {"value", "free"}}).kind() == NgsiAttribute::Kind::Property);
    assert(NgsiAttribute(json{{"type", "Relationship"}, {"object", "urn:g"}}).kind() ==
           NgsiAttribute::Kind::Relationship);
    assert(NgsiAttribute(json{{"type", "GeoProperty"}, {"value", json::object()}}).kind() ==
           NgsiAttribute::Kind::GeoProperty);
    assert(NgsiAttribute(json("free")).kind() == NgsiAttribute::Kind::Bare);
    assert(NgsiAttribute(json(nullptr)).kind() == NgsiAttribute::Kind::Absent);
    assert(!NgsiAttribute::of(json::object(), "status").unwrap().has_value());

    assert(*NgsiAttribute(json{{"value", 3}}).unwrap() == json(3));
    assert(*NgsiAttribute(json{{"object", "urn:g"}}).unwrap() == json("urn:g"));
    assert(*NgsiAttribute(json("free")).unwrap() == json("free"));

    // Normalized spot record
    const json normalized = {
        {"id", "urn:spot:1"},
        {"type", "SmartIndoorParkingSpot"},
        {"status", {{"type", "Property"}, {"value", "free"}}},
        {"category", {{"type", "Property"}, {"value", {"forDisabled", "forElectricCharging", "somethingElse"}}}},
        {"spotNumber", {{"type", "Property"}, {"value", 7}}},
        {"location", {{"type", "GeoProperty"}, {"value", {{"type", "Point"}, {"coordinates", {1.5, -2.0}}}}}},
        {"refParkingGarage", {{"type", "Relationship"}, {"object", "urn:garage:1"}}},
    };
    const auto spot = parse_spot(normalized);
    assert(spot.id == "urn:spot:1");
    assert(spot.status == SpotStatus::Free);
    assert(spot.categories.has_value());
    assert(spot.categories->size() == 2);
    assert(spot.has_category(SpotCategory::Disabled));
    assert(spot.has_category(SpotCategory::ElectricCharging));
    assert(!spot.has_category(SpotCategory::Women));
    assert(spot.spot_number.value() == "7");
    assert(spot.position()[0] == 1.5 && spot.position()[1] == -2.0);
    assert(spot.garage_ref.value() == "urn:garage:1");

    // keyValues record with a single category string
    const json key_values = {{"id", "urn:spot:2"}, {"status", "occupied"}, {"category", "forWomen"}};
    const auto kv = parse_spot(key_values);
    assert(kv.status == SpotStatus::Occupied);
    assert(kv.has_category(SpotCategory::Women));
    assert(!kv.coordinates.has_value());
    assert(kv.position()[0] == 0.0 && kv.position()[1] == 0.0);

    // Missing or odd-shaped attributes never throw
    const auto broken = parse_spot(json{{"id", "urn:spot:3"}, {"status", 42}, {"category", {{"value", 5}}},
                                        {"location", {{"value", {{"coordinates", {1}}}}}}});
    assert(broken.status == SpotStatus::Unknown);
    assert(!broken.categories.has_value());
    assert(!broken.coordinates.has_value());
    assert(parse_spot(json::array()).id.empty());

    // Status patch uses the supplied time, not a fixed literal
    const auto t = std::chrono::system_clock::from_time_t(1700000000) + std::chrono::milliseconds(42);
    const auto patch = make_status_patch(SpotStatus::Occupied, t);
    assert(patch["status"]["type"] == "Property");
    assert(patch["status"]["value"] == "occupied");
    assert(patch["occupancyModified"]["value"]["@type"] == "DateTime");
    assert(patch["occupancyModified"]["value"]["@value"] == "2023-11-14T22:13:20.042Z");
    assert(make_status_patch(SpotStatus::Free, t)["status"]["value"] == "free");

    // Dispatch payload
    DispatchEvent event;
    event.spot_id = "urn:spot:1";
    event.coordinates = {3.0, 4.0};
    event.timestamp = t;
    const auto payload = to_json(event);
    assert(payload["event"] == "NEW_BOOKING");
    assert(payload["spot_id"] == "urn:spot:1");
    assert(payload["coordinates"] == json::array({3.0, 4.0}));
    assert(payload["timestamp"] == "2023-11-14T22:13:20.042Z");

    std::cout << "ngsi_entity_tests passed\n";
    return 0;
}
