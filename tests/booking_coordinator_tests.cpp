// SPDX-License-Identifier: Apache-2.0
#include "booking_coordinator.hpp"
#include "ngsi_entity.hpp"
#include "simulated_entity_store.hpp"

#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace parking;
using json = nlohmann::json;

namespace {

json make_spot(const std::string& id, const std::string& status, const std::vector<std::string>& categories,
               double x = 1.0, double y = 2.0) {
    return json{{"id", id},
                {"type", "SmartIndoorParkingSpot"},
                {"status", {{"type", "Property"}, {"value", status}}},
                {"category", {{"type", "Property"}, {"value", categories}}},
                {"location", {{"type", "GeoProperty"}, {"value", {{"type", "Point"}, {"coordinates", {x, y}}}}}},
                {"refParkingGarage", {{"type", "Relationship"}, {"object", "G1"}}}};
}

class CountingChannel : public MachineChannel {
public:
    explicit CountingChannel(std::string id) : id_(std::move(id)) {}
    const std::string& id() const override { return id_; }
    bool send_text(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(payload);
        return true;
    }
    void close() override {}
    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::string id_;
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

struct Fixture {
    std::shared_ptr<SimulatedEntityStore> store;
    std::shared_ptr<ConnectionRegistry> registry = std::make_shared<ConnectionRegistry>();
    std::shared_ptr<CountingChannel> machine = std::make_shared<CountingChannel>("machine-1");
    std::unique_ptr<BookingCoordinator> coordinator;

    explicit Fixture(std::vector<json> spots) : store(std::make_shared<SimulatedEntityStore>(std::move(spots))) {
        registry->register_channel(machine);
        coordinator = std::make_unique<BookingCoordinator>(BrokerConfig{}, store, registry);
    }

    std::string status_of(const std::string& id) const {
        return store->get_entity(id)["status"]["value"].get<std::string>();
    }
};

// Forwards to a simulated store and lets another writer act between the re-read and the write.
class InterleavingStore : public EntityStoreClient {
public:
    explicit InterleavingStore(std::shared_ptr<SimulatedEntityStore> inner) : inner_(std::move(inner)) {}

    std::function<void(const std::string&)> after_read;

    std::vector<json> list_entities(const std::string& type, const std::optional<std::string>& query) override {
        return inner_->list_entities(type, query);
    }
    json get_entity(const std::string& id) override {
        auto entity = inner_->get_entity(id);
        if (after_read) after_read(id);
        return entity;
    }
    void update_attributes(const std::string& id, const json& attrs) override { inner_->update_attributes(id, attrs); }
    void create_entity(const json& entity) override { inner_->create_entity(entity); }
    void delete_entity(const std::string& id) override { inner_->delete_entity(id); }

private:
    std::shared_ptr<SimulatedEntityStore> inner_;
};

template <typename Fn> StoreErrorKind expect_store_error(Fn&& fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        return e.kind();
    }
    assert(false && "expected StoreError");
    return StoreErrorKind::PartialFailure;
}

} // namespace

int main() {
    // Allocation picks the general spot for a generic request and does not write
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {}, 5.0, 6.0), make_spot("B", "free", {"forDisabled"})});
        const auto spot = f.coordinator->allocate(BookingRequest{});
        assert(spot && spot->id == "A");
        assert(spot->position()[0] == 5.0);
        assert(f.store->update_count() == 0);
        assert(f.status_of("A") == "free");

        BookingRequest disabled;
        disabled.requires_disabled = true;
        assert(f.coordinator->allocate(disabled)->id == "B");
    }

    // Nothing free => empty result, not an error
    {
        Fixture f(std::vector<json>{make_spot("A", "occupied", {}), make_spot("B", "occupied", {"forDisabled"})});
        assert(!f.coordinator->allocate(BookingRequest{}));
    }

    // Successful booking writes occupied, then broadcasts exactly once
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {}, 7.0, 8.0)});
        const auto confirmation = f.coordinator->confirm_booking("A");
        assert(confirmation.spot_id == "A");
        assert(confirmation.machines_notified == 1);
        assert(confirmation.coordinates[0] == 7.0 && confirmation.coordinates[1] == 8.0);
        assert(f.status_of("A") == "occupied");
        assert(f.store->get_entity("A").contains("occupancyModified"));

        const auto messages = f.machine->messages();
        assert(messages.size() == 1);
        const auto payload = json::parse(messages[0]);
        assert(payload["event"] == "NEW_BOOKING");
        assert(payload["spot_id"] == "A");
        assert(payload["coordinates"] == json::array({7.0, 8.0}));

        // Second booking of the same spot is rejected and nothing new reaches the machines
        assert(expect_store_error([&]() { f.coordinator->confirm_booking("A"); }) ==
               StoreErrorKind::ConflictOrRejected);
        assert(f.machine->messages().size() == 1);
    }

    // Unknown id => NotFound, no broadcast
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {})});
        assert(expect_store_error([&]() { f.coordinator->confirm_booking("missing"); }) == StoreErrorKind::NotFound);
        assert(f.machine->messages().empty());
    }

    // Store outage => UpstreamUnavailable, no broadcast
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {})});
        f.store->set_unavailable(true);
        assert(expect_store_error([&]() { f.coordinator->confirm_booking("A"); }) ==
               StoreErrorKind::UpstreamUnavailable);
        assert(expect_store_error([&]() { f.coordinator->allocate(BookingRequest{}); }) ==
               StoreErrorKind::UpstreamUnavailable);
        assert(f.machine->messages().empty());
        f.store->set_unavailable(false);
        assert(f.status_of("A") == "free");
    }

    // Booking with no machines connected still succeeds
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {})});
        f.registry->unregister_channel(f.machine.get());
        assert(f.coordinator->confirm_booking("A").machines_notified == 0);
        assert(f.status_of("A") == "occupied");
    }

    // Spot taken by another writer after our re-read: the store refuses the write, nothing is dispatched
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {})});
        auto store = std::make_shared<InterleavingStore>(f.store);
        store->after_read = [&f](const std::string& id) {
            f.store->update_attributes(id, make_status_patch(SpotStatus::Occupied, std::chrono::system_clock::now()));
        };
        BookingCoordinator coordinator(BrokerConfig{}, store, f.registry);
        assert(expect_store_error([&]() { coordinator.confirm_booking("A"); }) == StoreErrorKind::ConflictOrRejected);
        assert(f.machine->messages().empty());
        assert(f.status_of("A") == "occupied");
    }

    // Spot removed after our re-read: NotFound, nothing is dispatched
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {})});
        auto store = std::make_shared<InterleavingStore>(f.store);
        store->after_read = [&f](const std::string& id) { f.store->delete_entity(id); };
        BookingCoordinator coordinator(BrokerConfig{}, store, f.registry);
        assert(expect_store_error([&]() { coordinator.confirm_booking("A"); }) == StoreErrorKind::NotFound);
        assert(f.machine->messages().empty());
        assert(!f.store->contains("A"));
    }

    // Spot without a location is still booked and dispatched at the origin
    {
        auto spot = make_spot("A", "free", {});
        spot.erase("location");
        Fixture f(std::vector<json>{spot});
        const auto confirmation = f.coordinator->confirm_booking("A");
        assert(confirmation.coordinates[0] == 0.0 && confirmation.coordinates[1] == 0.0);
        const auto messages = f.machine->messages();
        assert(messages.size() == 1);
        assert(json::parse(messages[0])["coordinates"] == json::array({0.0, 0.0}));
        assert(f.status_of("A") == "occupied");
    }

    // Racing requesters on one spot: exactly one wins, exactly one event
    {
        Fixture f(std::vector<json>{make_spot("A", "free", {})});
        std::atomic<int> successes{0};
        std::atomic<int> conflicts{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                try {
                    f.coordinator->confirm_booking("A");
                    ++successes;
                } catch (const StoreError& e) {
                    if (e.kind() == StoreErrorKind::ConflictOrRejected) ++conflicts;
                }
            });
        }
        for (auto& t : threads) t.join();
        assert(successes == 1);
        assert(conflicts == 7);
        assert(f.machine->messages().size() == 1);
    }

    // Release is idempotent; releasing a vanished spot reports NotFound
    {
        Fixture f(std::vector<json>{make_spot("A", "occupied", {})});
        f.coordinator->release_spot("A");
        assert(f.status_of("A") == "free");
        f.coordinator->release_spot("A");
        assert(f.status_of("A") == "free");
        assert(expect_store_error([&]() { f.coordinator->release_spot("gone"); }) == StoreErrorKind::NotFound);
        assert(f.machine->messages().empty());

        // Freed spot can be booked again
        f.coordinator->confirm_booking("A");
        assert(f.machine->messages().size() == 1);
    }

    // Release-all frees every non-free spot and reports the total seen
    {
        Fixture f(std::vector<json>{make_spot("A", "occupied", {}), make_spot("B", "free", {}),
                                    make_spot("C", "occupied", {"forWomen"})});
        const auto summary = f.coordinator->release_all_spots();
        assert(summary.total == 3);
        assert(summary.released == 2);
        assert(f.status_of("A") == "free");
        assert(f.status_of("C") == "free");
        assert(f.store->update_count() == 2);

        const auto again = f.coordinator->release_all_spots();
        assert(again.total == 3 && again.released == 0);
    }

    std::cout << "booking_coordinator_tests passed\n";
    return 0;
}
