// SPDX-License-Identifier: Apache-2.0
#include "connection_registry.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace parking;

namespace {

class RecordingChannel : public MachineChannel {
public:
    explicit RecordingChannel(std::string id, bool accept = true) : id_(std::move(id)), accept_(accept) {}

    const std::string& id() const override { return id_; }

    bool send_text(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accept_ || closed_) return false;
        received_.push_back(payload);
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::string id_;
    bool accept_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::vector<std::string> received_;
};

DispatchEvent make_event(const std::string& spot_id) {
    DispatchEvent e;
    e.spot_id = spot_id;
    e.coordinates = {10.0, 20.0};
    e.timestamp = std::chrono::system_clock::now();
    return e;
}

} // namespace

int main() {
    // Empty registry: broadcast is a no-op
    {
        ConnectionRegistry registry;
        assert(registry.broadcast(make_event("S1")) == 0);
        assert(registry.size() == 0);
    }

    // Every connected machine gets the identical payload
    {
        ConnectionRegistry registry;
        auto a = std::make_shared<RecordingChannel>("a");
        auto b = std::make_shared<RecordingChannel>("b");
        registry.register_channel(a);
        registry.register_channel(b);
        registry.register_channel(a); // re-registering is harmless
        assert(registry.size() == 2);

        assert(registry.broadcast(make_event("S1")) == 2);
        assert(a->received().size() == 1);
        assert(b->received().size() == 1);
        assert(a->received()[0] == b->received()[0]);
        const auto payload = nlohmann::json::parse(a->received()[0]);
        assert(payload["event"] == "NEW_BOOKING");
        assert(payload["spot_id"] == "S1");
        assert(payload["coordinates"][0] == 10.0);
    }

    // Failing channel is closed and removed; others still receive
    {
        ConnectionRegistry registry;
        auto good = std::make_shared<RecordingChannel>("good");
        auto bad = std::make_shared<RecordingChannel>("bad", false);
        registry.register_channel(good);
        registry.register_channel(bad);
        assert(registry.broadcast(make_event("S2")) == 1);
        assert(bad->closed());
        assert(registry.size() == 1);
        assert(good->received().size() == 1);
        assert(registry.broadcast(make_event("S3")) == 1);
        assert(good->received().size() == 2);
    }

    // Unregistered or destroyed channels are skipped
    {
        ConnectionRegistry registry;
        auto keep = std::make_shared<RecordingChannel>("keep");
        auto gone = std::make_shared<RecordingChannel>("gone");
        auto dropped = std::make_shared<RecordingChannel>("dropped");
        registry.register_channel(keep);
        registry.register_channel(gone);
        registry.register_channel(dropped);
        registry.unregister_channel(gone.get());
        registry.unregister_channel(gone.get()); // second unregister is a no-op
        dropped.reset();
        assert(registry.broadcast(make_event("S4")) == 1);
        assert(gone->received().empty());
        assert(registry.size() == 1);
    }

    // A machine connecting after the broadcast does not see the earlier event
    {
        ConnectionRegistry registry;
        auto early = std::make_shared<RecordingChannel>("early");
        registry.register_channel(early);
        registry.broadcast(make_event("S5"));
        auto late = std::make_shared<RecordingChannel>("late");
        registry.register_channel(late);
        assert(late->received().empty());
        assert(early->received().size() == 1);
    }

    // Concurrent connects, disconnects and broadcasts
    {
        ConnectionRegistry registry;
        auto steady = std::make_shared<RecordingChannel>("steady");
        registry.register_channel(steady);
        std::atomic<bool> done{false};

        std::thread churn([&]() {
            for (int i = 0; i < 500; ++i) {
                auto ch = std::make_shared<RecordingChannel>("churn-" + std::to_string(i));
                registry.register_channel(ch);
                if (i % 2 == 0) {
                    registry.unregister_channel(ch.get());
                }
            }
            done = true;
        });

        std::size_t broadcasts = 0;
        while (!done) {
            assert(registry.broadcast(make_event("S6")) >= 1);
            ++broadcasts;
        }
        churn.join();
        assert(registry.broadcast(make_event("S6")) == 1);
        ++broadcasts;
        assert(steady->received().size() == broadcasts);
        assert(registry.size() == 1);
    }

    std::cout << "connection_registry_tests passed\n";
    return 0;
}
