// SPDX-License-Identifier: Apache-2.0
#include "connection_registry.hpp"
#include "ngsi_entity.hpp"

#include <utility>
#include <vector>

#include <everest/logging.hpp>

namespace parking {

void ConnectionRegistry::register_channel(const std::shared_ptr<MachineChannel>& channel) {
    if (!channel) return;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels_[channel.get()] = Entry{channel, channel->id()};
        count = channels_.size();
    }
    EVLOG_info << "Machine " << channel->id() << " connected (" << count << " active)";
}

void ConnectionRegistry::unregister_channel(const MachineChannel* channel) {
    std::string id;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = channels_.find(channel);
        if (it == channels_.end()) return;
        id = it->second.id;
        channels_.erase(it);
        count = channels_.size();
    }
    EVLOG_info << "Machine " << id << " disconnected (" << count << " active)";
}

std::size_t ConnectionRegistry::broadcast(const DispatchEvent& event) {
    // Serialize once so every machine sees the identical, complete payload.
    const auto payload = to_json(event).dump();

    std::vector<std::shared_ptr<MachineChannel>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(channels_.size());
        for (auto it = channels_.begin(); it != channels_.end();) {
            if (auto ch = it->second.channel.lock()) {
                targets.push_back(std::move(ch));
                ++it;
            } else {
                it = channels_.erase(it);
            }
        }
    }

    // Sends happen outside the lock; channels queue the frame and return immediately.
    std::size_t delivered = 0;
    std::vector<const MachineChannel*> failed;
    for (const auto& ch : targets) {
        if (ch->send_text(payload)) {
            ++delivered;
            continue;
        }
        EVLOG_warning << "Dropping machine " << ch->id() << " after failed send of booking " << event.spot_id;
        ch->close();
        failed.push_back(ch.get());
    }

    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto* key : failed) {
            channels_.erase(key);
        }
    }
    return delivered;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

} // namespace parking
