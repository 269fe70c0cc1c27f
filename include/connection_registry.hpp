// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "parking_types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace parking {

/// \brief Outbound side of one live duplex channel to a retrieval machine.
class MachineChannel {
public:
    virtual ~MachineChannel() = default;

    virtual const std::string& id() const = 0;

    /// \brief Queue \p payload as one complete text message. Must not block on the peer.
    /// Returns false when the channel is closed or the message could not be queued.
    virtual bool send_text(const std::string& payload) = 0;

    virtual void close() = 0;
};

/// \brief Set of currently connected machines. Safe for concurrent register/unregister/broadcast.
class ConnectionRegistry {
public:
    void register_channel(const std::shared_ptr<MachineChannel>& channel);
    void unregister_channel(const MachineChannel* channel);

    /// \brief Send \p event to every channel registered at the time of the call.
    /// Channels that fail the send are dropped. Returns the number of channels the event was handed to.
    std::size_t broadcast(const DispatchEvent& event);

    std::size_t size() const;

private:
    struct Entry {
        std::weak_ptr<MachineChannel> channel;
        std::string id;
    };

    mutable std::mutex mutex_;
    std::unordered_map<const MachineChannel*, Entry> channels_;
};

} // namespace parking
