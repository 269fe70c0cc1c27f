// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "connection_registry.hpp"
#include "service_config.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace parking {

/// \brief WebSocket endpoint retrieval machines connect to.
///
/// Every session that completes the handshake on the configured path is registered with the
/// ConnectionRegistry and removed again on close, protocol error, idle timeout or failed write.
/// Inbound machine messages (heartbeats, logs) are logged and otherwise ignored.
class MachineGateway {
public:
    MachineGateway(MachineGatewayConfig cfg, std::shared_ptr<ConnectionRegistry> registry);
    ~MachineGateway();

    MachineGateway(const MachineGateway&) = delete;
    MachineGateway& operator=(const MachineGateway&) = delete;

    bool start();
    void stop();

    /// \brief Port actually bound (useful when configured with port 0).
    int port() const { return port_; }

private:
    MachineGatewayConfig cfg_;
    std::shared_ptr<ConnectionRegistry> registry_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> io_threads_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<int> port_{0};
    std::atomic<std::uint64_t> next_session_id_{1};

    void do_accept();
};

} // namespace parking
