// SPDX-License-Identifier: Apache-2.0
#include "machine_gateway.hpp"

#include <chrono>
#include <deque>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <everest/logging.hpp>

namespace parking {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
constexpr int kMaxPendingWrites = 64; // beyond this the machine is considered stuck and dropped

bool is_normal_close(const beast::error_code& ec) {
    return ec == websocket::error::closed || ec == net::error::operation_aborted || ec == net::error::eof ||
           ec == beast::error::timeout || ec == http::error::end_of_stream;
}

class MachineSession : public MachineChannel, public std::enable_shared_from_this<MachineSession> {
public:
    MachineSession(tcp::socket&& socket, std::string id, const MachineGatewayConfig& cfg,
                   std::shared_ptr<ConnectionRegistry> registry)
        : ws_(std::move(socket)),
          id_(std::move(id)),
          path_(cfg.path),
          idle_timeout_(cfg.idle_timeout_s),
          registry_(std::move(registry)) {}

    ~MachineSession() override { leave_registry(); }

    void run() {
        net::dispatch(ws_.get_executor(), beast::bind_front_handler(&MachineSession::read_upgrade, shared_from_this()));
    }

    const std::string& id() const override { return id_; }

    bool send_text(const std::string& payload) override {
        if (closed_) return false;
        if (pending_writes_.fetch_add(1) >= kMaxPendingWrites) {
            pending_writes_.fetch_sub(1);
            EVLOG_warning << "Machine " << id_ << " has " << kMaxPendingWrites << " undelivered messages";
            return false;
        }
        net::post(ws_.get_executor(), [self = shared_from_this(), msg = std::make_shared<const std::string>(payload)]() {
            self->queue_write(msg);
        });
        return true;
    }

    void close() override {
        if (closed_.exchange(true)) return;
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(self->ws_).close();
        });
    }

private:
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> upgrade_;
    std::deque<std::shared_ptr<const std::string>> write_queue_;
    std::string id_;
    std::string path_;
    std::chrono::seconds idle_timeout_;
    std::shared_ptr<ConnectionRegistry> registry_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> registered_{false};
    std::atomic<int> pending_writes_{0};

    void read_upgrade() {
        beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
        http::async_read(ws_.next_layer(), buffer_, upgrade_,
                         beast::bind_front_handler(&MachineSession::on_upgrade, shared_from_this()));
    }

    void on_upgrade(beast::error_code ec, std::size_t) {
        if (ec) return finish(ec, "handshake read");

        const auto target = upgrade_.target();
        std::string path(target.data(), target.size());
        path = path.substr(0, path.find('?'));
        if (!websocket::is_upgrade(upgrade_) || path != path_) {
            EVLOG_warning << "Rejecting machine connection " << id_ << " to " << path;
            auto res = std::make_shared<http::response<http::string_body>>(http::status::not_found,
                                                                            upgrade_.version());
            res->set(http::field::content_type, "text/plain");
            res->keep_alive(false);
            res->body() = "Not found";
            res->prepare_payload();
            http::async_write(ws_.next_layer(), *res, [self = shared_from_this(), res](beast::error_code, std::size_t) {
                self->closed_ = true;
                beast::error_code ignored;
                beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
            });
            return;
        }

        beast::get_lowest_layer(ws_).expires_never();
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
        timeouts.idle_timeout = idle_timeout_;
        timeouts.keep_alive_pings = true;
        ws_.set_option(timeouts);
        ws_.async_accept(upgrade_, beast::bind_front_handler(&MachineSession::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec) {
        if (ec) return finish(ec, "handshake");
        buffer_.consume(buffer_.size());
        registered_ = true;
        registry_->register_channel(shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&MachineSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) return finish(ec, "read");
        EVLOG_debug << "Machine " << id_ << ": " << beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        do_read();
    }

    void queue_write(std::shared_ptr<const std::string> msg) {
        if (closed_) {
            pending_writes_.fetch_sub(1);
            return;
        }
        write_queue_.push_back(std::move(msg));
        if (write_queue_.size() > 1) return; // a write is already in flight
        do_write();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(net::buffer(*write_queue_.front()),
                        beast::bind_front_handler(&MachineSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        pending_writes_.fetch_sub(1);
        write_queue_.pop_front();
        if (ec) {
            pending_writes_.fetch_sub(static_cast<int>(write_queue_.size()));
            write_queue_.clear();
            return finish(ec, "write");
        }
        if (!write_queue_.empty()) do_write();
    }

    void finish(const beast::error_code& ec, const char* stage) {
        closed_ = true;
        if (is_normal_close(ec)) {
            EVLOG_debug << "Machine " << id_ << " " << stage << " ended: " << ec.message();
        } else {
            EVLOG_warning << "Machine " << id_ << " " << stage << " failed: " << ec.message();
        }
        leave_registry();
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

    void leave_registry() {
        if (registered_.exchange(false)) {
            registry_->unregister_channel(this);
        }
    }
};

} // namespace

MachineGateway::MachineGateway(MachineGatewayConfig cfg, std::shared_ptr<ConnectionRegistry> registry)
    : cfg_(std::move(cfg)), registry_(std::move(registry)), acceptor_(net::make_strand(ioc_)) {}

MachineGateway::~MachineGateway() {
    stop();
}

bool MachineGateway::start() {
    if (started_.exchange(true)) return false;

    beast::error_code ec;
    const auto address = net::ip::make_address(cfg_.host, ec);
    if (ec) {
        EVLOG_error << "Invalid machine gateway host " << cfg_.host << ": " << ec.message();
        return false;
    }
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(cfg_.port)};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        EVLOG_error << "Machine gateway cannot listen on " << cfg_.host << ":" << cfg_.port << ": " << ec.message();
        return false;
    }
    port_ = acceptor_.local_endpoint().port();

    do_accept();
    for (int i = 0; i < cfg_.io_threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                EVLOG_error << "Machine gateway I/O thread stopped: " << e.what();
            }
        });
    }
    EVLOG_info << "Machine gateway listening on ws://" << cfg_.host << ":" << port_ << cfg_.path;
    return true;
}

void MachineGateway::stop() {
    if (!started_ || stopped_.exchange(true)) return;
    net::post(acceptor_.get_executor(), [this]() {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });
    ioc_.stop();
    for (auto& t : io_threads_) {
        if (t.joinable()) t.join();
    }
    io_threads_.clear();
}

void MachineGateway::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            EVLOG_warning << "Machine gateway accept failed: " << ec.message();
        } else {
            beast::error_code ep_ec;
            const auto remote = socket.remote_endpoint(ep_ec);
            std::string id = "machine-" + std::to_string(next_session_id_++);
            if (!ep_ec) {
                id += "@" + remote.address().to_string() + ":" + std::to_string(remote.port());
            }
            std::make_shared<MachineSession>(std::move(socket), std::move(id), cfg_, registry_)->run();
        }
        if (!stopped_) do_accept();
    });
}

} // namespace parking
