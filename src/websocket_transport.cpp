// SPDX-License-Identifier: Apache-2.0
#include "websocket_transport.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace pilesim {

WebsocketTransport::WebsocketTransport(std::string url, std::chrono::seconds connect_timeout) :
    url_(std::move(url)), connect_timeout_(connect_timeout) {
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.clear_error_channels(websocketpp::log::elevel::all);
    client_.init_asio();
    client_.set_open_handshake_timeout(
        std::chrono::duration_cast<std::chrono::milliseconds>(connect_timeout_).count());

    using websocketpp::lib::placeholders::_1;
    using websocketpp::lib::placeholders::_2;
    client_.set_open_handler(websocketpp::lib::bind(&WebsocketTransport::on_open, this, _1));
    client_.set_fail_handler(websocketpp::lib::bind(&WebsocketTransport::on_fail, this, _1));
    client_.set_close_handler(websocketpp::lib::bind(&WebsocketTransport::on_close, this, _1));
    client_.set_message_handler(websocketpp::lib::bind(&WebsocketTransport::on_message, this, _1, _2));
}

WebsocketTransport::~WebsocketTransport() {
    stop();
}

bool WebsocketTransport::start() {
    websocketpp::lib::error_code ec;
    auto con = client_.get_connection(url_, ec);
    if (ec) {
        EVLOG_error << "Invalid websocket url " << url_ << ": " << ec.message();
        return false;
    }
    client_.connect(con);
    started_ = true;
    io_thread_ = std::thread([this]() {
        try {
            client_.run();
        } catch (const std::exception& e) {
            EVLOG_error << "Websocket io loop error: " << e.what();
        }
        if (connected_.exchange(false)) {
            notify_connection_state(false);
        }
    });

    std::unique_lock<std::mutex> lock(mutex_);
    // The handshake timer inside websocketpp fires first; the extra second only guards a stuck resolver.
    cv_.wait_for(lock, connect_timeout_ + std::chrono::seconds(1), [this]() { return connected_ || failed_; });
    if (!connected_) {
        lock.unlock();
        EVLOG_error << "Websocket connection to " << url_ << " not established within " << connect_timeout_.count()
                    << " s";
        stop();
        return false;
    }
    EVLOG_info << "Websocket connected: " << url_;
    return true;
}

void WebsocketTransport::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    if (connected_) {
        websocketpp::lib::error_code ec;
        client_.close(hdl_, websocketpp::close::status::normal, "shutdown", ec);
        if (ec) {
            EVLOG_warning << "Websocket close failed: " << ec.message();
        }
    }
    client_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    connected_ = false;
}

bool WebsocketTransport::send(const std::string& text) {
    if (!connected_) {
        EVLOG_warning << "Websocket not connected, message dropped";
        return false;
    }
    websocketpp::lib::error_code ec;
    client_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        EVLOG_error << "Websocket send failed: " << ec.message();
        return false;
    }
    EVLOG_debug << "Sent: " << text;
    return true;
}

void WebsocketTransport::on_open(websocketpp::connection_hdl hdl) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hdl_ = hdl;
        connected_ = true;
    }
    cv_.notify_all();
    notify_connection_state(true);
}

void WebsocketTransport::on_fail(websocketpp::connection_hdl hdl) {
    auto con = client_.get_con_from_hdl(hdl);
    EVLOG_error << "Websocket connection failed: " << con->get_ec().message();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_ = true;
    }
    cv_.notify_all();
}

void WebsocketTransport::on_close(websocketpp::connection_hdl hdl) {
    auto con = client_.get_con_from_hdl(hdl);
    EVLOG_info << "Websocket closed by " << (con->get_remote_close_code() == websocketpp::close::status::blank
                                                 ? "local side"
                                                 : "peer")
               << ": " << con->get_remote_close_reason();
    if (connected_.exchange(false)) {
        notify_connection_state(false);
    }
}

void WebsocketTransport::on_message(websocketpp::connection_hdl, Client::message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        EVLOG_warning << "Ignoring non-text websocket frame (opcode " << static_cast<int>(msg->get_opcode()) << ")";
        return;
    }
    EVLOG_debug << "Received: " << msg->get_payload();
    notify_message(msg->get_payload());
}

} // namespace pilesim
