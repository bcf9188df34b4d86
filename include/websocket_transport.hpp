// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

namespace pilesim {

/// \brief Plain ws:// client. The asio loop runs on its own thread; callbacks fire there.
class WebsocketTransport : public Transport {
public:
    WebsocketTransport(std::string url, std::chrono::seconds connect_timeout);
    ~WebsocketTransport() override;

    bool start() override;
    void stop() override;
    bool send(const std::string& text) override;
    bool connected() const override { return connected_; }

private:
    using Client = websocketpp::client<websocketpp::config::asio_client>;

    std::string url_;
    std::chrono::seconds connect_timeout_;
    Client client_;
    websocketpp::connection_hdl hdl_;
    std::thread io_thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> connected_{false};
    bool failed_{false};
    bool started_{false};

    void on_open(websocketpp::connection_hdl hdl);
    void on_fail(websocketpp::connection_hdl hdl);
    void on_close(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, Client::message_ptr msg);
};

} // namespace pilesim
