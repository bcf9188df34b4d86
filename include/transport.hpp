// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <string>
#include <utility>

namespace pilesim {

/// \brief Bidirectional text-message channel to the dispatch service.
class Transport {
public:
    using MessageCallback = std::function<void(const std::string& text)>;
    using ConnectionStateCallback = std::function<void(bool connected)>;

    virtual ~Transport() = default;

    /// \brief Connect. \returns false when the channel could not be established.
    virtual bool start() = 0;
    virtual void stop() = 0;
    /// \returns false when the message could not be handed to the channel.
    virtual bool send(const std::string& text) = 0;
    virtual bool connected() const = 0;

    void register_message_callback(MessageCallback cb) {
        message_cb_ = std::move(cb);
    }
    void register_connection_state_callback(ConnectionStateCallback cb) {
        state_cb_ = std::move(cb);
    }

protected:
    void notify_message(const std::string& text) {
        if (message_cb_) {
            message_cb_(text);
        }
    }
    void notify_connection_state(bool connected) {
        if (state_cb_) {
            state_cb_(connected);
        }
    }

private:
    MessageCallback message_cb_;
    ConnectionStateCallback state_cb_;
};

} // namespace pilesim
