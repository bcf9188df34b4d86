// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pile.hpp"
#include "pile_driver.hpp"
#include "sim_clock.hpp"
#include "transport.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pilesim {

enum class MessageType { Register, Queued, Admitted, Update, Complete, Fault, Cancelled, Rejected, Error, New, Cancel,
                         Close, Open };

/// \brief Decoded wire envelope: {"type", "pile_id", "time", "data"}.
struct Envelope {
    MessageType type{MessageType::Error};
    std::optional<std::string> pile_id;
    std::optional<SimTime> time;
    nlohmann::json data = nlohmann::json::object();
};

const char* to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& s);

/// \throws ProtocolDecodeError on malformed JSON, unknown type or a data field that is neither object nor
/// JSON-encoded object.
Envelope decode_envelope(const std::string& text);
std::string encode_envelope(MessageType type, const std::string& pile_id, SimTime at, const nlohmann::json& data);

/// \brief Session detail as exchanged on the wire.
nlohmann::json session_to_json(const ChargeSession& session);

/// \brief Build a request from a `new` detail. The detail has to be fresh: nothing charged, no times set and
/// status waiting. A missing charge_type falls back to \p default_type. \throws ProtocolDecodeError otherwise.
ChargeRequest request_from_json(const nlohmann::json& detail, ChargeType default_type);

/// \brief Describes one pile in the `register` message.
nlohmann::json pile_to_json(const PileConfig& cfg);

/// \brief Bridges the transport and the piles: inbound messages become operations posted to the pile's driver,
/// pile events become outbound messages.
///
/// Events arrive on each pile's driver thread; sends are serialized under one mutex so a pile's messages leave in
/// the order its transitions happened.
class ProtocolAdapter {
public:
    ProtocolAdapter(std::shared_ptr<Transport> transport, const SimulatedClock& clock);

    /// \brief Route messages for \p pile through \p driver and subscribe to its events.
    /// Call before the driver starts.
    void attach(Pile& pile, PileDriver& driver);

    /// \brief Hook the transport callbacks. Incoming text is decoded and dispatched.
    void bind();

    /// \brief Announce every attached pile.
    void send_register();

    void handle_message(const std::string& text);
    void on_pile_event(const PileEvent& event);

    /// \brief Post a simulated fault to a pile; an empty id addresses the only pile.
    bool inject_fault(const std::string& pile_id);

private:
    struct Route {
        Pile* pile;
        PileDriver* driver;
    };

    std::shared_ptr<Transport> transport_;
    const SimulatedClock& clock_;
    std::map<std::string, Route> routes_;
    std::mutex send_mutex_;

    Route& resolve(const std::optional<std::string>& pile_id);
    void dispatch(const Envelope& envelope);
    void send(MessageType type, const std::string& pile_id, SimTime at, const nlohmann::json& data);
    void send_error(const std::string& reason, const std::string& detail);
};

} // namespace pilesim
