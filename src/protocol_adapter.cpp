// SPDX-License-Identifier: Apache-2.0
#include "protocol_adapter.hpp"
#include "errors.hpp"

#include <array>
#include <limits>
#include <utility>

#include <everest/logging.hpp>

namespace pilesim {

namespace {

constexpr std::array<std::pair<MessageType, const char*>, 13> MESSAGE_NAMES{{
    {MessageType::Register, "register"},
    {MessageType::Queued, "queued"},
    {MessageType::Admitted, "admitted"},
    {MessageType::Update, "update"},
    {MessageType::Complete, "complete"},
    {MessageType::Fault, "fault"},
    {MessageType::Cancelled, "cancelled"},
    {MessageType::Rejected, "rejected"},
    {MessageType::Error, "error"},
    {MessageType::New, "new"},
    {MessageType::Cancel, "cancel"},
    {MessageType::Close, "close"},
    {MessageType::Open, "open"},
}};

nlohmann::json instant_or_null(const std::optional<SimTime>& t) {
    if (!t) {
        return nullptr;
    }
    return to_rfc3339(*t);
}

bool is_unset(const nlohmann::json& detail, const char* key) {
    return !detail.contains(key) || detail.at(key).is_null();
}

bool is_zero(const nlohmann::json& detail, const char* key) {
    return is_unset(detail, key) || detail.at(key).get<double>() == 0.0;
}

MessageType outbound_type(PileEventType type) {
    switch (type) {
    case PileEventType::Queued:
        return MessageType::Queued;
    case PileEventType::Admitted:
        return MessageType::Admitted;
    case PileEventType::Progress:
        return MessageType::Update;
    case PileEventType::Completed:
        return MessageType::Complete;
    case PileEventType::Interrupted:
        return MessageType::Fault;
    case PileEventType::Cancelled:
        return MessageType::Cancelled;
    case PileEventType::Rejected:
        return MessageType::Rejected;
    }
    return MessageType::Error;
}

std::uint32_t request_id_from_json(const nlohmann::json& data) {
    if (!data.contains("id") || !data.at("id").is_number_integer()) {
        throw ProtocolDecodeError("Missing or non-integer request id");
    }
    const auto id = data.at("id").get<std::int64_t>();
    if (id < 0 || id > std::numeric_limits<std::uint32_t>::max()) {
        throw ProtocolDecodeError("Request id out of range: " + std::to_string(id));
    }
    return static_cast<std::uint32_t>(id);
}

} // namespace

const char* to_string(MessageType type) {
    for (const auto& [t, name] : MESSAGE_NAMES) {
        if (t == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(const std::string& s) {
    for (const auto& [t, name] : MESSAGE_NAMES) {
        if (s == name) {
            return t;
        }
    }
    return std::nullopt;
}

Envelope decode_envelope(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolDecodeError(std::string("Malformed JSON: ") + e.what());
    }
    if (!json.is_object()) {
        throw ProtocolDecodeError("Message is not a JSON object");
    }
    if (!json.contains("type") || !json.at("type").is_string()) {
        throw ProtocolDecodeError("Message has no type");
    }
    const auto type_name = json.at("type").get<std::string>();
    const auto type = message_type_from_string(type_name);
    if (!type) {
        throw ProtocolDecodeError("Unknown message type '" + type_name + "'");
    }

    Envelope env;
    env.type = *type;
    if (json.contains("pile_id") && !json.at("pile_id").is_null()) {
        if (!json.at("pile_id").is_string()) {
            throw ProtocolDecodeError("pile_id must be a string");
        }
        env.pile_id = json.at("pile_id").get<std::string>();
    }
    if (json.contains("time") && json.at("time").is_string()) {
        try {
            env.time = parse_instant(json.at("time").get<std::string>(), nullptr);
        } catch (const ConfigurationError& e) {
            throw ProtocolDecodeError(e.what());
        }
    }
    if (json.contains("data") && !json.at("data").is_null()) {
        const auto& data = json.at("data");
        if (data.is_string()) {
            // Older peers send the detail JSON-encoded inside a string.
            try {
                env.data = nlohmann::json::parse(data.get<std::string>());
            } catch (const nlohmann::json::parse_error& e) {
                throw ProtocolDecodeError(std::string("Malformed data payload: ") + e.what());
            }
        } else {
            env.data = data;
        }
        if (!env.data.is_object()) {
            throw ProtocolDecodeError("data must be a JSON object");
        }
    }
    return env;
}

std::string encode_envelope(MessageType type, const std::string& pile_id, SimTime at, const nlohmann::json& data) {
    nlohmann::json json;
    json["type"] = to_string(type);
    json["pile_id"] = pile_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(pile_id);
    json["time"] = to_rfc3339(at);
    json["data"] = data;
    // Replace invalid UTF-8 so echoed peer bytes cannot make the encoder throw.
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json session_to_json(const ChargeSession& session) {
    const auto& request = session.request();
    return nlohmann::json{
        {"id", request.id},
        {"charge_type", to_string(request.charge_type)},
        {"request_amount", request.target_energy_kwh},
        {"power", session.power_kw()},
        {"already_charged", session.energy_delivered_kwh()},
        {"start_time", instant_or_null(session.session_start())},
        {"last_update_time", instant_or_null(session.last_billed_instant())},
        {"end_time", instant_or_null(session.end_instant())},
        {"charge_cost", session.cost_accrued()},
        {"service_fee", session.service_fee_total()},
        {"total_cost", session.total_cost()},
        {"status", to_string(session.status())},
    };
}

ChargeRequest request_from_json(const nlohmann::json& detail, ChargeType default_type) {
    ChargeRequest request;
    try {
        request.id = request_id_from_json(detail);
        request.target_energy_kwh = detail.value("request_amount", 0.0);
        request.requested_power_kw = detail.value("power", 0.0);
        request.charge_type = default_type;
        if (detail.contains("charge_type") && !detail.at("charge_type").is_null()) {
            const auto name = detail.at("charge_type").get<std::string>();
            const auto type = charge_type_from_string(name);
            if (!type) {
                throw ProtocolDecodeError("Unknown charge_type '" + name + "'");
            }
            request.charge_type = *type;
        }

        const bool fresh = is_zero(detail, "already_charged") && is_unset(detail, "start_time") &&
                           is_unset(detail, "last_update_time") && is_unset(detail, "end_time") &&
                           is_zero(detail, "charge_cost") && is_zero(detail, "service_fee") &&
                           is_zero(detail, "total_cost") && detail.value("status", "waiting") == "waiting";
        if (!fresh) {
            throw ProtocolDecodeError("Request " + std::to_string(request.id) + " is not a fresh waiting request");
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolDecodeError(std::string("Malformed request detail: ") + e.what());
    }
    if (request.target_energy_kwh < 0.0 || request.requested_power_kw < 0.0) {
        throw ProtocolDecodeError("Request " + std::to_string(request.id) + " has negative amount or power");
    }
    return request;
}

nlohmann::json pile_to_json(const PileConfig& cfg) {
    return nlohmann::json{
        {"charge_id", cfg.id},
        {"type", to_string(cfg.charge_type)},
        {"power", cfg.rated_power_kw},
        {"size", cfg.queue_capacity},
        {"allow_break", cfg.allow_interruption},
    };
}

ProtocolAdapter::ProtocolAdapter(std::shared_ptr<Transport> transport, const SimulatedClock& clock) :
    transport_(std::move(transport)), clock_(clock) {
}

void ProtocolAdapter::attach(Pile& pile, PileDriver& driver) {
    routes_[pile.id()] = Route{&pile, &driver};
    pile.set_event_sink([this](const PileEvent& event) { on_pile_event(event); });
}

void ProtocolAdapter::bind() {
    transport_->register_message_callback([this](const std::string& text) { handle_message(text); });
}

void ProtocolAdapter::send_register() {
    const auto now = clock_.now();
    for (const auto& [id, route] : routes_) {
        send(MessageType::Register, id, now, pile_to_json(route.pile->config()));
        EVLOG_info << "[" << id << "] Registered with dispatch service";
    }
}

void ProtocolAdapter::handle_message(const std::string& text) {
    try {
        dispatch(decode_envelope(text));
    } catch (const ProtocolDecodeError& e) {
        EVLOG_error << "Dropping inbound message: " << e.what();
        send_error("decode_error", e.what());
    } catch (const std::exception& e) {
        EVLOG_warning << "Inbound message handler error: " << e.what();
    }
}

void ProtocolAdapter::on_pile_event(const PileEvent& event) {
    auto data = session_to_json(event.session);
    if (event.type == PileEventType::Rejected) {
        data["reason"] = to_string(event.reason);
    }
    send(outbound_type(event.type), event.pile_id, event.at, data);
}

bool ProtocolAdapter::inject_fault(const std::string& pile_id) {
    try {
        auto& route = resolve(pile_id.empty() ? std::nullopt : std::optional<std::string>(pile_id));
        route.driver->post([](Pile& pile) { pile.interrupt(); });
        return true;
    } catch (const ProtocolDecodeError& e) {
        EVLOG_warning << "Fault injection ignored: " << e.what();
        return false;
    }
}

ProtocolAdapter::Route& ProtocolAdapter::resolve(const std::optional<std::string>& pile_id) {
    if (!pile_id) {
        if (routes_.size() != 1) {
            throw ProtocolDecodeError("pile_id is required when " + std::to_string(routes_.size()) +
                                      " piles are running");
        }
        return routes_.begin()->second;
    }
    auto it = routes_.find(*pile_id);
    if (it == routes_.end()) {
        throw ProtocolDecodeError("Unknown pile '" + *pile_id + "'");
    }
    return it->second;
}

void ProtocolAdapter::dispatch(const Envelope& envelope) {
    switch (envelope.type) {
    case MessageType::New: {
        auto& route = resolve(envelope.pile_id);
        auto request = request_from_json(envelope.data, route.pile->config().charge_type);
        EVLOG_info << "[" << route.pile->id() << "] New request " << request.id << " for " << request.target_energy_kwh
                   << " kWh";
        route.driver->post([request](Pile& pile) { pile.submit(request); });
        break;
    }
    case MessageType::Cancel: {
        auto& route = resolve(envelope.pile_id);
        const auto id = request_id_from_json(envelope.data);
        route.driver->post([id](Pile& pile) { pile.cancel(id); });
        break;
    }
    case MessageType::Close:
        resolve(envelope.pile_id).driver->post([](Pile& pile) { pile.close(); });
        break;
    case MessageType::Open:
        resolve(envelope.pile_id).driver->post([](Pile& pile) { pile.open(); });
        break;
    default:
        EVLOG_warning << "Ignoring inbound message of type " << to_string(envelope.type);
        break;
    }
}

void ProtocolAdapter::send(MessageType type, const std::string& pile_id, SimTime at, const nlohmann::json& data) {
    const auto text = encode_envelope(type, pile_id, at, data);
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!transport_->send(text)) {
        EVLOG_warning << "[" << pile_id << "] Failed to send " << to_string(type) << " message";
    }
}

void ProtocolAdapter::send_error(const std::string& reason, const std::string& detail) {
    send(MessageType::Error, "", clock_.now(), nlohmann::json{{"reason", reason}, {"message", detail}});
}

} // namespace pilesim
