#pragma once

#include <string>
#include <optional>
#include "protocol/messages.hpp"

namespace protocol {

struct ClientInfo {
    std::string device_name;
    std::optional<std::string> platform;
    std::optional<std::string> version;
    std::optional<std::string> app_version;
};

void to_json(nlohmann::json& j, const ClientInfo& info);

// Validates one peer's declared protocol version. Exact match only, there is
// no negotiation of older versions.
class HandshakeProtocol {
public:
    enum class State { AWAITING_HANDSHAKE, ACCEPTED, REJECTED };

    struct Outcome {
        HandshakeAck ack;
        std::optional<ClientInfo> client; // set when accepted
    };

    explicit HandshakeProtocol(std::string supported_version, bool offer_binary_chunks = true);

    // Throws errors::Error(PEER_BUSY) once a handshake was already processed
    Outcome handle(const Handshake& message);

    State state() const { return state_; }
    bool accepted() const { return state_ == State::ACCEPTED; }
    bool binary_chunks() const { return binary_chunks_; }

private:
    std::string supported_version_;
    bool offer_binary_chunks_;
    bool binary_chunks_ = false;
    State state_ = State::AWAITING_HANDSHAKE;
};

} // namespace protocol
