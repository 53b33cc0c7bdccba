#include "protocol/handshake.hpp"
#include "protocol/constants.hpp"
#include "errors.hpp"
#include <algorithm>

namespace protocol {

void to_json(nlohmann::json& j, const ClientInfo& info) {
    j = nlohmann::json{{"deviceName", info.device_name}};
    if (info.platform) j["platform"] = *info.platform;
    if (info.version) j["version"] = *info.version;
    if (info.app_version) j["appVersion"] = *info.app_version;
}

HandshakeProtocol::HandshakeProtocol(std::string supported_version, bool offer_binary_chunks)
    : supported_version_(std::move(supported_version)),
      offer_binary_chunks_(offer_binary_chunks) {}

HandshakeProtocol::Outcome HandshakeProtocol::handle(const Handshake& message) {
    if (state_ != State::AWAITING_HANDSHAKE) {
        throw errors::Error(errors::Code::PEER_BUSY, "Handshake already completed for this connection");
    }

    Outcome outcome;
    if (message.version != supported_version_) {
        state_ = State::REJECTED;
        outcome.ack.accepted = false;
        outcome.ack.message = "Protocol mismatch: expected " + supported_version_ +
                              ", received " + message.version;
        return outcome;
    }

    state_ = State::ACCEPTED;
    outcome.ack.accepted = true;

    const auto& caps = message.capabilities;
    binary_chunks_ = offer_binary_chunks_ &&
        std::find(caps.begin(), caps.end(), CAPABILITY_BINARY_CHUNKS) != caps.end();
    if (binary_chunks_) {
        outcome.ack.capabilities.push_back(CAPABILITY_BINARY_CHUNKS);
    }

    outcome.client = ClientInfo{
        message.device_name.empty() ? DEFAULT_DEVICE_NAME : message.device_name,
        message.platform,
        message.version,
        message.app_version
    };
    return outcome;
}

} // namespace protocol
