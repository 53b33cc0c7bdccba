#include "cli.hpp"
#include "protocol/constants.hpp"
#include <cctype>

namespace cli {

namespace {

std::optional<uint16_t> parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5) return std::nullopt;
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return std::nullopt;
    return static_cast<uint16_t>(value);
}

} // namespace

std::optional<SendArgs> parse_send_args(const std::vector<std::string>& args) {
    SendArgs out;
    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "--binary") {
            out.binary = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 3) return std::nullopt;

    auto port = parse_port(positional[1]);
    if (!port) return std::nullopt;

    out.host = positional[0];
    out.port = *port;
    out.filepath = positional[2];
    return out;
}

std::string service_banner(uint16_t port) {
    return std::string(protocol::SERVICE_FULL_NAME) + "." + protocol::SERVICE_DOMAIN +
           " (" + protocol::SERVICE_TYPE + ") port " + std::to_string(port);
}

} // namespace cli
