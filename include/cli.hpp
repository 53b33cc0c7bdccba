#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <vector>

namespace cli {

struct SendArgs {
    std::string host;
    uint16_t port = 0;
    std::string filepath;
    bool binary = false;
};

// Arguments after "send"; --binary may appear anywhere. Empty when the
// positionals are missing or the port is not a number in 1..65535.
std::optional<SendArgs> parse_send_args(const std::vector<std::string>& args);

// Discovery name the desktop side resolves, e.g.
// "_cherrystudio._tcp.local. (cherrystudio) port 53317"
std::string service_banner(uint16_t port);

} // namespace cli
