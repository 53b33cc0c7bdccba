#pragma once

#include <stdexcept>
#include <string>

namespace errors {

enum class Code {
    PROTOCOL_VERSION_MISMATCH,
    MALFORMED_MESSAGE,
    UNSUPPORTED_FILE_TYPE,
    INSUFFICIENT_STORAGE,
    CHECKSUM_MISMATCH,
    INCOMPLETE_TRANSFER,
    DISK_ERROR,
    PEER_BUSY,
    TIMEOUT,
    TRANSPORT_CLOSED,
    INVALID_PAIRING_CODE,
    INVALID_ADDRESS,
    TRANSFER_REJECTED
};

// Upper-snake name used in errorCode fields on the wire
const char* wire_code(Code code);
// Inverse of wire_code for the codes a peer may report; `fallback` otherwise
Code code_from_wire(const std::string& wire, Code fallback);

class Error : public std::runtime_error {
public:
    Error(Code code, const std::string& message);

    Code code() const noexcept { return code_; }

private:
    Code code_;
};

} // namespace errors
