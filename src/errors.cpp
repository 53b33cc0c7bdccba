#include "errors.hpp"

namespace errors {

const char* wire_code(Code code) {
    switch (code) {
        case Code::PROTOCOL_VERSION_MISMATCH: return "PROTOCOL_VERSION_MISMATCH";
        case Code::MALFORMED_MESSAGE:         return "PARSE_ERROR";
        case Code::UNSUPPORTED_FILE_TYPE:     return "UNSUPPORTED_FILE_TYPE";
        case Code::INSUFFICIENT_STORAGE:      return "INSUFFICIENT_STORAGE";
        case Code::CHECKSUM_MISMATCH:         return "CHECKSUM_MISMATCH";
        case Code::INCOMPLETE_TRANSFER:       return "INCOMPLETE_TRANSFER";
        case Code::DISK_ERROR:                return "DISK_ERROR";
        case Code::PEER_BUSY:                 return "PEER_BUSY";
        // file_complete only admits three codes, a watchdog expiry reads as incomplete
        case Code::TIMEOUT:                   return "INCOMPLETE_TRANSFER";
        case Code::TRANSPORT_CLOSED:          return "TRANSPORT_CLOSED";
        case Code::INVALID_PAIRING_CODE:      return "INVALID_PAIRING_CODE";
        case Code::INVALID_ADDRESS:           return "INVALID_ADDRESS";
        case Code::TRANSFER_REJECTED:         return "TRANSFER_REJECTED";
    }
    return "UNKNOWN";
}

Code code_from_wire(const std::string& wire, Code fallback) {
    if (wire == "CHECKSUM_MISMATCH")   return Code::CHECKSUM_MISMATCH;
    if (wire == "INCOMPLETE_TRANSFER") return Code::INCOMPLETE_TRANSFER;
    if (wire == "DISK_ERROR")          return Code::DISK_ERROR;
    if (wire == "PARSE_ERROR")         return Code::MALFORMED_MESSAGE;
    if (wire == "PEER_BUSY")           return Code::PEER_BUSY;
    return fallback;
}

Error::Error(Code code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace errors
