#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <memory>

namespace security {

// Incremental SHA-256 over libsodium's crypto_hash_sha256 state
class Sha256 {
public:
    Sha256();
    ~Sha256();

    void update(const uint8_t* data, size_t size);
    // Returns 64 lowercase hex characters; the hasher is spent afterwards
    std::string final_hex();

private:
    struct State;
    std::unique_ptr<State> state_;
};

std::string sha256_hex(const uint8_t* data, size_t size);
std::string sha256_hex(const std::vector<uint8_t>& data);

// Case-insensitive comparison of two hex digests
bool digest_equals(const std::string& a, const std::string& b);

bool is_sha256_hex(const std::string& s);

std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const std::vector<uint8_t>& data);

// Throws errors::Error(MALFORMED_MESSAGE) on invalid input
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace security
