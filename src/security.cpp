#include "security.hpp"
#include "errors.hpp"
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <stdexcept>

namespace security {

namespace {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string to_hex(const unsigned char* bytes, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace

struct Sha256::State {
    crypto_hash_sha256_state ctx;
};

Sha256::Sha256() : state_(std::make_unique<State>()) {
    ensure_sodium();
    crypto_hash_sha256_init(&state_->ctx);
}

Sha256::~Sha256() = default;

void Sha256::update(const uint8_t* data, size_t size) {
    crypto_hash_sha256_update(&state_->ctx, data, size);
}

std::string Sha256::final_hex() {
    unsigned char hash[crypto_hash_sha256_BYTES]; // 32 bytes
    crypto_hash_sha256_final(&state_->ctx, hash);
    return to_hex(hash, sizeof(hash));
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.final_hex();
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

bool digest_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_sha256_hex(const std::string& s) {
    if (s.size() != crypto_hash_sha256_BYTES * 2) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string base64_encode(const uint8_t* data, size_t size) {
    ensure_sodium();
    const size_t encoded_len = sodium_base64_encoded_len(size, sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(&out[0], out.size(), data, size, sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1); // drop the terminating NUL
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    ensure_sodium();
    std::vector<uint8_t> out(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != encoded.data() + encoded.size()) {
        throw errors::Error(errors::Code::MALFORMED_MESSAGE, "Invalid base64 payload");
    }
    out.resize(decoded_len);
    return out;
}

} // namespace security
