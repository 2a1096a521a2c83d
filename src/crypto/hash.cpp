#include "chunkrelay/crypto/hash.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkrelay::crypto {

struct ContentHasher::Impl {
    crypto_generichash_state state;
    bool finalized = false;
    ContentHash digest{};
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>()) {
    if (!ensure_sodium_initialized()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    if (crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_HASH_SIZE) != 0) {
        throw std::runtime_error("Failed to initialize content hasher");
    }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(std::span<const std::uint8_t> data) {
    if (impl_->finalized) {
        throw std::logic_error("Content hasher already finalized");
    }
    crypto_generichash_update(&impl_->state, data.data(), data.size());
}

ContentHash ContentHasher::finalize() {
    if (!impl_->finalized) {
        crypto_generichash_final(&impl_->state, impl_->digest.data(), impl_->digest.size());
        impl_->finalized = true;
    }
    return impl_->digest;
}

ContentHash ContentHasher::hash(std::span<const std::uint8_t> data) {
    ContentHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

Sha256Hash Sha256::hash(std::span<const std::uint8_t> data) {
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

Sha256Hash Sha256::hash(const std::string& text) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    return hash(data);
}

Sha256Hash hmac_sha256(std::span<const std::uint8_t> key, const std::string& message) {
    crypto_auth_hmacsha256_state state;
    Sha256Hash result;

    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state,
                                  reinterpret_cast<const unsigned char*>(message.data()),
                                  message.size());
    crypto_auth_hmacsha256_final(&state, result.data());

    sodium_memzero(&state, sizeof(state));
    return result;
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<ContentHash> content_hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != CONTENT_HASH_SIZE * 2) {
        return std::nullopt;
    }

    ContentHash hash;
    size_t decoded = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex_string.data(), hex_string.size(),
                       nullptr, &decoded, nullptr) != 0 || decoded != hash.size()) {
        return std::nullopt;
    }

    return hash;
}

std::string to_base64(std::span<const std::uint8_t> bytes) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::vector<char> out(sodium_base64_ENCODED_LEN(bytes.size(), variant));
    sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), variant);
    return std::string(out.data());
}

std::optional<SecureBytes> secure_from_base64(const std::string& text) {
    if (text.empty() || !ensure_sodium_initialized()) {
        return std::nullopt;
    }

    SecureBytes out(text.size() / 4 * 3 + 3);
    size_t length = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data.data(), out.data.size(), text.data(), text.size(),
                          nullptr, &length, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != text.data() + text.size()) {
        return std::nullopt;
    }

    // Bytes past length were never written.
    out.data.resize(length);
    return out;
}

}

}
