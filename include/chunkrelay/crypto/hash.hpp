#pragma once

#include "crypto_types.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkrelay::crypto {

// Streaming BLAKE2b-256 over the bytes of a transfer.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(std::span<const std::uint8_t> data);

    // Consumes the hasher; later calls return the same digest.
    ContentHash finalize();

    static ContentHash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class Sha256 {
public:
    static Sha256Hash hash(std::span<const std::uint8_t> data);
    static Sha256Hash hash(const std::string& text);
};

Sha256Hash hmac_sha256(std::span<const std::uint8_t> key, const std::string& message);

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);

template<size_t N>
std::string to_hex(const std::array<std::uint8_t, N>& bytes) {
    return to_hex(std::span<const std::uint8_t>(bytes.data(), bytes.size()));
}

std::optional<ContentHash> content_hash_from_hex(const std::string& hex_string);

std::string to_base64(std::span<const std::uint8_t> bytes);

// Standard alphabet with padding. Decoded straight into wiped storage since
// the input is usually a key.
std::optional<SecureBytes> secure_from_base64(const std::string& text);

}

}
