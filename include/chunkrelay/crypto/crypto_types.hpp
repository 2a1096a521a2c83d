#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace chunkrelay::crypto {

constexpr size_t CONTENT_HASH_SIZE = 32; // BLAKE2b-256
constexpr size_t SHA256_HASH_SIZE = 32;

using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;
using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

// Initializes libsodium once; safe to call from any thread.
bool ensure_sodium_initialized();

// Byte buffer that is wiped when released. Holds credentials.
struct SecureBytes {
    std::vector<std::uint8_t> data;

    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    explicit SecureBytes(const std::string& text);
    SecureBytes(std::span<const std::uint8_t> bytes);

    ~SecureBytes();

    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    std::span<const std::uint8_t> span() const { return std::span(data); }
    std::string to_string() const { return std::string(data.begin(), data.end()); }

    void clear();
    void assign(const std::string& text);
};

}
