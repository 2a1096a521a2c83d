#include "chunkrelay/crypto/crypto_types.hpp"
#include <algorithm>
#include <cstring>

#include <sodium.h>

namespace chunkrelay::crypto {

bool ensure_sodium_initialized() {
    // sodium_init() returns 1 when already initialized.
    static const bool initialized = sodium_init() >= 0;
    return initialized;
}

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(const std::string& text) : data(text.begin(), text.end()) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes)
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : data(std::move(other.data)) {
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::assign(const std::string& text) {
    clear();
    data.assign(text.begin(), text.end());
}

}
