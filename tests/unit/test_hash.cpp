#include <gtest/gtest.h>
#include "chunkrelay/crypto/hash.hpp"
#include "unit/test_fakes.hpp"

using namespace chunkrelay::crypto;

namespace {

std::span<const std::uint8_t> bytes_of(const std::string& text) {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ensure_sodium_initialized());
    }
};

TEST_F(HashTest, ContentHashKnownVectors) {
    EXPECT_EQ(hash_utils::to_hex(ContentHasher::hash(bytes_of(""))),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
    EXPECT_EQ(hash_utils::to_hex(ContentHasher::hash(bytes_of("abc"))),
              "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
}

TEST_F(HashTest, StreamingMatchesOneShot) {
    auto payload = chunkrelay::fakes::make_payload(10000);
    auto expected = ContentHasher::hash(payload);

    ContentHasher hasher;
    std::span<const std::uint8_t> all(payload);
    hasher.update(all.subspan(0, 1));
    hasher.update(all.subspan(1, 4095));
    hasher.update(all.subspan(4096));

    EXPECT_EQ(hasher.finalize(), expected);
    // Finalizing again returns the same digest.
    EXPECT_EQ(hasher.finalize(), expected);
}

TEST_F(HashTest, UpdateAfterFinalizeThrows) {
    ContentHasher hasher;
    hasher.finalize();
    EXPECT_THROW(hasher.update(bytes_of("late")), std::logic_error);
}

TEST_F(HashTest, Sha256KnownVector) {
    EXPECT_EQ(hash_utils::to_hex(Sha256::hash(std::string("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hash_utils::to_hex(Sha256::hash(std::string())),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, HmacSha256KnownVector) {
    // RFC 4231 test case 2
    auto mac = hmac_sha256(bytes_of("Jefe"), "what do ya want for nothing?");
    EXPECT_EQ(hash_utils::to_hex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(HashTest, HexParsing) {
    auto digest = ContentHasher::hash(bytes_of("abc"));
    auto parsed = hash_utils::content_hash_from_hex(hash_utils::to_hex(digest));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, digest);

    EXPECT_FALSE(hash_utils::content_hash_from_hex("abcd").has_value());
    EXPECT_FALSE(hash_utils::content_hash_from_hex(std::string(64, 'z')).has_value());
}

TEST_F(HashTest, Base64) {
    EXPECT_EQ(hash_utils::to_base64(bytes_of("hello")), "aGVsbG8=");
    EXPECT_EQ(hash_utils::to_base64(bytes_of("")), "");
}

TEST_F(HashTest, SecureBytesClearsOnMove) {
    SecureBytes secret(std::string("hunter2"));
    EXPECT_EQ(secret.to_string(), "hunter2");

    SecureBytes moved(std::move(secret));
    EXPECT_EQ(moved.to_string(), "hunter2");
    EXPECT_TRUE(secret.empty());

    moved.clear();
    EXPECT_TRUE(moved.empty());
}
