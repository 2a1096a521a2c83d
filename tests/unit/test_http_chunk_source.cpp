#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "chunkrelay/network/http_chunk_source.hpp"
#include "unit/test_fakes.hpp"

using namespace chunkrelay::network;
using namespace chunkrelay::transfer;
using namespace chunkrelay::fakes;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;

TEST(ContentRangeTest, ParsesSatisfiedRange) {
    auto range = parse_content_range("bytes 0-1023/4096");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, 0u);
    EXPECT_EQ(range->last, 1023u);
    EXPECT_EQ(range->total, 4096u);
    EXPECT_FALSE(range->unsatisfied);
}

TEST(ContentRangeTest, UnknownTotal) {
    auto range = parse_content_range("bytes 100-199/*");
    ASSERT_TRUE(range.has_value());
    EXPECT_FALSE(range->total.has_value());
}

TEST(ContentRangeTest, Unsatisfied) {
    auto range = parse_content_range("bytes */500");
    ASSERT_TRUE(range.has_value());
    EXPECT_TRUE(range->unsatisfied);
    EXPECT_EQ(range->total, 500u);
}

TEST(ContentRangeTest, RejectsMalformed) {
    EXPECT_FALSE(parse_content_range("").has_value());
    EXPECT_FALSE(parse_content_range("items 0-1/2").has_value());
    EXPECT_FALSE(parse_content_range("bytes 0-1").has_value());
    EXPECT_FALSE(parse_content_range("bytes 9-1/10").has_value());
    EXPECT_FALSE(parse_content_range("bytes */*").has_value());
    EXPECT_FALSE(parse_content_range("bytes a-b/10").has_value());
}

class HttpChunkSourceTest : public ::testing::Test {
protected:
    static constexpr const char* URL = "https://files.example.test/export.csv";

    FakeHttpClient http_;
    std::string object_ = "0123456789abcdefghij";

    // Serves Range requests against object_ the way a compliant server does.
    void serve_ranges() {
        http_.set_handler([this](const HttpRequest& request) {
            std::string range;
            for (const auto& [name, value] : request.headers) {
                if (name == "Range") range = value;
            }
            auto spec = range.substr(6);
            auto dash = spec.find('-');
            uint64_t first = std::stoull(spec.substr(0, dash));
            uint64_t last = std::stoull(spec.substr(dash + 1));
            if (first >= object_.size()) {
                return FakeHttpClient::respond(416, "", {{"content-range", "bytes */" + std::to_string(object_.size())}});
            }
            last = std::min<uint64_t>(last, object_.size() - 1);
            return FakeHttpClient::respond(206, object_.substr(first, last - first + 1),
                {{"content-range", "bytes " + std::to_string(first) + "-" + std::to_string(last) +
                                   "/" + std::to_string(object_.size())}});
        });
    }
};

TEST_F(HttpChunkSourceTest, RequestsExactRange) {
    serve_ranges();
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    auto result = source.fetch(8, 8, response, {});

    ASSERT_TRUE(result.success()) << result.describe();
    EXPECT_EQ(std::string(response.data.begin(), response.data.end()), "89abcdef");
    EXPECT_EQ(response.object_size, 20u);
    EXPECT_FALSE(response.end_of_object);

    auto requests = http_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, HttpMethod::GET);
    EXPECT_EQ(requests[0].url, URL);
    EXPECT_EQ(requests[0].header("Range"), "bytes=8-15");
    EXPECT_EQ(requests[0].max_body_bytes, 8u);
    EXPECT_FALSE(requests[0].header("Authorization").has_value());
}

TEST_F(HttpChunkSourceTest, LastRangeMarksEndOfObject) {
    serve_ranges();
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    ASSERT_TRUE(source.fetch(16, 8, response, {}).success());
    EXPECT_EQ(response.data.size(), 4u);
    EXPECT_TRUE(response.end_of_object);
}

TEST_F(HttpChunkSourceTest, RangePastEndIsEmptyAndFinal) {
    serve_ranges();
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    ASSERT_TRUE(source.fetch(20, 8, response, {}).success());
    EXPECT_TRUE(response.data.empty());
    EXPECT_TRUE(response.end_of_object);
    EXPECT_EQ(response.object_size, 20u);
}

TEST_F(HttpChunkSourceTest, UnsatisfiableInsideObjectIsPermanent) {
    http_.enqueue(FakeHttpClient::respond(416, "", {{"content-range", "bytes */100"}}));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    EXPECT_EQ(source.fetch(50, 8, response, {}).kind, ErrorKind::PERMANENT);
}

TEST_F(HttpChunkSourceTest, ShortBodyIsTransient) {
    http_.enqueue(FakeHttpClient::respond(206, "0123", {{"content-range", "bytes 0-7/20"}}));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    EXPECT_EQ(source.fetch(0, 8, response, {}).kind, ErrorKind::TRANSIENT);
}

TEST_F(HttpChunkSourceTest, WrongOffsetIsPermanent) {
    http_.enqueue(FakeHttpClient::respond(206, "01234567", {{"content-range", "bytes 0-7/20"}}));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    EXPECT_EQ(source.fetch(8, 8, response, {}).kind, ErrorKind::PERMANENT);
}

TEST_F(HttpChunkSourceTest, MissingContentRangeIsPermanent) {
    http_.enqueue(FakeHttpClient::respond(206, "01234567"));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    EXPECT_EQ(source.fetch(0, 8, response, {}).kind, ErrorKind::PERMANENT);
}

TEST_F(HttpChunkSourceTest, IgnoredRangeAcceptedForSmallObject) {
    http_.enqueue(FakeHttpClient::respond(200, "tiny"));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    ASSERT_TRUE(source.fetch(0, 64, response, {}).success());
    EXPECT_EQ(response.data.size(), 4u);
    EXPECT_TRUE(response.end_of_object);
    EXPECT_EQ(response.object_size, 4u);
}

TEST_F(HttpChunkSourceTest, IgnoredRangeRejectedMidObject) {
    http_.enqueue(FakeHttpClient::respond(200, object_));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    EXPECT_EQ(source.fetch(8, 8, response, {}).kind, ErrorKind::PERMANENT);

    auto oversized = FakeHttpClient::respond(200, "01234567");
    oversized.body_limit_exceeded = true;
    http_.enqueue(oversized);
    EXPECT_EQ(source.fetch(0, 8, response, {}).kind, ErrorKind::PERMANENT);
}

TEST_F(HttpChunkSourceTest, ThrottlingIsClassified) {
    http_.enqueue(FakeHttpClient::respond(429, "", {{"retry-after", "2"}}));
    HttpChunkSource source(http_, URL);

    FetchResponse response;
    auto result = source.fetch(0, 8, response, {});
    EXPECT_EQ(result.kind, ErrorKind::RATE_LIMITED);
    EXPECT_EQ(result.retry_after, std::chrono::milliseconds(2000));
}

TEST_F(HttpChunkSourceTest, BearerTokenIsAttached) {
    serve_ranges();
    MockTokenProvider tokens;
    EXPECT_CALL(tokens, get_token(_, _))
        .WillOnce(DoAll(SetArgReferee<0>(std::string("abc.def")), Return(TransferResult::ok())));

    HttpChunkSource source(http_, URL, &tokens);
    FetchResponse response;
    ASSERT_TRUE(source.fetch(0, 4, response, {}).success());

    EXPECT_EQ(http_.requests()[0].header("Authorization"), "Bearer abc.def");
}

TEST_F(HttpChunkSourceTest, TokenFailureSkipsRequest) {
    MockTokenProvider tokens;
    EXPECT_CALL(tokens, get_token(_, _)).WillOnce(Return(TransferResult::transient("token endpoint down")));

    HttpChunkSource source(http_, URL, &tokens);
    FetchResponse response;
    EXPECT_EQ(source.fetch(0, 4, response, {}).kind, ErrorKind::TRANSIENT);
    EXPECT_TRUE(http_.requests().empty());
}

class HeadMetadataSourceTest : public ::testing::Test {
protected:
    FakeHttpClient http_;
};

TEST_F(HeadMetadataSourceTest, ReadsContentLength) {
    http_.enqueue(FakeHttpClient::respond(200, "", {{"content-length", "1048576"}}));
    HeadMetadataSource metadata(http_);

    std::optional<uint64_t> size;
    ASSERT_TRUE(metadata.resolve_size("https://files.example.test/a.bin", size, {}).success());
    EXPECT_EQ(size, 1048576u);
    EXPECT_EQ(http_.requests()[0].method, HttpMethod::HEAD);
}

TEST_F(HeadMetadataSourceTest, MissingLengthIsUnknown) {
    http_.enqueue(FakeHttpClient::respond(200, ""));
    HeadMetadataSource metadata(http_);

    std::optional<uint64_t> size = 5;
    ASSERT_TRUE(metadata.resolve_size("https://files.example.test/a.bin", size, {}).success());
    EXPECT_FALSE(size.has_value());
}

TEST_F(HeadMetadataSourceTest, HeadNotAllowedIsUnknown) {
    http_.enqueue(FakeHttpClient::respond(405, ""));
    HeadMetadataSource metadata(http_);

    std::optional<uint64_t> size;
    EXPECT_TRUE(metadata.resolve_size("https://files.example.test/a.bin", size, {}).success());
    EXPECT_FALSE(size.has_value());
}

TEST_F(HeadMetadataSourceTest, NotFoundIsPermanent) {
    HeadMetadataSource metadata(http_);

    std::optional<uint64_t> size;
    EXPECT_EQ(metadata.resolve_size("https://files.example.test/a.bin", size, {}).kind, ErrorKind::PERMANENT);
}
