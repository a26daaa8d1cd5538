#include <gtest/gtest.h>
#include "rup/network/http_parser.hpp"

#include <string>
#include <vector>

using namespace rup::network;

namespace {

rup::Result<bool> feed(HttpParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpParser, ParsesRequestFedInPieces) {
    HttpParser parser;
    const std::string raw =
        "PATCH /files/abc HTTP/1.1\r\n"
        "Tus-Resumable: 1.0.0\r\n"
        "Upload-Offset: 1024\r\n"
        "Content-Type: application/offset+octet-stream\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";

    bool complete = false;
    for (std::size_t i = 0; i < raw.size(); i += 7) {
        const std::string piece = raw.substr(i, 7);
        auto result = feed(parser, piece);
        ASSERT_TRUE(result.is_ok()) << result.error();
        complete = result.value();
    }

    ASSERT_TRUE(complete);
    HttpRequest request = parser.take_request();
    EXPECT_EQ(request.method, HttpMethod::PATCH);
    EXPECT_EQ(request.url, "/files/abc");
    EXPECT_EQ(request.version, HttpVersion::HTTP_1_1);
    EXPECT_EQ(request.get_header("upload-offset"), "1024");
    EXPECT_EQ(request.get_header("TUS-RESUMABLE"), "1.0.0");
    EXPECT_EQ(request.body_as_string(), "hello");
}

TEST(HttpParser, KeepsBinaryBodyIntact) {
    std::vector<uint8_t> payload = {0x00, 0xff, '\r', '\n', 0x7f, 0x00, '\r', '\n'};
    std::string raw = "POST /files HTTP/1.1\r\nContent-Length: " +
                      std::to_string(payload.size()) + "\r\n\r\n";
    raw.append(payload.begin(), payload.end());

    HttpParser parser;
    auto result = feed(parser, raw);

    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().body, payload);
}

TEST(HttpParser, RequestWithoutBodyCompletesAtBlankLine) {
    HttpParser parser;
    auto result = feed(parser, "HEAD /files/abc HTTP/1.1\r\nTus-Resumable: 1.0.0\r\n\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_TRUE(parser.get_request().body.empty());
}

TEST(HttpParser, WaitsForRemainingBody) {
    HttpParser parser;
    auto partial = feed(parser, "PATCH /files/abc HTTP/1.1\r\nContent-Length: 10\r\n\r\n12345");

    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value());

    auto rest = feed(parser, "67890");
    ASSERT_TRUE(rest.is_ok());
    EXPECT_TRUE(rest.value());
    EXPECT_EQ(parser.get_request().body_as_string(), "1234567890");
}

TEST(HttpParser, RejectsOversizedContentLength) {
    HttpParser parser(1024);
    auto result = feed(parser, "PATCH /files/abc HTTP/1.1\r\nContent-Length: 2048\r\n\r\n");

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(parser.body_too_large());
    EXPECT_NE(result.error().find("1024"), std::string::npos);
}

TEST(HttpParser, RejectsUnknownMethod) {
    HttpParser parser;
    auto result = feed(parser, "BREW /pot HTTP/1.1\r\n\r\n");

    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(parser.body_too_large());
}

TEST(HttpParser, RejectsNonNumericContentLength) {
    HttpParser parser;
    auto result = feed(parser, "POST /files HTTP/1.1\r\nContent-Length: -5\r\n\r\n");

    EXPECT_TRUE(result.is_error());
}

TEST(HttpParser, RejectsUnsupportedVersion) {
    HttpParser parser;
    auto result = feed(parser, "GET / HTTP/2.0\r\n\r\n");

    EXPECT_TRUE(result.is_error());
}

TEST(HttpParser, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "BREW / HTTP/1.1\r\n").is_error());

    parser.reset();
    auto result = feed(parser, "OPTIONS /files HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().method, HttpMethod::OPTIONS);
}

TEST(HttpParser, PathDropsQueryString) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /files/abc?verbose=1 HTTP/1.1\r\n\r\n").is_ok());

    HttpRequest request = parser.get_request();
    EXPECT_EQ(request.url, "/files/abc?verbose=1");
    EXPECT_EQ(request.path(), "/files/abc");
}

TEST(HttpParser, SerializedRequestParsesBack) {
    HttpRequest request;
    request.method = HttpMethod::PATCH;
    request.url = "/files/xyz";
    request.set_header("Upload-Offset", "0");
    request.set_body(std::vector<uint8_t>{'a', 'b', 'c'});

    const auto bytes = request.serialize();
    HttpParser parser;
    auto result = parser.parse(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    HttpRequest parsed = parser.get_request();
    EXPECT_EQ(parsed.method, HttpMethod::PATCH);
    EXPECT_EQ(parsed.get_header("Upload-Offset"), "0");
    EXPECT_EQ(parsed.body_as_string(), "abc");
}

TEST(HttpResponseParser, ParsesNoContentResponse) {
    HttpResponseParser parser;
    const std::string raw =
        "HTTP/1.1 204 No Content\r\n"
        "Upload-Offset: 5242880\r\n"
        "Tus-Resumable: 1.0.0\r\n"
        "\r\n";

    auto result = parser.parse(raw.data(), raw.size());

    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    HttpResponse response = parser.get_response();
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.reason_phrase, "No Content");
    EXPECT_EQ(response.get_header("upload-offset"), "5242880");
}

TEST(HttpResponseParser, CustomStatusCodeAndBody) {
    HttpResponse original(HttpStatus::CHECKSUM_MISMATCH);
    original.set_body(std::string("{\"error\":\"ChecksumMismatch\"}"));
    const auto bytes = original.serialize();

    HttpResponseParser parser;
    auto result = parser.parse(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    HttpResponse response = parser.get_response();
    EXPECT_EQ(response.status_code, 460);
    EXPECT_EQ(response.body_as_string(), "{\"error\":\"ChecksumMismatch\"}");
}

TEST(HttpResponseParser, HeadResponseSkipsAdvertisedBody) {
    HttpResponseParser parser;
    parser.expect_no_body();
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Upload-Offset: 100\r\n"
        "Upload-Length: 300\r\n"
        "Content-Length: 300\r\n"
        "\r\n";

    auto result = parser.parse(raw.data(), raw.size());

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.get_response().body.empty());
}

TEST(HttpResponseParser, ReportsTruncatedBody) {
    HttpResponseParser parser;
    const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";

    auto result = parser.parse(raw.data(), raw.size());

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_TRUE(parser.headers_complete());
    EXPECT_FALSE(parser.is_complete());
}

TEST(HttpResponseParser, RejectsMalformedStatusLine) {
    HttpResponseParser parser;
    const std::string raw = "HTTP/1.1 OK\r\n\r\n";

    auto result = parser.parse(raw.data(), raw.size());

    EXPECT_TRUE(result.is_error());
}
