#include <gtest/gtest.h>
#include "rup/network/http_client.hpp"
#include "rup/network/http_router.hpp"
#include "rup/network/http_server_asio.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace rup::network;

class HttpLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_.patch("/files/:id", [](const HttpContext& ctx) {
            HttpResponse response(HttpStatus::OK);
            response.set_header("Upload-Offset", std::to_string(ctx.request.body.size()));
            response.set_body(ctx.request.body);
            return response;
        });
        router_.head("/files/:id", [](const HttpContext&) {
            HttpResponse response(HttpStatus::OK);
            response.set_header("Upload-Offset", "42");
            response.set_header("Cache-Control", "no-store");
            return response;
        });

        server_ = std::make_unique<HttpServerAsio>(0, 2, kMaxBody);
        server_->set_handler([this](const HttpRequest& request) {
            return router_.handle_request(request);
        });
        server_->start();

        transport_ = std::make_unique<AsioHttpTransport>("127.0.0.1", server_->get_port(),
                                                         std::chrono::seconds(5));
    }

    void TearDown() override {
        server_->stop();
    }

    static constexpr std::size_t kMaxBody = 64 * 1024;

    HttpRouter router_;
    std::unique_ptr<HttpServerAsio> server_;
    std::unique_ptr<AsioHttpTransport> transport_;
};

TEST_F(HttpLoopbackTest, EphemeralPortIsAssigned) {
    EXPECT_NE(server_->get_port(), 0);
    EXPECT_TRUE(server_->is_running());
}

TEST_F(HttpLoopbackTest, BinaryChunkRoundTrip) {
    std::vector<uint8_t> payload(40 * 1024);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>((i * 31) & 0xff);
    }

    HttpRequest request;
    request.method = HttpMethod::PATCH;
    request.url = "/files/abc";
    request.set_header("Content-Type", "application/offset+octet-stream");
    request.set_body(payload);

    auto result = transport_->send(request);

    ASSERT_TRUE(result.is_ok()) << result.error();
    const HttpResponse& response = result.value();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.get_header("Upload-Offset"), std::to_string(payload.size()));
    EXPECT_EQ(response.body, payload);
}

TEST_F(HttpLoopbackTest, HeadResponseHasNoBody) {
    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.url = "/files/abc";

    auto result = transport_->send(request);

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_EQ(result.value().get_header("Upload-Offset"), "42");
    EXPECT_TRUE(result.value().body.empty());
}

TEST_F(HttpLoopbackTest, UnroutedRequestIsNotTransportError) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/elsewhere";

    auto result = transport_->send(request);

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().status_code, 404);
}

TEST_F(HttpLoopbackTest, StoppedServerIsTransportError) {
    const auto port = server_->get_port();
    server_->stop();
    EXPECT_FALSE(server_->is_running());

    AsioHttpTransport transport("127.0.0.1", port, std::chrono::seconds(2));
    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.url = "/files/abc";

    auto result = transport.send(request);

    EXPECT_TRUE(result.is_error());
}
