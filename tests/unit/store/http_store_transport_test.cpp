#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <omc/store/store_transport.h>

using namespace omc;
using ::testing::_;
using ::testing::Return;
using ::testing::Truly;

namespace {

class MockHttpClient : public net::IHttpClient {
public:
    MOCK_METHOD(Result<net::HttpResponse>, post, (const net::HttpRequest&), (override));
};

net::HttpResponse response(long status, std::string body) {
    net::HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

} // namespace

TEST(HttpStoreTransportTest, PostsQueryToNamedEndpoint) {
    auto http = std::make_shared<MockHttpClient>();
    store::HttpStoreTransport transport(http, "http://localhost:6969/");

    EXPECT_CALL(*http, post(Truly([](const net::HttpRequest& r) {
                    return r.url == "http://localhost:6969/getMemory" &&
                           nlohmann::json::parse(r.body)["memory_id"] == "mem_1";
                })))
        .WillOnce(Return(Result<net::HttpResponse>(response(200, R"({"memory":{"id":"1"}})"))));

    auto res = transport.call("getMemory", {{"memory_id", "mem_1"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value()["memory"]["id"], "1");
    EXPECT_EQ(transport.baseUrl(), "http://localhost:6969");
}

TEST(HttpStoreTransportTest, MapsStatusCodes) {
    auto http = std::make_shared<MockHttpClient>();
    store::HttpStoreTransport transport(http, "http://h:1");

    EXPECT_CALL(*http, post(_))
        .WillOnce(Return(Result<net::HttpResponse>(response(404, "missing"))))
        .WillOnce(Return(Result<net::HttpResponse>(response(500, "boom"))))
        .WillOnce(Return(Result<net::HttpResponse>(response(200, ""))))
        .WillOnce(Return(Result<net::HttpResponse>(response(200, "{not json"))))
        .WillOnce(Return(Result<net::HttpResponse>(Error{ErrorCode::NetworkError, "refused"})));

    EXPECT_EQ(transport.call("q", {}).error().code, ErrorCode::NotFound);
    EXPECT_EQ(transport.call("q", {}).error().code, ErrorCode::DatabaseError);
    auto empty = transport.call("q", {});
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().is_object());
    EXPECT_EQ(transport.call("q", {}).error().code, ErrorCode::InvalidData);
    EXPECT_EQ(transport.call("q", {}).error().code, ErrorCode::NetworkError);
}
