#include "runbox/utils/http_client.hpp"

#include "runbox/core/errors.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using runbox::core::ProviderStatusError;
using runbox::utils::HttpClient;
using ::testing::HasSubstr;

TEST(HttpClientTest, TrailingSlashesAreStripped) {
    HttpClient client("https://api.example//", "token", std::chrono::seconds(5));
    EXPECT_EQ(client.BaseUrl(), "https://api.example");
}

// Nothing listens on port 1, so no HTTP status is ever read
TEST(HttpClientTest, FailureWithoutResponseHasStatusZero) {
    HttpClient client("http://127.0.0.1:1", "token", std::chrono::seconds(5));

    try {
        client.Get("/v1/devboxes/dbx_1");
        FAIL() << "expected ProviderStatusError";
    } catch (const ProviderStatusError& e) {
        EXPECT_EQ(e.StatusCode(), 0);
        EXPECT_THAT(e.Message(), HasSubstr("GET http://127.0.0.1:1/v1/devboxes/dbx_1"));
    }
}

}  // namespace
