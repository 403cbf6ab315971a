#include "vmexec/routing/router.h"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace vmexec;

namespace {

Request make(const std::string& method, const std::string& path) {
    return Request(method, path, "", {}, "");
}

} // namespace

TEST(RouterTest, DispatchesByMethodAndPath) {
    Router router;
    router.get("/health", [](const Request&) { return Response(200, "get"); });
    router.post("/health", [](const Request&) { return Response(200, "post"); });

    EXPECT_EQ(router.dispatch(make("GET", "/health")).body(), "get");
    EXPECT_EQ(router.dispatch(make("POST", "/health")).body(), "post");
    EXPECT_TRUE(router.has_route("GET", "/health"));
    EXPECT_FALSE(router.has_route("DELETE", "/health"));
}

TEST(RouterTest, UnknownRouteIs404) {
    Router router;
    router.post("/execute", [](const Request&) { return Response(200); });

    auto wrong_path = router.dispatch(make("POST", "/missing"));
    EXPECT_EQ(wrong_path.status_code(), 404);
    EXPECT_EQ(nlohmann::json::parse(wrong_path.body()), (nlohmann::json{{"error", "Not Found"}}));

    // Same path, wrong method
    EXPECT_EQ(router.dispatch(make("GET", "/execute")).status_code(), 404);

    // Matching is exact; no trailing-slash folding
    EXPECT_EQ(router.dispatch(make("POST", "/execute/")).status_code(), 404);
    EXPECT_EQ(router.get_metrics().not_found, 3u);
}

TEST(RouterTest, HandlerExceptionBecomes500) {
    Router router;
    router.post("/execute", [](const Request&) -> Response { throw std::runtime_error("engine exploded"); });

    auto response = router.dispatch(make("POST", "/execute"));
    EXPECT_EQ(response.status_code(), 500);
    EXPECT_EQ(nlohmann::json::parse(response.body())["error"], "Internal server error: engine exploded");

    auto metrics = router.get_metrics();
    EXPECT_EQ(metrics.total_requests, 1u);
    EXPECT_EQ(metrics.failed_requests, 1u);
}

TEST(RouterTest, NonStandardExceptionBecomes500) {
    Router router;
    router.get("/boom", [](const Request&) -> Response { throw 42; });

    EXPECT_EQ(router.dispatch(make("GET", "/boom")).status_code(), 500);
}

TEST(RouterTest, RejectsEmptyHandler) {
    Router router;
    EXPECT_THROW(router.get("/health", Router::Handler{}), std::invalid_argument);
}

TEST(RouterTest, LaterRegistrationReplacesEarlier) {
    Router router;
    router.get("/health", [](const Request&) { return Response(200, "first"); });
    router.get("/health", [](const Request&) { return Response(200, "second"); });

    EXPECT_EQ(router.dispatch(make("GET", "/health")).body(), "second");
}
