#include <string>

#include <gtest/gtest.h>

#include "tilestitch/http/router.h"

namespace {

namespace http = boost::beast::http;
using tilestitch::http::HttpRequest;
using tilestitch::http::HttpResponse;
using tilestitch::http::RequestContext;
using tilestitch::http::RouteParams;
using tilestitch::http::Router;

HttpRequest MakeRequest(http::verb method, const std::string& target) {
    HttpRequest request{method, target, 11};
    return request;
}

}  // namespace

TEST(Router, MatchesSegmentAndRestParams) {
    RouteParams params;
    EXPECT_TRUE(Router::Match("/v1/bookings/{id}", "/v1/bookings/b1", &params));
    EXPECT_EQ(params["id"], "b1");

    params.clear();
    EXPECT_TRUE(Router::Match("/v1/objects/{key+}", "/v1/objects/b1/s1/file.tif", &params));
    EXPECT_EQ(params["key"], "b1/s1/file.tif");

    EXPECT_FALSE(Router::Match("/v1/objects/{key+}", "/v1/objects", nullptr));
    EXPECT_FALSE(Router::Match("/v1/bookings/{id}", "/v1/bookings/b1/extra", nullptr));
}

TEST(Router, DispatchesAndReportsMissingRoutes) {
    Router router;
    router.Add("POST", "/v1/invocations",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   return tilestitch::http::JsonResponse(http::status::accepted, req.version(),
                                                         "{}");
               });

    RequestContext ctx;
    ctx.request_id = "req-1";

    auto ok = router.Route(ctx, MakeRequest(http::verb::post, "/v1/invocations?x=1"));
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value().result(), http::status::accepted);

    auto wrong_method = router.Route(ctx, MakeRequest(http::verb::get, "/v1/invocations"));
    ASSERT_TRUE(wrong_method.ok());
    EXPECT_EQ(wrong_method.value().result(), http::status::method_not_allowed);

    auto missing = router.Route(ctx, MakeRequest(http::verb::get, "/nope"));
    ASSERT_TRUE(missing.ok());
    EXPECT_EQ(missing.value().result(), http::status::not_found);
    EXPECT_NE(missing.value().body().find("\"request_id\":\"req-1\""), std::string::npos);
}
