#include "tilestitch/http/route_registration.h"

#include <exception>
#include <string>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "tilestitch/core/logger.h"
#include "tilestitch/observability/metrics.h"
#include "tilestitch/reassembly/trigger_dispatcher.h"

namespace tilestitch::http {
namespace {

HttpResponse FromInvocation(const reassembly::InvocationResponse& invocation, unsigned version,
                            const std::string& request_id) {
    auto response = JsonResponse(static_cast<boost::beast::http::status>(invocation.status_code),
                                 version, invocation.BodyString());
    response.set("X-Request-Id", request_id);
    return response;
}

}  // namespace

void RegisterReassemblyRoutes(Router& router,
                              std::shared_ptr<reassembly::TriggerDispatcher> dispatcher) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(boost::beast::http::status::ok, req.version(),
                                       "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id +
                                           "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(boost::beast::http::status::ok, req.version(),
                                       "{\"status\":\"ready\",\"request_id\":\"" +
                                           ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    // Any trigger shape: storage notification, scheduled sweep or direct request.
    router.Add("POST", "/v1/invocations",
               [dispatcher](const RequestContext& ctx, const HttpRequest& req,
                            const RouteParams&) {
                   return FromInvocation(dispatcher->Dispatch(req.body()), req.version(),
                                         ctx.request_id);
               });

    router.Add("POST", "/v1/reassembly",
               [dispatcher](const RequestContext& ctx, const HttpRequest& req,
                            const RouteParams&) -> core::Result<HttpResponse> {
                   Poco::JSON::Object::Ptr request;
                   try {
                       Poco::JSON::Parser parser;
                       request = parser.parse(req.body()).extract<Poco::JSON::Object::Ptr>();
                   } catch (const Poco::Exception& ex) {
                       return ErrorResponse(boost::beast::http::status::bad_request,
                                            req.version(), "INVALID_JSON", ex.displayText(),
                                            ctx.request_id);
                   }
                   try {
                       return FromInvocation(dispatcher->HandleDirectRequest(request),
                                             req.version(), ctx.request_id);
                   } catch (const std::exception& ex) {
                       core::LogError(std::string("Direct reassembly failed: ") + ex.what());
                       return core::Error{core::ErrorCode::kInternal, ex.what()};
                   }
               });
}

}  // namespace tilestitch::http
