#include "tilestitch/http/router.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace tilestitch::http {

namespace {

bool IsParam(const std::string& part) {
    return part.size() >= 2 && part.front() == '{' && part.back() == '}';
}

bool IsRestParam(const std::string& part) {
    return part.size() >= 3 && part.front() == '{' && part.back() == '}' &&
           part[part.size() - 2] == '+';
}

}  // namespace

HttpResponse JsonResponse(boost::beast::http::status status, unsigned version,
                          const std::string& body) {
    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(boost::beast::http::status status, unsigned version,
                           const std::string& code, const std::string& message,
                           const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object root;
    root.set("error", error);
    std::ostringstream body;
    root.stringify(body);
    return JsonResponse(status, version, body.str());
}

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, pattern, std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                         const HttpRequest& request) const {
    const auto target = std::string(request.target());
    const auto path = target.substr(0, target.find('?'));

    bool path_known = false;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!Match(route.pattern, path, &params)) {
            continue;
        }
        if (route.method != request.method_string()) {
            path_known = true;
            continue;
        }
        return route.handler(ctx, request, params);
    }

    if (path_known) {
        return ErrorResponse(boost::beast::http::status::method_not_allowed, request.version(),
                             "METHOD_NOT_ALLOWED", "method not allowed", ctx.request_id);
    }
    return ErrorResponse(boost::beast::http::status::not_found, request.version(), "NOT_FOUND",
                         "route not found", ctx.request_id);
}

std::vector<std::string> Router::SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    auto pattern_parts = SplitPath(pattern);
    auto path_parts = SplitPath(path);
    const bool has_rest = !pattern_parts.empty() && IsRestParam(pattern_parts.back());
    if (has_rest ? path_parts.size() < pattern_parts.size()
                 : pattern_parts.size() != path_parts.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        const auto& p = pattern_parts[i];
        if (has_rest && i + 1 == pattern_parts.size()) {
            std::string rest = path_parts[i];
            for (size_t j = i + 1; j < path_parts.size(); ++j) {
                rest += "/" + path_parts[j];
            }
            if (out_params) {
                (*out_params)[p.substr(1, p.size() - 3)] = rest;
            }
            return true;
        }
        const auto& v = path_parts[i];
        if (IsParam(p)) {
            if (out_params) {
                (*out_params)[p.substr(1, p.size() - 2)] = v;
            }
        } else if (p != v) {
            return false;
        }
    }
    return true;
}

}  // namespace tilestitch::http
