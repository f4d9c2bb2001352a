#include "tilestitch/http/http_server.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <Poco/URI.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "tilestitch/core/ids.h"
#include "tilestitch/core/logger.h"
#include "tilestitch/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr const char* kObjectRoute = "/v1/objects/{key+}";

struct RangeRequest {
    std::uint64_t start{0};
    std::uint64_t end{0};
};

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            std::string decoded;
            Poco::URI::decode(item.substr(eq + 1), decoded);
            return decoded;
        }
    }
    return "";
}

std::optional<RangeRequest> ParseRange(const std::string& header, std::uint64_t size) {
    // Only single byte ranges are supported.
    if (header.rfind("bytes=", 0) != 0 || size == 0) {
        return std::nullopt;
    }
    auto range = header.substr(6);
    auto dash = range.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    std::string start_str = range.substr(0, dash);
    std::string end_str = range.substr(dash + 1);

    RangeRequest req;
    if (start_str.empty()) {
        return std::nullopt;
    }
    try {
        req.start = static_cast<std::uint64_t>(std::stoull(start_str));
        if (end_str.empty()) {
            req.end = size - 1;
        } else {
            req.end = std::min<std::uint64_t>(std::stoull(end_str), size - 1);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (req.start > req.end || req.start >= size) {
        return std::nullopt;
    }
    return req;
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, tilestitch::http::Router router, tilestitch::core::Config config,
            std::shared_ptr<tilestitch::storage::LocalObjectStore> objects)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          objects_(std::move(objects)) {
    }

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            tilestitch::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            tilestitch::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = tilestitch::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();

        body_.clear();
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            auto response = tilestitch::http::ErrorResponse(
                http::status::payload_too_large, parser_->get().version(), "PAYLOAD_TOO_LARGE",
                "request body exceeds limit", request_id_);
            response.keep_alive(false);
            return Send(std::move(response));
        }
        if (ec && ec != http::error::need_buffer) {
            tilestitch::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        tilestitch::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name_string(), field.value());
        }
        request.body() = body_;
        request.keep_alive(parser_->get().keep_alive());
        request.prepare_payload();

        tilestitch::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = std::string(request.target());
        ctx.remote = request_remote_;

        const auto path = StripQuery(ctx.target);
        tilestitch::http::RouteParams params;
        if (request.method() == http::verb::get &&
            tilestitch::http::Router::Match(kObjectRoute, path, &params)) {
            return HandleDownload(request, params["key"]);
        }

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            auto response = tilestitch::http::ErrorResponse(
                http::status::internal_server_error, request.version(),
                tilestitch::core::ErrorCodeName(result.error().code), result.error().message,
                request_id_);
            return Send(std::move(response));
        }
        result.value().keep_alive(request.keep_alive());
        Send(std::move(result.value()));
    }

    void HandleDownload(const tilestitch::http::HttpRequest& request,
                        const std::string& encoded_key) {
        std::string key;
        Poco::URI::decode(encoded_key, key);
        const auto target = std::string(request.target());
        auto verified = objects_->VerifyPresignedGet(key, GetQueryParam(target, "expires"),
                                                     GetQueryParam(target, "signature"));
        if (!verified.ok()) {
            auto response = tilestitch::http::ErrorResponse(
                http::status::forbidden, request.version(), "FORBIDDEN",
                verified.error().message, request_id_);
            return Send(std::move(response));
        }

        auto info = objects_->HeadObject(key);
        auto path = objects_->ResolveObjectPath(key);
        if (!info.ok() || !path.ok()) {
            auto response = tilestitch::http::ErrorResponse(
                http::status::not_found, request.version(), "OBJECT_NOT_FOUND",
                "object not found", request_id_);
            return Send(std::move(response));
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(path.value().c_str(), beast::file_mode::scan, ec);
        if (ec) {
            auto err = tilestitch::http::ErrorResponse(
                http::status::internal_server_error, request.version(), "IO_ERROR",
                "failed to open file", request_id_);
            return Send(std::move(err));
        }

        const auto size = response.body().size();
        response.set(http::field::content_type, info.value().content_type);
        response.set(http::field::accept_ranges, "bytes");
        if (!info.value().etag.empty()) {
            response.set(http::field::etag, "\"" + info.value().etag + "\"");
        }

        auto range_header = request[http::field::range];
        if (!range_header.empty()) {
            auto range = ParseRange(std::string(range_header), size);
            if (!range) {
                auto err = tilestitch::http::ErrorResponse(
                    http::status::range_not_satisfiable, request.version(), "INVALID_RANGE",
                    "invalid range", request_id_);
                err.set(http::field::content_range, "bytes */" + std::to_string(size));
                return Send(std::move(err));
            }
            response.result(http::status::partial_content);
            response.body().seek(range->start, ec);
            if (ec) {
                auto err = tilestitch::http::ErrorResponse(
                    http::status::internal_server_error, request.version(), "IO_ERROR",
                    "failed to seek file", request_id_);
                return Send(std::move(err));
            }
            const auto length = range->end - range->start + 1;
            response.content_length(length);
            response.set(http::field::content_range,
                         "bytes " + std::to_string(range->start) + "-" +
                             std::to_string(range->end) + "/" + std::to_string(size));
        } else {
            response.content_length(size);
        }
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "TileStitch");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        tilestitch::core::LogRequest(request_id_, request_method_, request_target_,
                                     request_remote_, response.result_int(), latency);
        tilestitch::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            tilestitch::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    tilestitch::http::Router router_;
    tilestitch::core::Config config_;
    std::shared_ptr<tilestitch::storage::LocalObjectStore> objects_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, tilestitch::http::Router router,
             tilestitch::core::Config config,
             std::shared_ptr<tilestitch::storage::LocalObjectStore> objects,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          objects_(std::move(objects)),
          ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw std::runtime_error("failed to listen on " + endpoint.address().to_string() +
                                     ":" + std::to_string(endpoint.port()) + ": " +
                                     ec.message());
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            tilestitch::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, objects_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             objects_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    tilestitch::http::Router router_;
    tilestitch::core::Config config_;
    std::shared_ptr<tilestitch::storage::LocalObjectStore> objects_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace tilestitch::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<storage::LocalObjectStore> objects,
                       std::shared_ptr<reassembly::Sweeper> sweeper)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      objects_(std::move(objects)),
      sweeper_(std::move(sweeper)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    StartSweepJob();

    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, objects_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
    core::LogInfo("Listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port));
}

void HttpServer::StartSweepJob() {
    if (!config_.sweeper.enabled || !sweeper_) {
        return;
    }
    sweep_timer_ = std::make_unique<net::steady_timer>(ioc_);
    ScheduleSweep();
}

void HttpServer::ScheduleSweep() {
    if (!sweep_timer_) {
        return;
    }
    sweep_timer_->expires_after(std::chrono::seconds(config_.sweeper.interval_seconds));
    sweep_timer_->async_wait([this](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        RunSweep();
        ScheduleSweep();
    });
}

void HttpServer::RunSweep() {
    try {
        const auto report = sweeper_->RunOnce();
        observability::RecordSweep(report.checked, report.reassembled, report.failed);
    } catch (const std::exception& ex) {
        core::LogError(std::string("Scheduled sweep failed: ") + ex.what());
    }
}

}  // namespace tilestitch::http
