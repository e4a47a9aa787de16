#include "chunkvault/http/http_server.h"

#include <array>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "chunkvault/auth/jwt_utils.h"
#include "chunkvault/core/ids.h"
#include "chunkvault/core/logger.h"
#include "chunkvault/http/responses.h"
#include "chunkvault/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr std::size_t kMaxDeviceIdLength = 255;
constexpr const char* kFilePattern = "/v1/files/{filename}";

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, chunkvault::http::Router router, chunkvault::core::Config config,
            std::shared_ptr<chunkvault::transfer::TransferService> service,
            std::shared_ptr<chunkvault::auth::JwtVerifier> auth_verifier)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          service_(std::move(service)),
          auth_verifier_(std::move(auth_verifier)) {
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
            chunkvault::core::LogError("TLS handshake failed: " + ec.message());
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
            chunkvault::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = chunkvault::core::GenerateRequestId();
        // Clear any previous request state for reused sessions.
        auth_claims_.reset();
        device_id_.clear();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
        const auto path = StripQuery(request_target_);

        // Resolve the device before reading a chunk body.
        auto identity_response = ResolveIdentity(parser_->get(), path);
        if (identity_response) {
            identity_response->keep_alive(false);
            return Send(std::move(*identity_response));
        }

        const auto declared = parser_->content_length();
        if (declared && *declared > config_.server.limits.max_body_bytes) {
            return RejectOversizedBody();
        }

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
            return RejectOversizedBody();
        }
        if (ec && ec != http::error::need_buffer) {
            chunkvault::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void RejectOversizedBody() {
        auto response = chunkvault::http::ErrorResponse(
            parser_->get().version(), http::status::payload_too_large, "PAYLOAD_TOO_LARGE",
            "request body exceeds " + std::to_string(config_.server.limits.max_body_bytes) +
                " bytes",
            request_id_);
        response.keep_alive(false);
        Send(std::move(response));
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        chunkvault::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name_string(), field.value());
        }
        request.body() = std::move(body_);
        body_.clear();
        request.prepare_payload();
        request.keep_alive(parser_->get().keep_alive());

        chunkvault::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = std::string(request.target());
        ctx.remote = request_remote_;
        ctx.device_id = device_id_;
        if (auth_claims_) {
            ctx.auth = chunkvault::http::AuthContext{auth_claims_->subject, auth_claims_->issuer,
                                                     auth_claims_->audience};
        }

        const auto path = StripQuery(std::string(request.target()));
        chunkvault::http::RouteParams params;
        if (request.method() == http::verb::get &&
            chunkvault::http::Router::Match(kFilePattern, path, &params)) {
            return HandleDownload(request, params["filename"]);
        }

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            LogFailure(result.error());
            auto response =
                chunkvault::http::ErrorResponse(request.version(), result.error(), request_id_);
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }
        result.value().keep_alive(request.keep_alive());
        Send(std::move(result.value()));
    }

    bool IsPublicPath(const std::string& path) const {
        // Keep health endpoints public for liveness checks.
        return path == "/healthz" || path == "/readyz";
    }

    template <typename Request>
    std::optional<std::string> ExtractBearerToken(const Request& request) {
        // Expect "Authorization: Bearer <token>".
        auto it = request.find(http::field::authorization);
        if (it == request.end()) {
            return std::nullopt;
        }
        std::string value = chunkvault::auth::Trim(std::string(it->value()));
        if (value.size() < 7) {
            return std::nullopt;
        }
        std::string prefix = value.substr(0, 7);
        for (auto& c : prefix) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (prefix != "bearer ") {
            return std::nullopt;
        }
        return chunkvault::auth::Trim(value.substr(7));
    }

    template <typename Request>
    std::optional<http::response<http::string_body>> ResolveIdentity(const Request& request,
                                                                     const std::string& path) {
        if (IsPublicPath(path)) {
            return std::nullopt;
        }
        if (config_.auth.enabled) {
            auto token = ExtractBearerToken(request);
            if (!token || token->empty()) {
                return chunkvault::http::ErrorResponse(
                    request.version(), http::status::unauthorized, "UNAUTHORIZED",
                    "missing bearer token", request_id_);
            }
            auto result = auth_verifier_->Verify(*token);
            if (!result.ok()) {
                return chunkvault::http::ErrorResponse(request.version(), result.error(),
                                                       request_id_);
            }
            auth_claims_ = result.value();
            device_id_ = auth_claims_->subject;
            return std::nullopt;
        }

        // Development mode: the device names itself.
        auto it = request.find("X-Device-Id");
        if (it != request.end()) {
            device_id_ = chunkvault::auth::Trim(std::string(it->value()));
        }
        if (device_id_.empty() || device_id_.size() > kMaxDeviceIdLength) {
            return chunkvault::http::ErrorResponse(request.version(), http::status::unauthorized,
                                                   "UNAUTHORIZED", "missing device identity",
                                                   request_id_);
        }
        return std::nullopt;
    }

    void HandleDownload(const chunkvault::http::HttpRequest& request,
                        const std::string& filename) {
        std::optional<chunkvault::transfer::RangeRequest> range;
        auto range_header = request[http::field::range];
        if (!range_header.empty()) {
            range = chunkvault::transfer::RangeReader::ParseRangeHeader(std::string(range_header));
            if (!range) {
                auto err = chunkvault::http::ErrorResponse(
                    request.version(), http::status::bad_request, "INVALID_ARGUMENT",
                    "invalid range header", request_id_);
                return Send(std::move(err));
            }
        }

        if (range) {
            // Ranged reads are bounded by the request; serve them from memory.
            auto read = service_->Download(device_id_, filename, range);
            if (!read.ok()) {
                return SendDownloadError(request, filename, read.error());
            }
            http::response<http::string_body> response{http::status::partial_content,
                                                       request.version()};
            response.set(http::field::content_type, "application/octet-stream");
            response.set(http::field::accept_ranges, "bytes");
            response.set(http::field::content_range,
                         chunkvault::transfer::RangeReader::ContentRange(read.value().slice));
            response.body() = std::move(read.value().data);
            response.prepare_payload();
            response.keep_alive(request.keep_alive());
            return Send(std::move(response));
        }

        auto slice = service_->ResolveDownload(device_id_, filename, std::nullopt);
        if (!slice.ok()) {
            return SendDownloadError(request, filename, slice.error());
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(slice.value().path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            chunkvault::core::LogError("failed to open artifact for " + filename + ": " +
                                       ec.message());
            auto err = chunkvault::http::ErrorResponse(
                request.version(),
                chunkvault::core::MakeError(chunkvault::core::ErrorCode::kIoError, ec.message()),
                request_id_);
            return Send(std::move(err));
        }
        response.set(http::field::content_type, "application/octet-stream");
        response.set(http::field::accept_ranges, "bytes");
        response.set(http::field::content_disposition, "attachment; filename=" + filename);
        response.content_length(response.body().size());
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    void SendDownloadError(const chunkvault::http::HttpRequest& request,
                           const std::string& filename, const chunkvault::core::Error& error) {
        LogFailure(error);
        auto response = chunkvault::http::ErrorResponse(request.version(), error, request_id_);
        if (error.code == chunkvault::core::ErrorCode::kRangeNotSatisfiable) {
            auto status = service_->Status(device_id_, filename);
            if (status.ok()) {
                response.set(http::field::content_range,
                             "bytes */" + std::to_string(status.value().total_size));
            }
        }
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    void LogFailure(const chunkvault::core::Error& error) {
        if (chunkvault::http::StatusForError(error.code) ==
            http::status::internal_server_error) {
            chunkvault::core::LogError("request " + request_id_ + " failed: " +
                                       chunkvault::core::ErrorCodeName(error.code) + " " +
                                       error.message);
        }
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "ChunkVault");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        chunkvault::core::LogRequest(request_id_, request_method_, request_target_,
                                     request_remote_, response.result_int(), latency);
        chunkvault::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            chunkvault::core::LogError("Write failed: " + ec.message());
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

    chunkvault::http::Router router_;
    chunkvault::core::Config config_;
    std::shared_ptr<chunkvault::transfer::TransferService> service_;
    std::shared_ptr<chunkvault::auth::JwtVerifier> auth_verifier_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
    std::string device_id_;
    std::optional<chunkvault::auth::JwtClaims> auth_claims_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, chunkvault::http::Router router,
             chunkvault::core::Config config,
             std::shared_ptr<chunkvault::transfer::TransferService> service,
             std::shared_ptr<chunkvault::auth::JwtVerifier> auth_verifier,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          service_(std::move(service)),
          auth_verifier_(std::move(auth_verifier)),
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
            throw beast::system_error(ec);
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
            chunkvault::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, service_, auth_verifier_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             service_, auth_verifier_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    chunkvault::http::Router router_;
    chunkvault::core::Config config_;
    std::shared_ptr<chunkvault::transfer::TransferService> service_;
    std::shared_ptr<chunkvault::auth::JwtVerifier> auth_verifier_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace chunkvault::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<transfer::TransferService> service)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      service_(std::move(service)) {
    auth_verifier_ = std::make_shared<auth::JwtVerifier>(config_.auth);
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, service_, auth_verifier_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
}

}  // namespace chunkvault::http
