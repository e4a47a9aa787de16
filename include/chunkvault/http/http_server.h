#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "chunkvault/auth/jwt_verifier.h"
#include "chunkvault/core/config.h"
#include "chunkvault/http/router.h"
#include "chunkvault/transfer/transfer_service.h"

namespace chunkvault::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<transfer::TransferService> service);
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<transfer::TransferService> service_;
    std::shared_ptr<auth::JwtVerifier> auth_verifier_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace chunkvault::http
