#pragma once

#include <memory>

#include "chunkvault/core/config.h"
#include "chunkvault/http/router.h"

namespace chunkvault::transfer {
class TransferService;
}

namespace chunkvault::http {

/// Registers the server's HTTP routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<transfer::TransferService> service,
                           const core::Config& config);

}  // namespace chunkvault::http
