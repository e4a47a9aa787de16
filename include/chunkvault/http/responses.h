#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "chunkvault/core/error.h"
#include "chunkvault/http/router.h"

namespace chunkvault::http {

/// @brief HTTP status for each error code of the transfer engine.
boost::beast::http::status StatusForError(core::ErrorCode code);

HttpResponse JsonResponse(boost::beast::http::status status, int version, const std::string& body);
/// @brief Error envelope {"error":{"code","message","request_id"}}.
HttpResponse ErrorResponse(int version, boost::beast::http::status status, const std::string& code,
                           const std::string& message, const std::string& request_id);
/// @brief Renders a core::Error; storage and database details are not exposed.
HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id);

}  // namespace chunkvault::http
