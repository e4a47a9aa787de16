#include "chunkvault/http/responses.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace chunkvault::http {

namespace bhttp = boost::beast::http;

boost::beast::http::status StatusForError(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return bhttp::status::ok;
        case core::ErrorCode::kInvalidArgument:
        case core::ErrorCode::kMalformedHeader:
            return bhttp::status::bad_request;
        case core::ErrorCode::kChecksumMismatch:
        case core::ErrorCode::kOutOfBounds:
            return bhttp::status::unprocessable_entity;
        case core::ErrorCode::kSizeConflict:
        case core::ErrorCode::kSessionClosed:
        case core::ErrorCode::kSessionBusy:
        case core::ErrorCode::kFileNotReady:
        case core::ErrorCode::kRangeUnavailable:
            return bhttp::status::conflict;
        case core::ErrorCode::kNotFound:
            return bhttp::status::not_found;
        case core::ErrorCode::kRangeNotSatisfiable:
            return bhttp::status::range_not_satisfiable;
        case core::ErrorCode::kUnauthorized:
            return bhttp::status::unauthorized;
        case core::ErrorCode::kInvalidTransition:
        case core::ErrorCode::kAssemblyFailure:
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kInternal:
            return bhttp::status::internal_server_error;
    }
    return bhttp::status::internal_server_error;
}

HttpResponse JsonResponse(boost::beast::http::status code, int version, const std::string& body) {
    HttpResponse response{code, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(int version, boost::beast::http::status code,
                           const std::string& error_code, const std::string& message,
                           const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", error_code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object root;
    root.set("error", error);
    std::stringstream ss;
    root.stringify(ss);
    return JsonResponse(code, version, ss.str());
}

HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id) {
    std::string message = error.message;
    switch (error.code) {
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kInternal:
            message = "internal storage error";
            break;
        default:
            break;
    }
    return ErrorResponse(version, StatusForError(error.code), core::ErrorCodeName(error.code),
                         message, request_id);
}

}  // namespace chunkvault::http
