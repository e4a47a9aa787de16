#include "chunkvault/http/route_registration.h"

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include "chunkvault/core/time.h"
#include "chunkvault/http/responses.h"
#include "chunkvault/observability/metrics.h"
#include "chunkvault/transfer/transfer_service.h"

namespace chunkvault::http {
namespace {

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
            return item.substr(eq + 1);
        }
    }
    return "";
}

std::optional<std::uint64_t> ParsePositiveSize(const std::string& value) {
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || parsed == 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Poco::JSON::Array::Ptr RangesToJson(const std::vector<transfer::ByteRange>& ranges) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (const auto& range : ranges) {
        Poco::JSON::Array::Ptr pair = new Poco::JSON::Array();
        pair->add(static_cast<Poco::UInt64>(range.start));
        pair->add(static_cast<Poco::UInt64>(range.end));
        arr->add(pair);
    }
    return arr;
}

Poco::JSON::Object::Ptr SnapshotToJson(const ledger::SessionSnapshot& session) {
    Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
    item->set("filename", session.filename);
    item->set("upload_id", session.upload_id);
    item->set("state", std::string(metadata::SessionStateName(session.state)));
    item->set("total_size", static_cast<Poco::UInt64>(session.total_size));
    item->set("bytes_received", static_cast<Poco::UInt64>(session.bytes_received));
    item->set("next_expected_byte", static_cast<Poco::UInt64>(session.next_expected_byte));
    item->set("received_ranges", RangesToJson(session.received_ranges));
    item->set("missing_ranges", RangesToJson(session.missing_ranges));
    item->set("created_at", core::FormatIso8601(session.created_at));
    item->set("last_activity_at", core::FormatIso8601(session.last_activity_at));
    return item;
}

std::string Stringify(const Poco::JSON::Object::Ptr& object) {
    std::stringstream ss;
    object->stringify(ss);
    return ss.str();
}

HttpResponse JsonOk(int version, const std::string& body) {
    return JsonResponse(boost::beast::http::status::ok, version, body);
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<transfer::TransferService> service,
                           const core::Config& config) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/v1/files/{filename}/chunks",
               [service, max_body = config.server.limits.max_body_bytes](
                   const RequestContext& ctx, const HttpRequest& req,
                   const RouteParams& params) -> core::Result<HttpResponse> {
                   const auto& filename = params.at("filename");
                   if (req.body().size() > max_body) {
                       return core::MakeError(core::ErrorCode::kInvalidArgument,
                                              "chunk exceeds the request size limit");
                   }
                   std::optional<std::uint64_t> total_size;
                   const auto total_text = GetQueryParam(std::string(req.target()), "total_size");
                   if (!total_text.empty()) {
                       total_size = ParsePositiveSize(total_text);
                       if (!total_size) {
                           return core::MakeError(core::ErrorCode::kInvalidArgument,
                                                  "total_size must be a positive integer");
                       }
                   }

                   auto receipt = service->UploadChunk(ctx.device_id, filename, req.body(),
                                                       total_size);
                   if (!receipt.ok()) {
                       return receipt.error();
                   }
                   auto body = SnapshotToJson(receipt.value().session);
                   body->set("bytes_added", static_cast<Poco::UInt64>(receipt.value().bytes_added));
                   body->set("assembled", receipt.value().assembled);
                   if (!receipt.value().etag.empty()) {
                       body->set("etag", receipt.value().etag);
                   }
                   return JsonOk(req.version(), Stringify(body));
               });

    router.Add("GET", "/v1/files/{filename}/status",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) -> core::Result<HttpResponse> {
                   auto status = service->Status(ctx.device_id, params.at("filename"));
                   if (!status.ok()) {
                       return status.error();
                   }
                   return JsonOk(req.version(), Stringify(SnapshotToJson(status.value())));
               });

    router.Add("GET", "/v1/files",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams&) -> core::Result<HttpResponse> {
                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   for (const auto& session : service->List(ctx.device_id)) {
                       arr->add(SnapshotToJson(session));
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("files", arr);
                   return JsonOk(req.version(), Stringify(root));
               });

    router.Add("DELETE", "/v1/files/{filename}",
               [service](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) -> core::Result<HttpResponse> {
                   const auto& filename = params.at("filename");
                   auto removed = service->Remove(ctx.device_id, filename);
                   if (!removed.ok()) {
                       return removed.error();
                   }
                   Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                   body->set("filename", filename);
                   body->set("deleted", true);
                   return JsonOk(req.version(), Stringify(body));
               });
}

}  // namespace chunkvault::http
