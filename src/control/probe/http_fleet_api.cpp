/// @file http_fleet_api.cpp
/// @brief HttpFleetApi request mapping and response interpretation.

#include "afc/control/http_fleet_api.hpp"

#include "afc/control/http_client.hpp"
#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/json_log_formatter.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::string pairKey(const ServiceId& service, const RegionId& region) {
    return service.value() + "/" + region.value();
}

bool isSuccess(int status) {
    return status >= 200 && status < 300;
}

} // namespace

std::optional<double> findJsonNumber(const std::string& body, std::string_view key) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find(std::string(key));
    if (it == doc.end() || !it->is_number()) {
        return std::nullopt;
    }
    auto value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

HttpFleetApi::HttpFleetApi(const FleetConfig& fleet) {
    for (const auto& service : fleet.services) {
        for (const auto& region : service.regions) {
            baseUrls_[pairKey(service.id, region.id)] = region.apiBaseUrl;
        }
    }
}

FleetApis HttpFleetApi::makeFleetApis(const FleetConfig& fleet) {
    auto api = std::make_shared<HttpFleetApi>(fleet);
    return FleetApis{api, api, api, api};
}

ControlResult<HttpFleetApi::Call> HttpFleetApi::call(const ServiceId& service,
                                                     const RegionId& region,
                                                     const std::string& method,
                                                     const std::string& suffix, std::string body,
                                                     Millis timeout) const {
    auto it = baseUrls_.find(pairKey(service, region));
    if (it == baseUrls_.end()) {
        return ControlResult<Call>::err(ControlError(
            ErrorCode::RegionNotFound, "no region " + region.value() + " for " + service.value()));
    }
    if (it->second.empty()) {
        return ControlResult<Call>::err(ControlError(
            ErrorCode::ConfigurationError, "region " + region.value() + " has no api_base_url"));
    }

    auto url = parseHttpUrl(it->second);
    if (!url) {
        return ControlResult<Call>::err(url.error());
    }

    HttpRequest request;
    request.method = method;
    request.host = url.value().host;
    request.port = url.value().port;
    std::string base = url.value().path;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    request.path = base + "/services/" + service.value() + suffix;
    request.body = std::move(body);

    auto response = httpExchange(request, timeout);
    if (!response) {
        AFC_LOG_DEBUG(LogCategory::Executor, method + " " + request.path + " on " +
                                                 region.value() + " failed: " +
                                                 std::string(response.error().message()));
        return ControlResult<Call>::err(response.error());
    }
    return ControlResult<Call>::ok(Call{response.value().status, std::move(response.value().body)});
}

ControlResult<void> HttpFleetApi::post(const ServiceId& service, const RegionId& region,
                                       const std::string& suffix, std::string body,
                                       Millis timeout) const {
    auto r = call(service, region, "POST", suffix, std::move(body), timeout);
    if (!r) {
        return ControlResult<void>::err(r.error());
    }
    if (!isSuccess(r.value().status)) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::NetworkError, "POST " + suffix + " on " + region.value() + " returned HTTP " +
                                         std::to_string(r.value().status)));
    }
    return ControlResult<void>::ok();
}

ControlResult<PromotionResult> HttpFleetApi::promote(const ServiceId& service,
                                                     const RegionId& region, Millis timeout) {
    auto r = call(service, region, "POST", "/promote", "{}", timeout);
    if (!r) {
        return ControlResult<PromotionResult>::err(r.error());
    }
    const auto& reply = r.value();
    if (reply.body.find("already_primary") != std::string::npos &&
        (isSuccess(reply.status) || reply.status == 409)) {
        return ControlResult<PromotionResult>::ok(PromotionResult::AlreadyPrimary);
    }
    if (!isSuccess(reply.status)) {
        return ControlResult<PromotionResult>::err(ControlError(
            ErrorCode::NetworkError,
            "promote on " + region.value() + " returned HTTP " + std::to_string(reply.status)));
    }
    return ControlResult<PromotionResult>::ok(PromotionResult::Promoted);
}

ControlResult<void> HttpFleetApi::demote(const ServiceId& service, const RegionId& region,
                                         Millis timeout) {
    return post(service, region, "/demote", "{}", timeout);
}

ControlResult<void> HttpFleetApi::routeTo(const ServiceId& service, const RegionId& region,
                                          Millis timeout) {
    nlohmann::ordered_json body;
    body["region"] = region.value();
    return post(service, region, "/route", foundation::toJsonText(body), timeout);
}

ControlResult<void> HttpFleetApi::quiesce(const ServiceId& service, const RegionId& region,
                                          Millis timeout) {
    return post(service, region, "/writes/quiesce", "{}", timeout);
}

ControlResult<void> HttpFleetApi::resume(const ServiceId& service, const RegionId& region,
                                         Millis timeout) {
    return post(service, region, "/writes/resume", "{}", timeout);
}

ControlResult<std::chrono::seconds> HttpFleetApi::replicationLag(const ServiceId& service,
                                                                 const RegionId& region,
                                                                 Millis timeout) {
    auto r = call(service, region, "GET", "/replication", "", timeout);
    if (!r) {
        return ControlResult<std::chrono::seconds>::err(r.error());
    }
    if (!isSuccess(r.value().status)) {
        return ControlResult<std::chrono::seconds>::err(ControlError(
            ErrorCode::NetworkError, "replication status of " + region.value() +
                                         " returned HTTP " + std::to_string(r.value().status)));
    }
    auto lag = findJsonNumber(r.value().body, "lag_seconds");
    if (!lag || *lag < 0.0) {
        return ControlResult<std::chrono::seconds>::err(ControlError(
            ErrorCode::InvalidMessage, "replication status of " + region.value() +
                                           " has no lag_seconds"));
    }
    return ControlResult<std::chrono::seconds>::ok(
        std::chrono::seconds(static_cast<int64_t>(std::ceil(*lag))));
}

} // namespace afc::control
