/**
 * @file router/Router.cpp
 */
#include "Router.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace SkillRuntime::Routing {

Router::Router(
    std::shared_ptr<const Skills::SkillRegistry> registry,
    std::shared_ptr<Telemetry::TelemetrySink> telemetry,
    std::shared_ptr<Logger> logger
)
    : registry_(std::move(registry))
    , telemetry_(std::move(telemetry))
    , logger_(std::move(logger))
{
    if (!registry_) {
        throw std::invalid_argument("Router: registry cannot be null");
    }
}

RouteResult<Skills::FeatureVector> Router::route(const std::string& skill_id, const Skills::Payload& payload) {
    return route_skill<Skills::Payload, Skills::FeatureVector, Skills::FeatureVector>(skill_id, payload);
}

RouteResult<Skills::FeatureVector> Router::route_encoded(std::span<const uint8_t> bytes) {
    auto request = Skills::decode_skill_request(bytes);
    if (!request) {
        return fail<Skills::FeatureVector>({RouteErrorKind::DecodeFailed, UNDECODABLE_REQUEST,
                                            "skill request failed verification", nullptr});
    }
    if (!request->skill_id.empty()) {
        return route(request->skill_id, request->payload);
    }
    return route_trigger<Skills::Payload, Skills::FeatureVector, Skills::FeatureVector>(
        request->trigger, request->payload);
}

void Router::record_success(const std::string& skill_id) {
    if (telemetry_) {
        telemetry_->record_router_outcome(skill_id, true);
    }
}

void Router::record_failure(const RouteError& error) {
    if (logger_) {
        logger_->warning("[Router] " + std::string{to_string(error.kind)} +
                         " skill=" + error.skill_id + ": " + error.message);
    }
    if (telemetry_) {
        telemetry_->record_router_outcome(error.skill_id, false, to_string(error.kind), error.message);
    }
}

} // namespace SkillRuntime::Routing
