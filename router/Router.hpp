/**
 * @file router/Router.hpp
 * @brief Registry lookup -> feature build -> run, with outcome telemetry.
 */
#pragma once

#include "RouteResult.hpp"
#include "skills/payload/PayloadCodec.hpp"
#include "skills/registry/SkillRegistry.hpp"
#include "telemetry/TelemetrySink.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>

class Logger;

namespace SkillRuntime::Routing {

/**
 * @brief Routes payloads to registered skills.
 *
 * Never throws for an expected failure: unknown ids, type mismatches and
 * exceptions raised by feature building or running come back as a failed
 * RouteResult. Every call records `router.success.<id>` or
 * `router.failure.<id>`. No retries, no timeouts.
 */
class Router {
public:
    /**
     * @param registry Skill registry (must not be null).
     * @param telemetry Outcome sink (may be nullptr to disable recording).
     * @param logger Logger for failures (may be nullptr).
     */
    Router(
        std::shared_ptr<const Skills::SkillRegistry> registry,
        std::shared_ptr<Telemetry::TelemetrySink> telemetry = nullptr,
        std::shared_ptr<Logger> logger = nullptr
    );

    /**
     * @brief Route @p payload to the skill registered under @p skill_id.
     */
    template<typename PayloadT, typename Features, typename Output>
    RouteResult<Output> route_skill(const std::string& skill_id, const PayloadT& payload) {
        auto base = registry_->find(skill_id);
        if (!base) {
            return fail<Output>({RouteErrorKind::NotFound, skill_id,
                                 "skill '" + skill_id + "' is not registered", nullptr});
        }
        auto registration =
            std::dynamic_pointer_cast<const Skills::SkillRegistration<PayloadT, Features, Output>>(base);
        if (!registration) {
            return fail<Output>({RouteErrorKind::TypeMismatch, skill_id,
                                 "skill '" + skill_id + "' does not accept the requested types", nullptr});
        }

        std::optional<Features> features;
        try {
            features.emplace(registration->descriptor()->build_features(payload));
        } catch (const std::exception& e) {
            return fail<Output>({RouteErrorKind::BuildFailed, skill_id, e.what(), std::current_exception()});
        } catch (...) {
            return fail<Output>({RouteErrorKind::BuildFailed, skill_id, "unknown error", std::current_exception()});
        }

        std::optional<Output> output;
        try {
            output.emplace(registration->runner()->run_skill(*features));
        } catch (const std::exception& e) {
            return fail<Output>({RouteErrorKind::RunFailed, skill_id, e.what(), std::current_exception()});
        } catch (...) {
            return fail<Output>({RouteErrorKind::RunFailed, skill_id, "unknown error", std::current_exception()});
        }
        record_success(skill_id);
        return RouteResult<Output>::success(std::move(*output));
    }

    /**
     * @brief Route through a trigger phrase (ambiguous triggers resolve to the
     * earliest-registered skill).
     */
    template<typename PayloadT, typename Features, typename Output>
    RouteResult<Output> route_trigger(const std::string& trigger, const PayloadT& payload) {
        auto skill_id = registry_->resolve_trigger(trigger);
        if (!skill_id) {
            const auto key = Skills::SkillRegistry::normalize_trigger(trigger);
            return fail<Output>({RouteErrorKind::NotFound, key,
                                 "no skill for trigger '" + key + "'", nullptr});
        }
        return route_skill<PayloadT, Features, Output>(*skill_id, payload);
    }

    /// @brief route_skill for the common payload-map skills.
    RouteResult<Skills::FeatureVector> route(const std::string& skill_id, const Skills::Payload& payload);

    /**
     * @brief Decode a SkillRequest buffer and route it by id, else by trigger.
     */
    RouteResult<Skills::FeatureVector> route_encoded(std::span<const uint8_t> bytes);

    /// Skill id recorded for requests that could not be decoded.
    static constexpr const char* UNDECODABLE_REQUEST = "encoded_request";

private:
    template<typename Output>
    RouteResult<Output> fail(RouteError error) {
        record_failure(error);
        return RouteResult<Output>::failure(std::move(error));
    }

    void record_success(const std::string& skill_id);
    void record_failure(const RouteError& error);

    std::shared_ptr<const Skills::SkillRegistry> registry_;
    std::shared_ptr<Telemetry::TelemetrySink> telemetry_;
    std::shared_ptr<Logger> logger_;
};

} // namespace SkillRuntime::Routing
