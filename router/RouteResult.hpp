/**
 * @file router/RouteResult.hpp
 * @brief Success-or-failure result of routing a payload to a skill.
 */
#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace SkillRuntime::Routing {

enum class RouteErrorKind {
    NotFound,      ///< No skill for the id or trigger
    TypeMismatch,  ///< Skill registered over a different (Payload, Features, Output)
    BuildFailed,   ///< Feature building threw
    RunFailed,     ///< Runner threw
    DecodeFailed   ///< Encoded request failed verification
};

/// @brief Stable category name used in telemetry ("not_found", "run_failed", ...).
inline const char* to_string(RouteErrorKind kind) {
    switch (kind) {
        case RouteErrorKind::NotFound:     return "not_found";
        case RouteErrorKind::TypeMismatch: return "type_mismatch";
        case RouteErrorKind::BuildFailed:  return "build_failed";
        case RouteErrorKind::RunFailed:    return "run_failed";
        case RouteErrorKind::DecodeFailed: return "decode_failed";
        default:                           return "unknown";
    }
}

struct RouteError {
    RouteErrorKind kind;
    std::string skill_id;
    std::string message;
    std::exception_ptr cause;  ///< Original exception for build/run failures
};

/**
 * @brief Either the skill's output or a RouteError.
 */
template<typename T>
class RouteResult {
public:
    [[nodiscard]] static RouteResult success(T value) { return RouteResult(std::move(value)); }
    [[nodiscard]] static RouteResult failure(RouteError error) { return RouteResult(std::move(error)); }

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state_); }
    explicit operator bool() const noexcept { return ok(); }

    /// @throws std::logic_error when called on a failure.
    [[nodiscard]] const T& value() const {
        if (!ok()) {
            throw std::logic_error("RouteResult holds an error: " + std::get<RouteError>(state_).message);
        }
        return std::get<T>(state_);
    }

    /// @throws std::logic_error when called on a success.
    [[nodiscard]] const RouteError& error() const {
        if (ok()) {
            throw std::logic_error("RouteResult holds a value");
        }
        return std::get<RouteError>(state_);
    }

private:
    explicit RouteResult(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    explicit RouteResult(RouteError error) : state_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, RouteError> state_;
};

} // namespace SkillRuntime::Routing
