/**
 * @file telemetry/TelemetrySink.hpp
 * @brief Sampled, append-only JSON-lines event log.
 */
#pragma once

#include "SamplingConfig.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

class Logger;

namespace SkillRuntime::Telemetry {

using Metrics = std::map<std::string, double>;

/// Wall clock used for event timestamps (replaceable in tests).
using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Records telemetry events to `<dir>/events.jsonl`.
 *
 * Each retained event is one line:
 * @code
 * {"attributes":{...},"event":"router.success.education_assistant",
 *  "metrics":{...},"timestamp":"2026-01-01T00:00:00.000Z"}
 * @endcode
 * Appends are serialized by a mutex so concurrent recorders never interleave
 * bytes within a line. I/O failures are logged and reported through the
 * return value; they never throw out of record().
 */
class TelemetrySink {
public:
    static constexpr const char* EVENTS_FILE_NAME = "events.jsonl";
    static constexpr const char* SHARE_IN_EVENT = "share_in.funnel";
    static constexpr const char* TTS_EVENT = "tts.performance";

    /**
     * @param directory Storage directory, created if missing.
     * @param sampling Retention rules.
     * @param clock Timestamp source; system clock when empty.
     * @param seed RNG seed for sampling draws; random when unset.
     * @param logger Logger for I/O problems (may be nullptr).
     * @throws std::filesystem::filesystem_error if the directory cannot be created.
     */
    explicit TelemetrySink(
        std::filesystem::path directory,
        SamplingConfig sampling = SamplingConfig{},
        Clock clock = {},
        std::optional<uint64_t> seed = std::nullopt,
        std::shared_ptr<Logger> logger = nullptr
    );

    TelemetrySink(const TelemetrySink&) = delete;
    TelemetrySink& operator=(const TelemetrySink&) = delete;

    /**
     * @brief Record one event if sampling retains it.
     * @param attributes JSON object of string keys (non-objects are stored as {}).
     * @return true if the event was written.
     */
    bool record(
        const std::string& event,
        const Metrics& metrics = {},
        const nlohmann::json& attributes = nlohmann::json::object()
    );

    /// @brief `share_in.funnel` with attributes plus `stage`.
    bool record_share_in(const std::string& stage, const nlohmann::json& attributes = nlohmann::json::object());

    /**
     * @brief `router.success.<skill>` or `router.failure.<skill>`.
     *
     * Metrics carry router.success / router.failure as 1/0; failures add the
     * error category and message to the attributes.
     */
    bool record_router_outcome(
        const std::string& skill_id,
        bool success,
        const std::string& error_category = {},
        const std::string& error = {}
    );

    /// @brief `tts.performance`; negative values are clamped to 0.
    bool record_tts(int64_t duration_ms, int64_t characters, bool success);

    /// @brief Persisted events in insertion order (unparseable lines skipped).
    [[nodiscard]] std::vector<nlohmann::json> events() const;

    /// @brief Names of persisted events in insertion order.
    [[nodiscard]] std::vector<std::string> event_names() const;

    /// @brief Truncate the log.
    void clear();

    [[nodiscard]] const std::filesystem::path& storage_file() const noexcept { return storage_file_; }
    [[nodiscard]] const SamplingConfig& sampling() const noexcept { return sampling_; }

    /// @brief ISO-8601 UTC with milliseconds, e.g. 2026-01-01T00:00:00.000Z.
    [[nodiscard]] static std::string format_timestamp(std::chrono::system_clock::time_point tp);

private:
    bool sample(const std::string& event);
    void log_warning(const std::string& message) const;

    std::filesystem::path storage_file_;
    SamplingConfig sampling_;
    Clock clock_;
    std::shared_ptr<Logger> logger_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    mutable std::mutex file_mutex_;
};

} // namespace SkillRuntime::Telemetry
