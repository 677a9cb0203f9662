/**
 * @file telemetry/TelemetrySink.cpp
 * @brief JSON-lines telemetry storage.
 */
#include "TelemetrySink.hpp"
#include "logger.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace SkillRuntime::Telemetry {

TelemetrySink::TelemetrySink(
    std::filesystem::path directory,
    SamplingConfig sampling,
    Clock clock,
    std::optional<uint64_t> seed,
    std::shared_ptr<Logger> logger
)
    : storage_file_(directory / EVENTS_FILE_NAME)
    , sampling_(std::move(sampling))
    , clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::system_clock::now(); }})
    , logger_(std::move(logger))
    , rng_(seed ? *seed : std::random_device{}())
{
    std::filesystem::create_directories(directory);
}

std::string TelemetrySink::format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return out.str();
}

bool TelemetrySink::sample(const std::string& event) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return sampling_.should_sample(event, rng_);
}

bool TelemetrySink::record(
    const std::string& event,
    const Metrics& metrics,
    const nlohmann::json& attributes
) {
    if (!sample(event)) {
        return false;
    }

    nlohmann::json line = {
        {"timestamp", format_timestamp(clock_())},
        {"event", event},
        {"metrics", nlohmann::json::object()},
        {"attributes", attributes.is_object() ? attributes : nlohmann::json::object()},
    };
    for (const auto& [key, value] : metrics) {
        line["metrics"][key] = value;
    }
    const std::string serialized = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(file_mutex_);
    std::ofstream out(storage_file_, std::ios::app | std::ios::binary);
    if (!out) {
        log_warning("Cannot open " + storage_file_.string() + " for append, dropped " + event);
        return false;
    }
    out << serialized << '\n';
    out.flush();
    if (!out) {
        log_warning("Write to " + storage_file_.string() + " failed, dropped " + event);
        return false;
    }
    return true;
}

bool TelemetrySink::record_share_in(const std::string& stage, const nlohmann::json& attributes) {
    nlohmann::json combined = attributes.is_object() ? attributes : nlohmann::json::object();
    combined["stage"] = stage;
    return record(SHARE_IN_EVENT, {}, combined);
}

bool TelemetrySink::record_router_outcome(
    const std::string& skill_id,
    bool success,
    const std::string& error_category,
    const std::string& error
) {
    const std::string outcome = success ? "success" : "failure";
    nlohmann::json attributes = {{"skill", skill_id}, {"outcome", outcome}};
    if (!success) {
        attributes["error_category"] = error_category;
        attributes["error"] = error;
    }
    return record(
        "router." + outcome + "." + skill_id,
        {{"router.success", success ? 1.0 : 0.0}, {"router.failure", success ? 0.0 : 1.0}},
        attributes);
}

bool TelemetrySink::record_tts(int64_t duration_ms, int64_t characters, bool success) {
    return record(
        TTS_EVENT,
        {{"tts.ms", static_cast<double>(std::max<int64_t>(0, duration_ms))},
         {"tts.characters", static_cast<double>(std::max<int64_t>(0, characters))}},
        {{"success", success}});
}

std::vector<nlohmann::json> TelemetrySink::events() const {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::vector<nlohmann::json> result;
    std::ifstream in(storage_file_, std::ios::binary);
    if (!in) {
        return result;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            log_warning("Skipping unparseable telemetry line");
            continue;
        }
        result.push_back(std::move(parsed));
    }
    return result;
}

std::vector<std::string> TelemetrySink::event_names() const {
    std::vector<std::string> names;
    for (const auto& event : events()) {
        names.push_back(event.value("event", std::string{}));
    }
    return names;
}

void TelemetrySink::clear() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!std::filesystem::exists(storage_file_)) {
        return;
    }
    std::ofstream out(storage_file_, std::ios::trunc | std::ios::binary);
    if (!out) {
        log_warning("Cannot truncate " + storage_file_.string());
    }
}

void TelemetrySink::log_warning(const std::string& message) const {
    if (logger_) {
        logger_->warning("[Telemetry] " + message);
    }
}

} // namespace SkillRuntime::Telemetry
