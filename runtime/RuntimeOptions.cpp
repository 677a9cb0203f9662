/**
 * \file runtime/RuntimeOptions.cpp
 * \brief Implementation of runtime CLI and configuration option helpers.
 */

#include "RuntimeOptions.hpp"
#include <options/Options.hpp>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace SkillRuntime { namespace runtime_opts {

/// Config assembled by the provider; CLI options bind into it directly.
static RuntimeConfig g_config;
/// Log level name bound to --log-level, converted in get_config().
static std::string g_log_level{"info"};
/// Path options bound as text, converted in get_config().
static std::string g_skills_path;
static std::string g_telemetry_dir;
/// Command selected on the command line.
static RuntimeCommand g_command;

namespace {

double rate_value(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number()) {
        throw std::invalid_argument("runtime." + key + " must be a number");
    }
    return value.get<double>();
}

std::map<std::string, double> rate_map(const nlohmann::json& object, const std::string& key) {
    if (!object.is_object()) {
        throw std::invalid_argument("runtime." + key + " must be an object");
    }
    std::map<std::string, double> result;
    for (const auto& [name, value] : object.items()) {
        result[name] = rate_value(value, key + "." + name);
    }
    return result;
}

std::string string_value(const nlohmann::json& section, const char* key, const std::string& fallback) {
    auto it = section.find(key);
    if (it == section.end()) return fallback;
    if (!it->is_string()) {
        throw std::invalid_argument(std::string{"runtime."} + key + " must be a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

RuntimeConfig config_from_json(const nlohmann::json& section) {
    RuntimeConfig config;
    if (section.is_null()) {
        return config;
    }
    if (!section.is_object()) {
        throw std::invalid_argument("runtime config section must be an object");
    }

    config.skills_path = shared_opts::Options::resolve_config_path(
        string_value(section, "skills", config.skills_path.string()));
    config.telemetry_dir = shared_opts::Options::resolve_config_path(
        string_value(section, "telemetry_dir", config.telemetry_dir.string()));
    config.backend = string_value(section, "backend", config.backend);
    config.public_key = string_value(section, "public_key", config.public_key);

    const auto level_name = string_value(section, "log_level", "info");
    auto level = parse_log_level(level_name);
    if (!level) {
        throw std::invalid_argument("runtime.log_level '" + level_name + "' is not a log level");
    }
    config.log_level = *level;

    if (section.contains("default_sample_rate")) {
        config.default_sample_rate = rate_value(section["default_sample_rate"], "default_sample_rate");
    }
    if (section.contains("sampling")) {
        config.sampling = rate_map(section["sampling"], "sampling");
    }
    if (section.contains("sigma_gates")) {
        config.sigma_gates = rate_map(section["sigma_gates"], "sigma_gates");
    }
    if (section.contains("idle")) {
        if (!section["idle"].is_boolean()) {
            throw std::invalid_argument("runtime.idle must be a boolean");
        }
        config.idle = section["idle"].get<bool>();
    }
    if (section.contains("telemetry_seed")) {
        if (!section["telemetry_seed"].is_number_unsigned()) {
            throw std::invalid_argument("runtime.telemetry_seed must be a non-negative integer");
        }
        config.telemetry_seed = section["telemetry_seed"].get<uint64_t>();
    }
    return config;
}

RuntimeConfig get_config() {
    RuntimeConfig config = g_config;
    config.skills_path = g_skills_path;
    config.telemetry_dir = g_telemetry_dir;
    auto level = parse_log_level(g_log_level);
    if (!level) {
        throw std::invalid_argument("unknown log level: " + g_log_level);
    }
    config.log_level = *level;
    return config;
}

RuntimeCommand get_command() { return g_command; }

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        g_config = config_from_json(j.contains("runtime") ? j["runtime"] : nlohmann::json{});
        g_log_level = to_string(g_config.log_level);
        g_skills_path = g_config.skills_path.string();
        g_telemetry_dir = g_config.telemetry_dir.string();
        g_command = RuntimeCommand{};

        app.add_option("--skills", g_skills_path, "Skill definition file (skills.json)")
            ->group("Runtime");
        app.add_option("--telemetry-dir", g_telemetry_dir, "Directory for events.jsonl")
            ->group("Runtime");
        app.add_option("--sample-rate", g_config.default_sample_rate, "Default telemetry sample rate")
            ->check(CLI::Range(0.0, 1.0))
            ->group("Runtime");
        app.add_option("--log-level", g_log_level, "debug|info|warning|error|critical")
            ->group("Runtime");
        app.add_option("--backend", g_config.backend, "Inference backend: echo|offset")
            ->check(CLI::IsMember({"echo", "offset"}))
            ->group("Runtime");
        app.add_flag("--idle,!--no-idle", g_config.idle, "Start the inference hub in idle mode")
            ->group("Runtime");
        app.add_option("--public-key", g_config.public_key, "Base64 Ed25519 release public key")
            ->group("Runtime");

        app.add_option("--skill", g_command.skill, "Route the payload to this skill id")
            ->group("Commands");
        app.add_option("--trigger", g_command.trigger, "Route the payload through a trigger phrase")
            ->group("Commands");
        app.add_option("--payload", g_command.payload, "Payload JSON text or file")
            ->group("Commands");
        app.add_option("--metadata", g_command.metadata, "Decision/post-processing metadata JSON text or file")
            ->group("Commands");
        app.add_flag("--list", g_command.list, "List registered skills and triggers")
            ->group("Commands");
        app.add_option("--manifest", g_command.manifest, "Release manifest to verify")
            ->check(CLI::ExistingFile)
            ->group("Commands");
        app.add_option("--signature", g_command.signature, "Detached base64 signature file")
            ->check(CLI::ExistingFile)
            ->group("Commands");
        app.add_option("--install", g_command.install, "Skill definition to install after verification")
            ->check(CLI::ExistingFile)
            ->needs("--manifest")
            ->group("Commands");
    });
}

} } // namespace SkillRuntime::runtime_opts
