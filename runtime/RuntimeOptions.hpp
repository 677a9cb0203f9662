/**
 * \file runtime/RuntimeOptions.hpp
 * \brief Runtime configuration and the CLI/config option provider that fills it.
 */
#pragma once

#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace SkillRuntime {

/** \brief Everything the composition root needs to build a Runtime. */
struct RuntimeConfig {
    std::filesystem::path skills_path{"config/skills.json"}; ///< Skill definition document.
    std::string skills_document;                             ///< Inline definitions; wins over skills_path.
    std::filesystem::path telemetry_dir{"telemetry"};        ///< Holds events.jsonl.
    double default_sample_rate{1.0};
    std::map<std::string, double> sampling;                  ///< Event prefix -> rate.
    std::optional<uint64_t> telemetry_seed;
    LogLevel log_level{LogLevel::Info};
    bool idle{false};
    std::string backend{"echo"};                             ///< "echo" | "offset"
    std::map<std::string, double> sigma_gates;               ///< Extra or overriding gates.
    std::string public_key;                                  ///< Base64 Ed25519 release key; empty disables updates.
};

/** \brief One-shot command selected on the command line. */
struct RuntimeCommand {
    std::string skill;
    std::string trigger;
    std::string payload;        ///< JSON text or path to a JSON file
    std::string metadata;       ///< JSON text or path to a JSON file
    bool list{false};
    std::string manifest;       ///< Manifest path
    std::string signature;      ///< Signature file path
    std::string install;        ///< Definition path to install with the manifest
};

namespace runtime_opts {
    /** \brief Register the "runtime" provider with shared_opts::Options. */
    void register_options();

    /** \brief Config assembled from the JSON "runtime" section and CLI overrides. */
    RuntimeConfig get_config();

    RuntimeCommand get_command();

    /**
     * \brief Build a RuntimeConfig from a "runtime" JSON section.
     * \throws std::invalid_argument for values of the wrong type or an unknown log level.
     */
    RuntimeConfig config_from_json(const nlohmann::json& section);
}

} // namespace SkillRuntime
