/**
 * \file runtime/runtimeMain.cpp
 * \brief Entrypoint for the skill-runtime CLI: route a payload, list skills, or verify/install updates.
 */

#include "Runtime.hpp"
#include "RuntimeOptions.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot read " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    return text.substr(begin, text.find_last_not_of(" \t\r\n") - begin + 1);
}

/// Accept inline JSON or the path of a JSON file.
nlohmann::json load_json_argument(const std::string& argument, const char* what) {
    if (argument.empty()) {
        return nlohmann::json::object();
    }
    std::string text = argument;
    std::error_code ec;
    if (std::filesystem::is_regular_file(argument, ec)) {
        text = read_text(argument);
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw std::invalid_argument(std::string{what} + " must be a JSON object or a file containing one");
    }
    return parsed;
}

int list_skills(const SkillRuntime::Runtime& runtime) {
    const auto& registry = *runtime.registry();
    nlohmann::json out = {{"skills", nlohmann::json::array()}, {"triggers", nlohmann::json::object()}};
    for (const auto& id : registry.list_skills()) {
        out["skills"].push_back(id);
    }
    for (const auto& trigger : registry.list_triggers()) {
        out["triggers"][trigger] = registry.find_skill_ids_for_trigger(trigger);
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int verify_and_install(const SkillRuntime::Runtime& runtime, const SkillRuntime::RuntimeCommand& command) {
    namespace up = SkillRuntime::Updates;
    if (!runtime.verifier()) {
        std::cerr << "skill-runtime: no release public key configured (--public-key)" << std::endl;
        return 2;
    }
    if (command.signature.empty()) {
        std::cerr << "skill-runtime: --manifest requires --signature" << std::endl;
        return 2;
    }

    if (command.install.empty()) {
        const auto manifest = read_text(command.manifest);
        bool verified = runtime.verifier()->verify(manifest, trim(read_text(command.signature)));
        nlohmann::json report{{"manifest", command.manifest}, {"verified", verified}};
        if (verified) {
            try {
                auto parsed = up::parse_manifest(manifest);
                report["version"] = parsed.version;
                report["canonical"] = up::canonical_manifest_bytes(parsed);
            } catch (const up::ManifestFormatError& e) {
                report["error"] = e.what();
                verified = false;
            }
        }
        std::cout << report.dump(2) << std::endl;
        return verified ? 0 : 3;
    }

    auto package = up::read_skill_package(command.manifest, command.signature, command.install);
    auto status = runtime.installer()->install(package);
    std::cout << nlohmann::json{
        {"manifest", command.manifest},
        {"status", up::to_string(status)},
        {"skills", runtime.registry()->list_skills()},
    }.dump(2) << std::endl;
    return status == up::UpdateStatus::Installed ? 0 : 3;
}

int route_payload(SkillRuntime::Runtime& runtime, const SkillRuntime::RuntimeCommand& command) {
    namespace sk = SkillRuntime::Skills;
    auto payload = sk::payload_from_json(load_json_argument(command.payload, "--payload"));
    auto metadata = load_json_argument(command.metadata, "--metadata");

    std::string skill_id = command.skill;
    if (skill_id.empty()) {
        skill_id = runtime.registry()->resolve_trigger(command.trigger).value_or(command.trigger);
    }

    auto result = command.skill.empty()
        ? runtime.router()->route_trigger<sk::Payload, sk::FeatureVector, sk::FeatureVector>(command.trigger, payload)
        : runtime.router()->route(command.skill, payload);

    if (!result) {
        const auto& error = result.error();
        std::cout << nlohmann::json{
            {"skill", error.skill_id},
            {"ok", false},
            {"error", SkillRuntime::Routing::to_string(error.kind)},
            {"message", error.message},
        }.dump(2) << std::endl;
        return 1;
    }

    const auto& output = result.value();
    const float top = output.empty() ? 0.0f : *std::max_element(output.begin(), output.end());
    const double confidence = std::clamp(static_cast<double>(top), 0.0, 1.0);

    auto summary = runtime.post_processors().post_process(skill_id, output, metadata);
    auto simple = runtime.decisions().make_decision(skill_id, confidence, summary.english);
    auto detailed = runtime.decisions().decide({"cli", skill_id, confidence, metadata});

    std::cout << nlohmann::json{
        {"skill", skill_id},
        {"ok", true},
        {"payload", sk::payload_to_json(payload)},
        {"output_size", output.size()},
        {"output", output},
        {"confidence", confidence},
        {"decision", {{"action", simple.action}, {"message", simple.message}, {"sigmaGate", simple.sigma_gate}}},
        {"metadataDecision", {{"action", detailed.action}, {"metadata", detailed.metadata}}},
        {"summary", summary.as_map()},
    }.dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

/** \brief Entrypoint for the skill-runtime binary. */
int main(int argc, char* argv[]) {
    try {
        SkillRuntime::runtime_opts::register_options();

        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "skill-runtime option parse error: " << opt_err << std::endl;
            return 2;
        }

        auto config = SkillRuntime::runtime_opts::get_config();
        auto command = SkillRuntime::runtime_opts::get_command();

        // Diagnostics on stderr, results on stdout
        auto logger = std::make_shared<Logger>("SkillRuntime");
        auto stderr_sink = std::make_shared<StderrSink>();
        logger->add_sink(stderr_sink);
        logger->set_level(config.log_level);

        SkillRuntime::Runtime runtime(config, logger);
        runtime.start();

        if (!command.manifest.empty()) {
            return verify_and_install(runtime, command);
        }
        if (command.list) {
            return list_skills(runtime);
        }
        if (!command.skill.empty() || !command.trigger.empty()) {
            return route_payload(runtime, command);
        }

        logger->info("Nothing to do: pass --skill/--trigger, --list or --manifest (see --help)");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "skill-runtime error: " << e.what() << std::endl;
        return 1;
    }
}
