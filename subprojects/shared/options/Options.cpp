#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>

namespace shared_opts {

struct ProviderHolder { std::function<void(CLI::App&, const nlohmann::json&)> cb; };

static std::vector<ProviderHolder>& providers() {
    static std::vector<ProviderHolder> p;
    return p;
}

// Store the loaded config file path (if any) so that option providers can resolve relative paths.
static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p; return p;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(ProviderHolder{std::move(p)});
}

void Options::clear_providers() {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().clear();
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    CLI::App app{"skill-runtime: on-device skill routing, inference and update verification"};
    app.set_version_flag("-V,--version", std::string{"skill-runtime 0.1"});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Probe for -c/--config first so providers can take their defaults from the file.
    CLI::App config_probe{"config_probe"};
    config_probe.add_option("-c,--config", config_file);
    config_probe.allow_extras(true);
    try {
        config_probe.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // The strict parse below reports the real error.
    }

    nlohmann::json cfg_json = nlohmann::json::object();
    loaded_config_file_storage().reset();
    if (!config_file.empty()) {
        std::ifstream ifs(config_file);
        if (!ifs) {
            err = "cannot open config file: " + config_file;
            return ParseResult::Error;
        }
        try {
            ifs >> cfg_json;
        } catch (const nlohmann::json::parse_error& e) {
            err = "malformed config file " + config_file + ": " + e.what();
            return ParseResult::Error;
        }
        std::error_code ec;
        std::filesystem::path abs = std::filesystem::absolute(config_file, ec);
        if (!ec) {
            loaded_config_file_storage() = abs;
        }
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        try {
            for (auto &ph : providers()) {
                if (ph.cb) ph.cb(app, cfg_json);
            }
        } catch (const std::exception &e) {
            err = std::string{"invalid config: "} + e.what();
            return ParseResult::Error;
        }
    }

    app.allow_extras(false);
    app.require_subcommand(0);
    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion &v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception &e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto &s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

std::filesystem::path Options::resolve_config_path(const std::string& path) {
    std::filesystem::path p{path};
    if (p.is_absolute()) return p;
    auto dir = get_config_dir();
    return dir ? (*dir / p) : p;
}

}
