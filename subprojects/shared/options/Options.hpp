/**
 * @file Options.hpp
 * @brief Process-wide option providers fed by a JSON config file and CLI11.
 */
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {
class Options {
public:
    // A provider reads its defaults from the loaded JSON config and binds CLI options overriding them.
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    // Drop every registered provider (tests re-register between parses).
    static void clear_providers();
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    // Directory of the loaded config file (if any). Useful for resolving relative paths in providers.
    static std::optional<std::filesystem::path> get_config_dir();
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();
    // Resolve a path from the config file against its directory; absolute paths pass through.
    static std::filesystem::path resolve_config_path(const std::string& path);

private:
    static std::mutex& providers_mutex();
};
}
