/**
 * @file updates/Manifest.cpp
 */
#include "Manifest.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace SkillRuntime::Updates {
namespace {

bool is_hex_digest(const std::string& text) {
    return text.size() == 64 &&
        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

ManifestFile parse_file(const nlohmann::json& entry, size_t index) {
    const std::string label = "files[" + std::to_string(index) + "]";
    if (entry.is_string()) {
        if (entry.get<std::string>().empty()) {
            throw ManifestFormatError(label + " is an empty path");
        }
        return ManifestFile{entry.get<std::string>(), std::nullopt, std::nullopt};
    }
    if (!entry.is_object()) {
        throw ManifestFormatError(label + " must be a string or an object");
    }

    ManifestFile file;
    auto path = entry.find("path");
    if (path == entry.end() || !path->is_string() || path->get<std::string>().empty()) {
        throw ManifestFormatError(label + ".path must be a non-empty string");
    }
    file.path = path->get<std::string>();

    if (auto sha = entry.find("sha256"); sha != entry.end()) {
        if (!sha->is_string() || !is_hex_digest(sha->get<std::string>())) {
            throw ManifestFormatError(label + ".sha256 must be a 64-character hex digest");
        }
        file.sha256 = lowercase(sha->get<std::string>());
    }
    if (auto size = entry.find("size"); size != entry.end()) {
        if (!size->is_number_unsigned()) {
            throw ManifestFormatError(label + ".size must be a non-negative integer");
        }
        file.size = size->get<uint64_t>();
    }
    return file;
}

} // anonymous namespace

const ManifestFile* Manifest::find_file(const std::string& name) const {
    const std::string suffix = "/" + name;
    for (const auto& file : files) {
        if (file.path == name ||
            (file.path.size() > suffix.size() &&
             file.path.compare(file.path.size() - suffix.size(), suffix.size(), suffix) == 0)) {
            return &file;
        }
    }
    return nullptr;
}

Manifest parse_manifest(const std::string& text) {
    auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        throw ManifestFormatError("manifest is not valid JSON");
    }
    if (!root.is_object()) {
        throw ManifestFormatError("manifest must be a JSON object");
    }

    Manifest manifest;
    auto version = root.find("version");
    if (version == root.end() || !version->is_string() || version->get<std::string>().empty()) {
        throw ManifestFormatError("manifest.version must be a non-empty string");
    }
    manifest.version = version->get<std::string>();

    auto files = root.find("files");
    if (files == root.end() || !files->is_array()) {
        throw ManifestFormatError("manifest.files must be an array");
    }
    for (size_t i = 0; i < files->size(); ++i) {
        manifest.files.push_back(parse_file((*files)[i], i));
    }
    return manifest;
}

std::string canonical_manifest_bytes(const Manifest& manifest) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : manifest.files) {
        if (!file.sha256 && !file.size) {
            files.push_back(file.path);
            continue;
        }
        nlohmann::json entry = {{"path", file.path}};
        if (file.sha256) entry["sha256"] = *file.sha256;
        if (file.size) entry["size"] = *file.size;
        files.push_back(std::move(entry));
    }
    // nlohmann::json objects keep keys sorted
    nlohmann::json root = {{"version", manifest.version}, {"files", std::move(files)}};
    return root.dump();
}

} // namespace SkillRuntime::Updates
