/**
 * @file updates/SkillUpdateInstaller.cpp
 */
#include "SkillUpdateInstaller.hpp"
#include "logger.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace SkillRuntime::Updates {
namespace {

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot read " + path.string());
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
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

const char* to_string(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::Installed:           return "installed";
        case UpdateStatus::SignatureRejected:   return "signature_rejected";
        case UpdateStatus::MalformedManifest:   return "malformed_manifest";
        case UpdateStatus::DefinitionNotSigned: return "definition_not_signed";
        case UpdateStatus::DigestMismatch:      return "digest_mismatch";
        case UpdateStatus::MalformedDefinition: return "malformed_definition";
        default:                                return "unknown";
    }
}

SkillPackage read_skill_package(
    const std::filesystem::path& manifest_path,
    const std::filesystem::path& signature_path,
    const std::filesystem::path& definition_path
) {
    return SkillPackage{
        .manifest = read_text(manifest_path),
        .signature = trim(read_text(signature_path)),
        .definition = read_text(definition_path),
    };
}

SkillUpdateInstaller::SkillUpdateInstaller(
    std::shared_ptr<const ManifestVerifier> verifier,
    std::shared_ptr<Skills::SkillRegistry> registry,
    std::shared_ptr<const Features::FeatureBuilderRegistry> builders,
    Skills::SkillRegistry::RunnerFactory runner_factory,
    std::shared_ptr<Logger> logger
)
    : verifier_(std::move(verifier))
    , registry_(std::move(registry))
    , builders_(std::move(builders))
    , runner_factory_(std::move(runner_factory))
    , logger_(std::move(logger))
{
    if (!verifier_ || !registry_ || !builders_) {
        throw std::invalid_argument("SkillUpdateInstaller: verifier, registry and builders are required");
    }
    if (!runner_factory_) {
        throw std::invalid_argument("SkillUpdateInstaller: runner factory cannot be empty");
    }
}

UpdateStatus SkillUpdateInstaller::install(const SkillPackage& package) {
    if (!verifier_->verify(package.manifest, package.signature)) {
        return reject(UpdateStatus::SignatureRejected, "manifest signature did not verify");
    }

    Manifest manifest;
    try {
        manifest = parse_manifest(package.manifest);
    } catch (const ManifestFormatError& e) {
        return reject(UpdateStatus::MalformedManifest, e.what());
    }

    // The signature covers the definition only through its manifest digest.
    const auto* entry = manifest.find_file(DEFINITION_FILE_NAME);
    if (!entry || !entry->sha256) {
        return reject(UpdateStatus::DefinitionNotSigned, "manifest carries no sha256 for skills.json");
    }
    if (!ManifestVerifier::matches_entry(*entry, package.definition)) {
        return reject(UpdateStatus::DigestMismatch, "skills.json does not match the manifest entry");
    }

    size_t loaded = 0;
    try {
        loaded = registry_->initialize_from_definition(package.definition, *builders_, runner_factory_);
    } catch (const Skills::SkillDefinitionError& e) {
        return reject(UpdateStatus::MalformedDefinition, e.what());
    }

    if (logger_) {
        logger_->info("[SkillUpdateInstaller] Installed package " + manifest.version +
                      " (" + std::to_string(loaded) + " skills)");
    }
    return UpdateStatus::Installed;
}

UpdateStatus SkillUpdateInstaller::reject(UpdateStatus status, const std::string& reason) const {
    if (logger_) {
        logger_->warning("[SkillUpdateInstaller] Rejected package (" + std::string{to_string(status)} +
                         "): " + reason);
    }
    return status;
}

} // namespace SkillRuntime::Updates
