/**
 * @file updates/SkillUpdateInstaller.hpp
 * @brief Applies signed skill packages to the registry.
 */
#pragma once

#include "ManifestVerifier.hpp"
#include "skills/features/FeatureBuilderRegistry.hpp"
#include "skills/registry/SkillRegistry.hpp"

#include <filesystem>
#include <memory>
#include <string>

class Logger;

namespace SkillRuntime::Updates {

/// Name of the skill-definition entry inside a package manifest.
inline constexpr const char* DEFINITION_FILE_NAME = "skills.json";

/**
 * @brief A downloaded skill package.
 */
struct SkillPackage {
    std::string manifest;    ///< Manifest JSON exactly as signed
    std::string signature;   ///< Detached base64 Ed25519 signature
    std::string definition;  ///< skills.json document
};

enum class UpdateStatus {
    Installed,
    SignatureRejected,
    MalformedManifest,
    DefinitionNotSigned,
    DigestMismatch,
    MalformedDefinition
};

[[nodiscard]] const char* to_string(UpdateStatus status);

/**
 * @brief Read a package from disk.
 * @throws std::runtime_error if a file cannot be read.
 */
[[nodiscard]] SkillPackage read_skill_package(
    const std::filesystem::path& manifest_path,
    const std::filesystem::path& signature_path,
    const std::filesystem::path& definition_path
);

/**
 * @brief Verifies and installs skill packages.
 *
 * Order: signature, manifest structure, definition digest, then the atomic
 * registry load. The manifest must list skills.json with a sha256; without
 * one the definition is unsigned and the package is refused. Any failure
 * leaves the registry untouched.
 */
class SkillUpdateInstaller {
public:
    SkillUpdateInstaller(
        std::shared_ptr<const ManifestVerifier> verifier,
        std::shared_ptr<Skills::SkillRegistry> registry,
        std::shared_ptr<const Features::FeatureBuilderRegistry> builders,
        Skills::SkillRegistry::RunnerFactory runner_factory,
        std::shared_ptr<Logger> logger = nullptr
    );

    [[nodiscard]] UpdateStatus install(const SkillPackage& package);

private:
    UpdateStatus reject(UpdateStatus status, const std::string& reason) const;

    std::shared_ptr<const ManifestVerifier> verifier_;
    std::shared_ptr<Skills::SkillRegistry> registry_;
    std::shared_ptr<const Features::FeatureBuilderRegistry> builders_;
    Skills::SkillRegistry::RunnerFactory runner_factory_;
    std::shared_ptr<Logger> logger_;
};

} // namespace SkillRuntime::Updates
