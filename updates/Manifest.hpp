/**
 * @file updates/Manifest.hpp
 * @brief Skill-package release manifest.
 *
 * Format:
 * @code
 * { "version": "1.2.0",
 *   "files": [ { "path": "skills.json", "sha256": "<hex>", "size": 812 } ] }
 * @endcode
 * A plain string entry in "files" names a path without a digest.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace SkillRuntime::Updates {

/// @brief Raised when manifest JSON is not structurally valid.
class ManifestFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ManifestFile {
    std::string path;
    std::optional<std::string> sha256;  ///< Lowercase hex
    std::optional<uint64_t> size;
};

struct Manifest {
    std::string version;
    std::vector<ManifestFile> files;

    /// @brief Entry whose path is @p name or ends with "/<name>".
    [[nodiscard]] const ManifestFile* find_file(const std::string& name) const;
};

/// @throws ManifestFormatError describing the first structural problem.
[[nodiscard]] Manifest parse_manifest(const std::string& text);

/**
 * @brief Compact JSON with sorted keys; the byte sequence release tooling signs.
 */
[[nodiscard]] std::string canonical_manifest_bytes(const Manifest& manifest);

} // namespace SkillRuntime::Updates
