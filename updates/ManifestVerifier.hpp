/**
 * @file updates/ManifestVerifier.hpp
 * @brief Ed25519 verification of detached release-manifest signatures.
 */
#pragma once

#include "Manifest.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SkillRuntime::Updates {

inline constexpr std::size_t ED25519_PUBLIC_KEY_BYTES = 32;
inline constexpr std::size_t ED25519_SIGNATURE_BYTES = 64;

/// @brief Strict base64 decode; std::nullopt for malformed input.
[[nodiscard]] std::optional<std::vector<uint8_t>> decode_base64(const std::string& text);

/// @brief Lowercase hex SHA-256 of @p data.
[[nodiscard]] std::string sha256_hex(std::string_view data);

/**
 * @brief Checks manifests against a fixed release public key.
 *
 * verify() never throws for a bad or mismatched signature; it returns false.
 */
class ManifestVerifier {
public:
    /// @throws std::invalid_argument unless @p public_key is 32 bytes.
    explicit ManifestVerifier(std::vector<uint8_t> public_key);

    /// @throws std::invalid_argument for malformed base64 or a wrong key length.
    [[nodiscard]] static ManifestVerifier from_base64(const std::string& public_key_base64);

    /**
     * @brief Verify @p signature_base64 over the exact bytes of @p manifest.
     * @return true only for a well-formed 64-byte signature that matches.
     */
    [[nodiscard]] bool verify(std::string_view manifest, const std::string& signature_base64) const;

    /**
     * @brief Check @p contents against the size and SHA-256 one entry declares.
     *
     * Only the fields present on the entry are compared; an entry with
     * neither field matches anything.
     */
    [[nodiscard]] static bool matches_entry(const ManifestFile& entry, std::string_view contents);

    /**
     * @brief Compare every file with a digest against its contents under @p base_dir.
     * @return false if a file is missing, has a different size, or a different SHA-256.
     */
    [[nodiscard]] static bool verify_file_digests(const Manifest& manifest, const std::filesystem::path& base_dir);

    [[nodiscard]] const std::vector<uint8_t>& public_key() const noexcept { return public_key_; }

private:
    std::vector<uint8_t> public_key_;
};

} // namespace SkillRuntime::Updates
