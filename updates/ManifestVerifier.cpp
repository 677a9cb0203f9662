/**
 * @file updates/ManifestVerifier.cpp
 * @brief OpenSSL-backed signature and digest checks.
 */
#include "ManifestVerifier.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace SkillRuntime::Updates {
namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct EncodeCtxDeleter {
    void operator()(EVP_ENCODE_CTX* ctx) const { EVP_ENCODE_CTX_free(ctx); }
};

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // anonymous namespace

std::optional<std::vector<uint8_t>> decode_base64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::unique_ptr<EVP_ENCODE_CTX, EncodeCtxDeleter> ctx(EVP_ENCODE_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    int written = 0;
    int tail = 0;
    EVP_DecodeInit(ctx.get());
    if (EVP_DecodeUpdate(ctx.get(), out.data(), &written,
                         reinterpret_cast<const unsigned char*>(text.data()),
                         static_cast<int>(text.size())) < 0) {
        return std::nullopt;
    }
    if (EVP_DecodeFinal(ctx.get(), out.data() + written, &tail) != 1) {
        return std::nullopt;
    }
    out.resize(static_cast<size_t>(written + tail));
    return out;
}

std::string sha256_hex(std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

ManifestVerifier::ManifestVerifier(std::vector<uint8_t> public_key)
    : public_key_(std::move(public_key))
{
    if (public_key_.size() != ED25519_PUBLIC_KEY_BYTES) {
        throw std::invalid_argument("release public key must be 32 bytes for Ed25519");
    }
}

ManifestVerifier ManifestVerifier::from_base64(const std::string& public_key_base64) {
    auto key = decode_base64(public_key_base64);
    if (!key) {
        throw std::invalid_argument("release public key is not valid base64");
    }
    return ManifestVerifier(std::move(*key));
}

bool ManifestVerifier::verify(std::string_view manifest, const std::string& signature_base64) const {
    auto signature = decode_base64(signature_base64);
    if (!signature || signature->size() != ED25519_SIGNATURE_BYTES) {
        return false;
    }

    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key_.data(), public_key_.size()));
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!key || !ctx) {
        return false;
    }
    // Ed25519 is a one-shot scheme: no digest, single DigestVerify call.
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature->data(), signature->size(),
                            reinterpret_cast<const unsigned char*>(manifest.data()), manifest.size()) == 1;
}

bool ManifestVerifier::matches_entry(const ManifestFile& entry, std::string_view contents) {
    if (entry.size && contents.size() != *entry.size) {
        return false;
    }
    return !entry.sha256 || sha256_hex(contents) == *entry.sha256;
}

bool ManifestVerifier::verify_file_digests(const Manifest& manifest, const std::filesystem::path& base_dir) {
    for (const auto& file : manifest.files) {
        if (!file.sha256 && !file.size) {
            continue;
        }
        auto contents = read_file(base_dir / file.path);
        if (!contents || !matches_entry(file, *contents)) {
            return false;
        }
    }
    return true;
}

} // namespace SkillRuntime::Updates
