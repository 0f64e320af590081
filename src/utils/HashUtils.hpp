#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

#include "StringUtils.hpp"

namespace modeld::utils {

/**
 * SHA-256 digests for verifying downloaded model files.
 */
class HashUtils {
public:
    /**
     * Hex-encoded SHA-256 of a file, or "" if it cannot be read
     */
    static std::string sha256File(const std::string& filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            return "";
        }

        // Model files are large; read in 1 MiB blocks.
        std::string buffer(1 << 20, '\0');
        while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
                return "";
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
            return "";
        }

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

    /**
     * Compare a file against an expected digest.
     * Accepts bare hex or the "sha256:<hex>" form used by registry digests.
     */
    static bool verifySha256(const std::string& filePath, const std::string& expected) {
        std::string hex = expected;
        if (StringUtils::startsWith(hex, "sha256:")) {
            hex = hex.substr(7);
        }
        auto actual = sha256File(filePath);
        return !actual.empty() && actual == StringUtils::toLower(hex);
    }
};

} // namespace modeld::utils
