// src/Utils/Crypto.cpp
#include <Ember/Utils/Crypto.hpp>
#include <Ember/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <fstream>
#include <vector>
#include <iomanip>
#include <sstream>

namespace Ember::Utils {

    static std::string bytesToHexString(const unsigned char *bytes, size_t len) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Streams the file through one EVP digest. Empty string on any failure.
    static std::string digestFile(const std::string &filePath, const EVP_MD *md, const char *algoName) {
        CORE_LOG_TRACE("[Crypto] Calculating {} for file: {}", algoName, filePath);
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            CORE_LOG_ERROR("[Crypto] Could not open file for {} calculation: {}", algoName, filePath);
            return "";
        }

        EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
        if (mdctx == nullptr) {
            CORE_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for {} on file: {}", algoName, filePath);
            return "";
        }

        if (1 != EVP_DigestInit_ex(mdctx, md, nullptr)) {
            CORE_LOG_ERROR("[Crypto] EVP_DigestInit_ex for {} failed on file: {}", algoName, filePath);
            EVP_MD_CTX_free(mdctx);
            return "";
        }

        constexpr size_t bufferSize = 64 * 1024;
        std::vector<char> buffer(bufferSize);

        while (file.good()) {
            file.read(buffer.data(), bufferSize);
            std::streamsize bytesRead = file.gcount();
            if (bytesRead > 0) {
                if (1 != EVP_DigestUpdate(mdctx, buffer.data(), static_cast<size_t>(bytesRead))) {
                    CORE_LOG_ERROR("[Crypto] EVP_DigestUpdate failed for {} on file: {}", algoName, filePath);
                    EVP_MD_CTX_free(mdctx);
                    return "";
                }
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (1 != EVP_DigestFinal_ex(mdctx, hash, &hashLen)) {
            CORE_LOG_ERROR("[Crypto] EVP_DigestFinal_ex for {} failed on file: {}", algoName, filePath);
            EVP_MD_CTX_free(mdctx);
            return "";
        }
        EVP_MD_CTX_free(mdctx);

        std::string hexHash = bytesToHexString(hash, hashLen);
        CORE_LOG_TRACE("[Crypto] {} for {}: {}", algoName, filePath, hexHash);
        return hexHash;
    }

    std::string calculateFileSHA1(const std::string &filePath) {
        return digestFile(filePath, EVP_sha1(), "SHA1");
    }

    std::string calculateFileSHA256(const std::string &filePath) {
        return digestFile(filePath, EVP_sha256(), "SHA256");
    }

    std::string nameUUIDFromString(const std::string &name) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (1 != EVP_Digest(name.data(), name.size(), hash, &hashLen, EVP_md5(), nullptr) || hashLen != 16) {
            CORE_LOG_ERROR("[Crypto] MD5 digest failed for UUID name '{}'", name);
            return "";
        }

        hash[6] = static_cast<unsigned char>((hash[6] & 0x0f) | 0x30); // version 3
        hash[8] = static_cast<unsigned char>((hash[8] & 0x3f) | 0x80); // IETF variant

        std::string hex = bytesToHexString(hash, 16);
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
               hex.substr(16, 4) + "-" + hex.substr(20, 12);
    }

} // namespace Ember::Utils
