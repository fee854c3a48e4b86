// include/Ember/Utils/Crypto.hpp
#ifndef EMBER_CRYPTO_UTIL_HPP
#define EMBER_CRYPTO_UTIL_HPP

#include <string>

namespace Ember {
    namespace Utils {

        /**
         * @brief Calculates the SHA1 hash of a given file.
         * @param filePath The path to the file.
         * @return A hex-encoded string of the SHA1 hash. Returns an empty string on error (e.g., file not found, OpenSSL error).
         */
        std::string calculateFileSHA1(const std::string& filePath);

        /**
         * @brief Calculates the SHA256 hash of a given file.
         * @param filePath The path to the file.
         * @return A hex-encoded string of the SHA256 hash. Returns an empty string on error.
         */
        std::string calculateFileSHA256(const std::string& filePath);

        /**
         * @brief Builds a name-based (version 3, MD5) UUID from an arbitrary string.
         * @param name The name to hash, e.g. "OfflinePlayer:Steve".
         * @return The UUID in canonical 8-4-4-4-12 form, or an empty string if OpenSSL fails.
         */
        std::string nameUUIDFromString(const std::string& name);

    } // namespace Utils
} // namespace Ember

#endif // EMBER_CRYPTO_UTIL_HPP
