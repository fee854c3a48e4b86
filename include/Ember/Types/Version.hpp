// include/Ember/Types/Version.hpp
#ifndef EMBER_VERSION_HPP
#define EMBER_VERSION_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    enum class VersionType {
        RELEASE = 1,
        SNAPSHOT = 2,
        OLD_BETA = 3,
        OLD_ALPHA = 4,
        FABRIC = 5,
        FORGE = 6,
    };

    VersionType string_to_version_type(const std::string& s);
    std::string version_type_to_string(VersionType type);

    // One addressable catalog entry. Vanilla entries mirror a row of the upstream manifest;
    // mod-loader entries are synthesized locally and have no releaseTime or url.
    struct Version {
        std::string id;
        VersionType type = VersionType::RELEASE;
        std::optional<std::string> releaseTime;
        std::optional<std::string> url;
        std::optional<std::string> sha1;

        bool isModded() const { return type == VersionType::FABRIC || type == VersionType::FORGE; }

        // Parses a row of version_manifest_v2.json
        static Version from_json(const json& j);
        json to_json() const;
    };

    bool operator==(const Version& a, const Version& b);
}

#endif // EMBER_VERSION_HPP
