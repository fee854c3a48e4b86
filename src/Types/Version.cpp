// src/Types/Version.cpp
#include <Ember/Types/Version.hpp>
#include <stdexcept>

namespace Ember {

VersionType string_to_version_type(const std::string& s) {
    if (s == "release") return VersionType::RELEASE;
    if (s == "snapshot") return VersionType::SNAPSHOT;
    if (s == "old_beta") return VersionType::OLD_BETA;
    if (s == "old_alpha") return VersionType::OLD_ALPHA;
    if (s == "fabric") return VersionType::FABRIC;
    if (s == "forge") return VersionType::FORGE;
    throw std::runtime_error("Unknown version type: " + s);
}

std::string version_type_to_string(VersionType type) {
    switch (type) {
        case VersionType::RELEASE: return "release";
        case VersionType::SNAPSHOT: return "snapshot";
        case VersionType::OLD_BETA: return "old_beta";
        case VersionType::OLD_ALPHA: return "old_alpha";
        case VersionType::FABRIC: return "fabric";
        case VersionType::FORGE: return "forge";
        default: throw std::runtime_error("Unknown VersionType enum");
    }
}

Version Version::from_json(const json& j) {
    Version version;
    version.id = j.at("id").get<std::string>();
    version.type = string_to_version_type(j.at("type").get<std::string>());
    if (j.contains("releaseTime")) version.releaseTime = j.at("releaseTime").get<std::string>();
    if (j.contains("url")) version.url = j.at("url").get<std::string>();
    if (j.contains("sha1")) version.sha1 = j.at("sha1").get<std::string>();
    return version;
}

json Version::to_json() const {
    json j = {{"id", id}, {"type", version_type_to_string(type)}};
    if (releaseTime) j["releaseTime"] = *releaseTime;
    if (url) j["url"] = *url;
    if (sha1) j["sha1"] = *sha1;
    return j;
}

bool operator==(const Version& a, const Version& b) {
    return a.id == b.id && a.type == b.type && a.releaseTime == b.releaseTime && a.url == b.url && a.sha1 == b.sha1;
}

} // namespace Ember
