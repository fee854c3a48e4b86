// src/Types/ModLoader.cpp
#include <Ember/Types/ModLoader.hpp>
#include <cstring>
#include <stdexcept>

namespace Ember {

LoaderKind string_to_loader_kind(const std::string& s) {
    if (s == "fabric") return LoaderKind::FABRIC;
    if (s == "forge") return LoaderKind::FORGE;
    if (s == "vanilla" || s == "none") return LoaderKind::NONE;
    throw std::runtime_error("Unknown mod loader: " + s);
}

std::string loader_kind_to_string(LoaderKind kind) {
    switch (kind) {
        case LoaderKind::FABRIC: return "fabric";
        case LoaderKind::FORGE: return "forge";
        case LoaderKind::NONE: return "vanilla";
        default: throw std::runtime_error("Unknown LoaderKind enum");
    }
}

std::string make_loader_version_id(LoaderKind kind, const std::string& baseVersion, const std::string& loaderVersion) {
    switch (kind) {
        case LoaderKind::FABRIC: return FABRIC_ID_PREFIX + loaderVersion + "-" + baseVersion;
        case LoaderKind::FORGE: return baseVersion + FORGE_ID_MARKER + loaderVersion;
        case LoaderKind::NONE: return baseVersion;
        default: throw std::runtime_error("Unknown LoaderKind enum");
    }
}

LoaderKind classify_version_id(const std::string& id) {
    const size_t prefixLen = std::strlen(FABRIC_ID_PREFIX);
    if (id.rfind(FABRIC_ID_PREFIX, 0) == 0) {
        size_t dash = id.find('-', prefixLen);
        // needs a non-empty loader segment and a non-empty base version
        if (dash != std::string::npos && dash > prefixLen && dash + 1 < id.size()) {
            return LoaderKind::FABRIC;
        }
        return LoaderKind::NONE;
    }

    size_t marker = id.find(FORGE_ID_MARKER);
    if (marker != std::string::npos && marker > 0 && marker + std::strlen(FORGE_ID_MARKER) < id.size()) {
        return LoaderKind::FORGE;
    }
    return LoaderKind::NONE;
}

std::string base_version_of(const std::string& id) {
    switch (classify_version_id(id)) {
        case LoaderKind::FABRIC: {
            size_t dash = id.find('-', std::strlen(FABRIC_ID_PREFIX));
            return id.substr(dash + 1);
        }
        case LoaderKind::FORGE:
            return id.substr(0, id.find(FORGE_ID_MARKER));
        default:
            return id;
    }
}

std::string loader_version_of(const std::string& id) {
    switch (classify_version_id(id)) {
        case LoaderKind::FABRIC: {
            const size_t prefixLen = std::strlen(FABRIC_ID_PREFIX);
            size_t dash = id.find('-', prefixLen);
            return id.substr(prefixLen, dash - prefixLen);
        }
        case LoaderKind::FORGE:
            return id.substr(id.find(FORGE_ID_MARKER) + std::strlen(FORGE_ID_MARKER));
        default:
            return "";
    }
}

} // namespace Ember
