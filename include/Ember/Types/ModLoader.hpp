// include/Ember/Types/ModLoader.hpp
#ifndef EMBER_MODLOADER_HPP
#define EMBER_MODLOADER_HPP

#include <string>

namespace Ember {

    enum class LoaderKind {
        NONE = 0,
        FABRIC = 1,
        FORGE = 2,
    };

    LoaderKind string_to_loader_kind(const std::string& s);
    std::string loader_kind_to_string(LoaderKind kind);

    // Installed-version id scheme:
    //   Fabric: fabric-loader-<loaderVersion>-<baseVersion>
    //   Forge:  <baseVersion>-forge-<loaderVersion>
    // Fabric loader versions never contain '-', so the base version is everything after the
    // loader segment and may itself contain dashes (e.g. 1.21-pre1).
    inline constexpr const char* FABRIC_ID_PREFIX = "fabric-loader-";
    inline constexpr const char* FORGE_ID_MARKER = "-forge-";

    std::string make_loader_version_id(LoaderKind kind, const std::string& baseVersion, const std::string& loaderVersion);

    // Classification by id shape alone. An id is FORGE only if "-forge-" has text on both sides.
    LoaderKind classify_version_id(const std::string& id);

    // Inverts make_loader_version_id. Ids of kind NONE are returned unchanged.
    std::string base_version_of(const std::string& id);
    std::string loader_version_of(const std::string& id);
}

#endif // EMBER_MODLOADER_HPP
