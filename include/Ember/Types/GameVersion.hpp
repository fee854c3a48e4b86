// include/Ember/Types/GameVersion.hpp
#ifndef EMBER_GAMEVERSION_HPP
#define EMBER_GAMEVERSION_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <Ember/Types/AssetIndex.hpp>
#include <Ember/Types/MinecraftJAR.hpp>
#include <Ember/Types/JavaVersion.hpp>
#include <Ember/Types/Library.hpp>
#include <Ember/Types/VersionArguments.hpp>
#include <nlohmann/json.hpp>

namespace Ember {
    using std::string;
    using json = nlohmann::json;

    // The per-version JSON stored at versions/<id>/<id>.json
    struct GameVersion {
        std::optional<AssetIndex> assetIndex;
        string assets;
        std::map<MinecraftJARType, DownloadDetails> downloads;
        string id;
        std::optional<string> inheritsFrom; // set by Fabric and Forge profiles
        std::optional<string> jar;          // id whose client jar to use, defaults to the root of the inheritance chain
        std::optional<JavaVersion> javaVersion;
        std::vector<Library> libraries;
        std::optional<string> mainClass;
        std::optional<string> minecraftArguments; // For old versions
        string releaseTime;
        string type; // e.g. "snapshot", "release", "old_alpha"

        // Newer versions
        std::optional<Arguments> arguments;

        static GameVersion from_json(const json& j);

        // Layers a loader profile over its parent: child libraries first, child main class wins,
        // argument lists concatenated, everything the child lacks taken from the parent.
        static GameVersion merge(const GameVersion& child, const GameVersion& parent);
    };
}
#endif // EMBER_GAMEVERSION_HPP
