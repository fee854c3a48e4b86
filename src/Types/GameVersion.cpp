// src/Types/GameVersion.cpp
#include <Ember/Types/GameVersion.hpp>
#include <Ember/Utils/Logger.hpp>

namespace Ember {

GameVersion GameVersion::from_json(const nlohmann::json& j) {
    CORE_LOG_TRACE("[VersionParser] Parsing version JSON for ID: {}", j.value("id", "UNKNOWN_VERSION_ID"));
    GameVersion version;

    if (j.contains("assetIndex")) {
        version.assetIndex = AssetIndex::from_json(j.at("assetIndex"));
    }
    if (j.contains("assets")) {
        version.assets = j.at("assets").get<std::string>();
    }

    if (j.contains("downloads") && j.at("downloads").is_object()) {
        for (auto& [key, val_json] : j.at("downloads").items()) {
            try {
                MinecraftJARType type = string_to_minecraft_jar_type(key);
                version.downloads[type] = DownloadDetails::from_json(val_json);
            } catch (const std::runtime_error& e) {
                CORE_LOG_WARN("[VersionParser] Skipping unknown download type '{}': {}", key, e.what());
            }
        }
    }

    version.id = j.at("id").get<std::string>();

    if (j.contains("inheritsFrom")) {
        version.inheritsFrom = j.at("inheritsFrom").get<std::string>();
    }
    if (j.contains("jar")) {
        version.jar = j.at("jar").get<std::string>();
    }
    if (j.contains("javaVersion")) {
        version.javaVersion = JavaVersion::from_json(j.at("javaVersion"));
    }

    if (j.contains("libraries") && j.at("libraries").is_array()) {
        for (const auto& lib_json : j.at("libraries")) {
            version.libraries.push_back(Library::from_json(lib_json));
        }
    }

    if (j.contains("mainClass")) {
        version.mainClass = j.at("mainClass").get<std::string>();
    }
    if (j.contains("minecraftArguments")) {
        version.minecraftArguments = j.at("minecraftArguments").get<std::string>();
    }

    version.releaseTime = j.value("releaseTime", "");
    version.type = j.value("type", "release");

    if (j.contains("arguments")) {
        version.arguments = Arguments::from_json(j.at("arguments"));
    }

    return version;
}

GameVersion GameVersion::merge(const GameVersion& child, const GameVersion& parent) {
    GameVersion merged = parent;
    merged.id = child.id;
    merged.type = child.type;
    merged.inheritsFrom.reset();
    if (!child.releaseTime.empty()) merged.releaseTime = child.releaseTime;
    merged.jar = child.jar ? child.jar : (parent.jar ? parent.jar : std::optional<string>(parent.id));

    if (child.assetIndex) merged.assetIndex = child.assetIndex;
    if (!child.assets.empty()) merged.assets = child.assets;
    for (const auto& [type, details] : child.downloads) {
        merged.downloads[type] = details;
    }
    if (child.javaVersion) merged.javaVersion = child.javaVersion;
    if (child.mainClass) merged.mainClass = child.mainClass;
    if (child.minecraftArguments) merged.minecraftArguments = child.minecraftArguments;

    merged.libraries = child.libraries;
    merged.libraries.insert(merged.libraries.end(), parent.libraries.begin(), parent.libraries.end());

    if (child.arguments) {
        Arguments args = parent.arguments.value_or(Arguments{});
        args.game.insert(args.game.end(), child.arguments->game.begin(), child.arguments->game.end());
        args.jvm.insert(args.jvm.end(), child.arguments->jvm.begin(), child.arguments->jvm.end());
        merged.arguments = args;
    }
    return merged;
}

} // namespace Ember
