// src/Types/VersionComponents.cpp
#include <Ember/Types/AssetIndex.hpp>
#include <Ember/Types/JavaVersion.hpp>
#include <Ember/Types/MinecraftJAR.hpp>
#include <stdexcept>

namespace Ember {

AssetIndex AssetIndex::from_json(const json& j) {
    AssetIndex assetIndex;
    assetIndex.id = j.at("id").get<std::string>();
    assetIndex.sha1 = j.at("sha1").get<std::string>();
    assetIndex.size = j.value("size", size_t{0});
    assetIndex.totalSize = j.value("totalSize", size_t{0});
    assetIndex.url = j.at("url").get<std::string>();
    return assetIndex;
}

JavaVersion JavaVersion::from_json(const json& j) {
    JavaVersion javaVersion;
    javaVersion.component = j.value("component", "jre-legacy");
    javaVersion.majorVersion = j.at("majorVersion").get<unsigned int>();
    return javaVersion;
}

DownloadDetails DownloadDetails::from_json(const json& j) {
    DownloadDetails dl;
    dl.sha1 = j.value("sha1", "");
    dl.size = j.value("size", 0u);
    dl.url = j.at("url").get<std::string>();
    return dl;
}

MinecraftJARType string_to_minecraft_jar_type(const std::string& s) {
    if (s == "client") return MinecraftJARType::CLIENT;
    if (s == "server") return MinecraftJARType::SERVER;
    if (s == "client_mappings") return MinecraftJARType::CLIENT_MAPPING;
    if (s == "server_mappings") return MinecraftJARType::SERVER_MAPPING;
    throw std::runtime_error("Unknown Minecraft JAR type string: " + s);
}

std::string minecraft_jar_type_to_string(MinecraftJARType type) {
    switch (type) {
        case MinecraftJARType::CLIENT: return "client";
        case MinecraftJARType::SERVER: return "server";
        case MinecraftJARType::CLIENT_MAPPING: return "client_mappings";
        case MinecraftJARType::SERVER_MAPPING: return "server_mappings";
        default: throw std::runtime_error("Unknown MinecraftJARType enum");
    }
}

} // namespace Ember
