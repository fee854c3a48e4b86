// src/FabricInstaller.cpp
#include <Ember/FabricInstaller.hpp>
#include <Ember/Backend.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/VersionRepository.hpp>
#include <Ember/Types/ModLoader.hpp>
#include <Ember/Utils/Logger.hpp>

#include <nlohmann/json.hpp>

namespace Ember {

FabricInstaller::FabricInstaller(VersionRepository& versions, HttpManager& httpManager)
    : m_versions(versions), m_httpManager(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("FabricInstaller");
}

std::vector<std::string> FabricInstaller::parseLoaderVersions(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw BackendError("Unexpected Fabric loader list");
    }
    std::vector<std::string> versions;
    for (const auto& entry : j) {
        if (entry.contains("loader") && entry.at("loader").contains("version")) {
            versions.push_back(entry.at("loader").at("version").get<std::string>());
        }
    }
    return versions;
}

std::vector<std::string> FabricInstaller::loaderVersions(const std::string& gameVersion) {
    const std::string url = std::string(META_URL) + "/versions/loader/" + gameVersion;
    return parseLoaderVersions(m_httpManager.GetJson(cpr::Url{url}));
}

std::string FabricInstaller::install(const std::string& gameVersion, const std::string& loaderVersion) {
    if (!m_versions.findInManifest(gameVersion)) {
        throw BackendError("Unknown Minecraft version: " + gameVersion);
    }
    m_versions.ensureVersionJson(gameVersion);

    const std::string url = std::string(META_URL) + "/versions/loader/" + gameVersion + "/" + loaderVersion + "/profile/json";
    m_logger->info("Fetching Fabric profile {}", url);
    nlohmann::json profile = m_httpManager.GetJson(cpr::Url{url});
    if (!profile.is_object()) {
        throw BackendError("Fabric: invalid profile json");
    }

    const std::string expectedId = make_loader_version_id(LoaderKind::FABRIC, gameVersion, loaderVersion);
    std::string id = profile.value("id", expectedId);
    if (id != expectedId) {
        m_logger->warn("Fabric profile id '{}' differs from '{}'", id, expectedId);
    }
    m_versions.writeVersionJson(id, profile);
    m_logger->info("Installed {}", id);
    return id;
}

} // namespace Ember
