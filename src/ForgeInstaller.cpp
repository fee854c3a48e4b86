// src/ForgeInstaller.cpp
#include <Ember/ForgeInstaller.hpp>
#include <Ember/Backend.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/VersionRepository.hpp>
#include <Ember/Types/ModLoader.hpp>
#include <Ember/Utils/Logger.hpp>
#include <Ember/Utils/Process.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace Ember {

ForgeInstaller::ForgeInstaller(const Config& config, VersionRepository& versions, HttpManager& httpManager)
    : m_config(config), m_versions(versions), m_httpManager(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("ForgeInstaller");
}

std::vector<std::string> ForgeInstaller::parseMetadata(const nlohmann::json& j, const std::string& gameVersion) {
    std::vector<std::string> versions;
    if (!j.is_object() || !j.contains(gameVersion) || !j.at(gameVersion).is_array()) {
        return versions;
    }
    const std::string prefix = gameVersion + "-";
    for (const auto& entry : j.at(gameVersion)) {
        if (!entry.is_string()) continue;
        std::string full = entry.get<std::string>(); // "1.20.1-47.1.3"
        if (full.rfind(prefix, 0) != 0) continue;
        std::string loader = full.substr(prefix.size());
        if (!loader.empty()) versions.push_back(loader);
    }
    std::reverse(versions.begin(), versions.end());
    versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
    return versions;
}

std::string ForgeInstaller::installerUrl(const std::string& gameVersion, const std::string& loaderVersion) {
    const std::string coordinate = gameVersion + "-" + loaderVersion;
    return std::string(MAVEN_URL) + coordinate + "/forge-" + coordinate + "-installer.jar";
}

std::vector<std::string> ForgeInstaller::versions(const std::string& gameVersion) {
    std::vector<std::string> result = parseMetadata(m_httpManager.GetJson(cpr::Url{METADATA_URL}), gameVersion);

    try {
        nlohmann::json promotions = m_httpManager.GetJson(cpr::Url{PROMOTIONS_URL});
        const auto& promos = promotions.at("promos");
        for (const char* channel : {"-latest", "-recommended"}) {
            const std::string key = gameVersion + channel;
            if (!promos.contains(key)) continue;
            const std::string promoted = promos.at(key).get<std::string>();
            result.erase(std::remove(result.begin(), result.end(), promoted), result.end());
            result.insert(result.begin(), promoted);
        }
    } catch (const std::exception& e) {
        m_logger->warn("Forge promotions unavailable: {}", e.what());
    }
    return result;
}

void ForgeInstaller::ensureLauncherProfiles() const {
    // The installer refuses to run without a launcher_profiles.json in the target
    const auto path = m_config.gameDirectory() / "launcher_profiles.json";
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return;
    }
    std::ofstream out(path);
    if (!out) {
        throw BackendError("Failed to create " + path.string());
    }
    out << nlohmann::json{{"profiles", nlohmann::json::object()}, {"version", 3}}.dump(2);
}

std::string ForgeInstaller::install(const std::string& gameVersion, const std::string& loaderVersion,
                                    const std::filesystem::path& javaExecutable,
                                    const Utils::CancellationToken* cancel) {
    if (!m_versions.findInManifest(gameVersion)) {
        throw BackendError("Unknown Minecraft version: " + gameVersion);
    }
    m_versions.ensureVersionJson(gameVersion);
    ensureLauncherProfiles();

    const std::string url = installerUrl(gameVersion, loaderVersion);
    const auto installer = m_config.downloadsDir / "forge" / url.substr(url.find_last_of('/') + 1);
    cpr::Response response = m_httpManager.Download(installer, cpr::Url{url}, cancel);
    if (!HttpManager::isSuccess(response)) {
        throw BackendError("Failed to download the Forge installer: " + HttpManager::describeFailure(response));
    }

    m_logger->info("Running Forge installer {} against {}", installer.filename().string(), m_config.gameDirectory().string());
    Utils::ProcessResult result;
    try {
        result = Utils::runAndCapture({javaExecutable.string(), "-jar", installer.string(), "--installClient",
                                       m_config.gameDirectory().string()},
                                      installer.parent_path());
    } catch (const std::exception& e) {
        throw BackendError(std::string("Failed to run the Forge installer: ") + e.what());
    }
    std::error_code ec;
    std::filesystem::remove(installer, ec);
    if (result.exitCode != 0) {
        m_logger->error("Forge installer output:\n{}", result.output);
        throw BackendError("Forge installer exited with code " + std::to_string(result.exitCode));
    }

    const std::string id = make_loader_version_id(LoaderKind::FORGE, gameVersion, loaderVersion);
    if (!m_versions.isInstalled(id)) {
        m_logger->error("Forge installer finished but {} is missing. Output:\n{}", id, result.output);
        throw BackendError("Forge installer did not produce " + id);
    }
    m_logger->info("Installed {}", id);
    return id;
}

} // namespace Ember
