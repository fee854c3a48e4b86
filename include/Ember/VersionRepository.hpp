// include/Ember/VersionRepository.hpp
#ifndef EMBER_VERSION_REPOSITORY_HPP
#define EMBER_VERSION_REPOSITORY_HPP

#include <Ember/Config.hpp>
#include <Ember/Types/GameVersion.hpp>
#include <Ember/Types/ModLoader.hpp>
#include <Ember/Types/Version.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace Ember {

    class HttpManager;

    // The Mojang manifest plus the versions/ directory of the game data folder.
    class VersionRepository {
    public:
        static constexpr const char* MANIFEST_URL = "https://piston-meta.mojang.com/mc/game/version_manifest_v2.json";

        VersionRepository(const Config& config, HttpManager& httpManager);

        // Upstream order (newest first). The first successful fetch is cached. Throws BackendError.
        std::vector<Version> fetchManifest();
        std::optional<Version> findInManifest(const std::string& id);

        // Directories versions/<id> that hold <id>.json, sorted by id
        std::vector<std::string> installedVersionIds() const;
        std::vector<std::string> installedLoaderIds(LoaderKind kind) const;
        bool isInstalled(const std::string& id) const;

        std::filesystem::path versionDirectory(const std::string& id) const;
        std::filesystem::path versionJsonPath(const std::string& id) const;
        std::filesystem::path clientJarPath(const std::string& id) const;
        std::filesystem::path nativesDirectory(const std::string& id) const;

        // Throw BackendError
        nlohmann::json readVersionJson(const std::string& id) const;
        void writeVersionJson(const std::string& id, const nlohmann::json& j) const;

        // Fetches versions/<id>/<id>.json from the manifest if it is missing or fails its checksum.
        void ensureVersionJson(const std::string& id);

        // Loads id and its inheritsFrom chain, fetching vanilla parents as needed, merged into one
        // profile. Throws BackendError.
        GameVersion resolve(const std::string& id);

        static std::vector<Version> parseManifest(const nlohmann::json& j);

    private:
        const Config& m_config;
        HttpManager& m_httpManager;
        std::mutex m_manifestMutex;
        std::optional<std::vector<Version>> m_manifest;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_VERSION_REPOSITORY_HPP
