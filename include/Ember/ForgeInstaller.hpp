// include/Ember/ForgeInstaller.hpp
#ifndef EMBER_FORGE_INSTALLER_HPP
#define EMBER_FORGE_INSTALLER_HPP

#include <Ember/Config.hpp>

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

namespace Ember {

    class HttpManager;
    class VersionRepository;

    namespace Utils {
        class CancellationToken;
    }

    // Installs Forge by running the official installer headless against the game directory.
    class ForgeInstaller {
    public:
        static constexpr const char* METADATA_URL = "https://files.minecraftforge.net/net/minecraftforge/forge/maven-metadata.json";
        static constexpr const char* PROMOTIONS_URL = "https://files.minecraftforge.net/net/minecraftforge/forge/promotions_slim.json";
        static constexpr const char* MAVEN_URL = "https://maven.minecraftforge.net/net/minecraftforge/forge/";

        ForgeInstaller(const Config& config, VersionRepository& versions, HttpManager& httpManager);

        // Forge versions for gameVersion, recommended build first, then newest first.
        // Throws BackendError.
        std::vector<std::string> versions(const std::string& gameVersion);

        // Returns the installed id, <game>-forge-<loader>. Throws BackendError.
        std::string install(const std::string& gameVersion, const std::string& loaderVersion,
                            const std::filesystem::path& javaExecutable,
                            const Utils::CancellationToken* cancel = nullptr);

        // maven-metadata.json maps "1.20.1" -> ["1.20.1-47.0.0", ...] oldest first
        static std::vector<std::string> parseMetadata(const nlohmann::json& j, const std::string& gameVersion);
        static std::string installerUrl(const std::string& gameVersion, const std::string& loaderVersion);

    private:
        const Config& m_config;
        VersionRepository& m_versions;
        HttpManager& m_httpManager;
        std::shared_ptr<spdlog::logger> m_logger;

        void ensureLauncherProfiles() const;
    };

} // namespace Ember

#endif // EMBER_FORGE_INSTALLER_HPP
