// include/Ember/FabricInstaller.hpp
#ifndef EMBER_FABRIC_INSTALLER_HPP
#define EMBER_FABRIC_INSTALLER_HPP

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

namespace Ember {

    class HttpManager;
    class VersionRepository;

    // Installs Fabric by saving the loader profile from meta.fabricmc.net as a version JSON.
    // Loader libraries are fetched on first launch like any other library.
    class FabricInstaller {
    public:
        static constexpr const char* META_URL = "https://meta.fabricmc.net/v2";

        FabricInstaller(VersionRepository& versions, HttpManager& httpManager);

        // Newest first. Throws BackendError.
        std::vector<std::string> loaderVersions(const std::string& gameVersion);

        // Returns the installed id, fabric-loader-<loader>-<game>. Throws BackendError.
        std::string install(const std::string& gameVersion, const std::string& loaderVersion);

        static std::vector<std::string> parseLoaderVersions(const nlohmann::json& j);

    private:
        VersionRepository& m_versions;
        HttpManager& m_httpManager;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_FABRIC_INSTALLER_HPP
