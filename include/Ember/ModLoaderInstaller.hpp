// include/Ember/ModLoaderInstaller.hpp
#ifndef EMBER_MODLOADER_INSTALLER_HPP
#define EMBER_MODLOADER_INSTALLER_HPP

#include <Ember/Types/ModLoader.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Ember {

    class Backend;
    class StatusBoard;
    class VersionCatalog;

    // Installs Fabric or Forge on top of a vanilla version and registers the result in the catalog.
    class ModLoaderInstaller {
    public:
        ModLoaderInstaller(Backend& backend, VersionCatalog& catalog, StatusBoard& status);

        // Returns the id of the installed version, which is also selected in the catalog.
        // std::nullopt on failure, with the reason on the status line.
        std::optional<std::string> install(const std::string& baseVersion, LoaderKind kind,
                                           const std::string& loaderVersion);

        // Loader versions the upstream service offers for baseVersion, newest first.
        // Empty on failure.
        std::vector<std::string> availableLoaderVersions(LoaderKind kind, const std::string& baseVersion);

        // The vanilla version an id runs on. Manifest ids are returned unchanged even if they
        // happen to look like loader ids.
        std::string resolveBaseVersion(const std::string& id) const;
        static LoaderKind classify(const std::string& id) { return classify_version_id(id); }

        bool isInstalling() const { return m_installing; }

    private:
        Backend& m_backend;
        VersionCatalog& m_catalog;
        StatusBoard& m_status;
        bool m_installing = false;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_MODLOADER_INSTALLER_HPP
