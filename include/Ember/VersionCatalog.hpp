// include/Ember/VersionCatalog.hpp
#ifndef EMBER_VERSION_CATALOG_HPP
#define EMBER_VERSION_CATALOG_HPP

#include <Ember/Types/Version.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Ember {

    class Backend;
    class StatusBoard;

    enum class VersionFilter {
        ALL,
        RELEASE,
        SNAPSHOT,
        MODDED, // fabric and forge
    };

    VersionFilter string_to_version_filter(const std::string& s);

    // Vanilla manifest merged with the locally installed mod-loader versions, plus the
    // currently selected version id.
    class VersionCatalog {
    public:
        VersionCatalog(Backend& backend, StatusBoard& status);

        // Fetches the manifest and the installed ids concurrently, then picks a selection.
        // On any failure nothing is overwritten and false is returned.
        bool refresh();

        // Re-lists installed Fabric and Forge versions. Keeps the old list on failure.
        bool refreshModLoaders();

        // refresh() followed by refreshModLoaders(); the second runs even if the first fails.
        bool refreshAll();

        // Mod-loader entries first, then the manifest in upstream order
        std::vector<Version> versions() const;
        const std::vector<Version>& vanillaVersions() const { return m_vanilla; }
        const std::vector<Version>& modLoaderVersions() const { return m_modLoaders; }
        const std::vector<std::string>& installedVersionIds() const { return m_installedIds; }

        const std::string& selectedVersion() const { return m_selected; }
        void select(const std::string& id) { m_selected = id; }

        std::optional<Version> find(const std::string& id) const;
        bool isVanilla(const std::string& id) const;
        // True for manifest ids and for installed mod-loader ids
        bool contains(const std::string& id) const;

        std::vector<Version> filter(const std::string& query, VersionFilter typeFilter) const;

        static std::vector<Version> filter(const std::vector<Version>& source, const std::string& query,
                                           VersionFilter typeFilter);
        // Lower-cases ASCII and maps the full-width stop (U+3002) to '.'
        static std::string normalizeQuery(const std::string& query);
        // First installed release in manifest order, else first installed in manifest order,
        // else the first installed id as-is. Empty when nothing is installed.
        static std::optional<std::string> pickDefaultSelection(const std::vector<Version>& manifest,
                                                               const std::vector<std::string>& installedIds);

    private:
        Backend& m_backend;
        StatusBoard& m_status;
        std::vector<Version> m_vanilla;
        std::vector<Version> m_modLoaders;
        std::vector<std::string> m_installedIds;
        std::string m_selected;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_VERSION_CATALOG_HPP
