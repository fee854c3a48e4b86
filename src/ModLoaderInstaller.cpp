// src/ModLoaderInstaller.cpp
#include <Ember/ModLoaderInstaller.hpp>
#include <Ember/Backend.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/VersionCatalog.hpp>
#include <Ember/Utils/Logger.hpp>

namespace Ember {

namespace {

std::string displayName(LoaderKind kind) {
    switch (kind) {
        case LoaderKind::FABRIC: return "Fabric";
        case LoaderKind::FORGE: return "Forge";
        default: return "Vanilla";
    }
}

} // namespace

ModLoaderInstaller::ModLoaderInstaller(Backend& backend, VersionCatalog& catalog, StatusBoard& status)
    : m_backend(backend), m_catalog(catalog), m_status(status) {
    m_logger = Utils::Logger::GetOrCreateLogger("ModLoaderInstaller");
}

std::optional<std::string> ModLoaderInstaller::install(const std::string& baseVersion, LoaderKind kind,
                                                       const std::string& loaderVersion) {
    if (kind == LoaderKind::NONE) {
        m_status.setStatus("Please select a mod loader!");
        return std::nullopt;
    }
    if (baseVersion.empty() || loaderVersion.empty()) {
        m_status.setStatus("Please select a version!");
        return std::nullopt;
    }
    if (m_installing) {
        m_logger->warn("Install of {} {} rejected, another install is running", displayName(kind), loaderVersion);
        return std::nullopt;
    }
    if (!m_catalog.isVanilla(baseVersion)) {
        m_status.setStatus("Version " + baseVersion + " is not a known Minecraft version");
        return std::nullopt;
    }

    m_installing = true;
    m_status.setStatus("Installing " + displayName(kind) + " " + loaderVersion + " for " + baseVersion + "...");
    m_logger->info("Installing {} {} on {}", displayName(kind), loaderVersion, baseVersion);

    std::string installedId;
    try {
        installedId = kind == LoaderKind::FABRIC ? m_backend.installFabric(baseVersion, loaderVersion)
                                                 : m_backend.installForge(baseVersion, loaderVersion);
    } catch (const std::exception& e) {
        m_installing = false;
        m_logger->error("{} install failed: {}", displayName(kind), e.what());
        m_status.setStatus("Error installing " + displayName(kind) + ": " + e.what());
        return std::nullopt;
    }
    m_installing = false;

    const std::string expectedId = make_loader_version_id(kind, baseVersion, loaderVersion);
    if (installedId.empty()) {
        installedId = expectedId;
    } else if (installedId != expectedId) {
        m_logger->warn("Installer produced '{}', expected '{}'", installedId, expectedId);
    }

    m_catalog.refreshModLoaders();
    m_catalog.select(installedId);
    m_status.setStatus("Installed " + installedId);
    return installedId;
}

std::vector<std::string> ModLoaderInstaller::availableLoaderVersions(LoaderKind kind, const std::string& baseVersion) {
    try {
        switch (kind) {
            case LoaderKind::FABRIC: return m_backend.getFabricLoaderVersions(baseVersion);
            case LoaderKind::FORGE: return m_backend.getForgeVersions(baseVersion);
            default: return {};
        }
    } catch (const std::exception& e) {
        m_logger->error("Failed to list {} versions for {}: {}", displayName(kind), baseVersion, e.what());
        m_status.setStatus("Error fetching " + displayName(kind) + " versions: " + e.what());
        return {};
    }
}

std::string ModLoaderInstaller::resolveBaseVersion(const std::string& id) const {
    if (m_catalog.isVanilla(id)) {
        return id;
    }
    return base_version_of(id);
}

} // namespace Ember
