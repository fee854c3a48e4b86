// src/LocalBackend.cpp
#include <Ember/LocalBackend.hpp>
#include <Ember/Utils/Logger.hpp>

namespace Ember {

LocalBackend::LocalBackend(Config& config)
    : m_config(config),
      m_http(),
      m_settingsStore(config.settingsFile),
      m_javaManager(config, m_http),
      m_versions(config, m_http),
      m_installer(config, m_versions, m_http),
      m_fabric(m_versions, m_http),
      m_forge(config, m_versions, m_http),
      m_launcher(config, m_versions, m_installer) {
    m_logger = Utils::Logger::GetOrCreateLogger("LocalBackend");
    try {
        applySettings(m_settingsStore.load());
    } catch (const std::exception& e) {
        m_logger->warn("Starting with default settings: {}", e.what());
        applySettings(LauncherConfig{});
    }
}

void LocalBackend::applySettings(const LauncherConfig& config) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_settings = config;
    }
    m_http.setTimeout(std::chrono::milliseconds(config.requestTimeoutMs));
    const std::filesystem::path gameDir = config.gameDir ? std::filesystem::path(*config.gameDir) : m_config.baseDataPath;
    if (gameDir != m_config.gameDirectory()) {
        m_logger->info("Game directory: {}", gameDir.string());
        m_config.setGameDirectory(gameDir);
    }
}

LauncherConfig LocalBackend::currentSettings() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_settings;
}

void LocalBackend::throwIfCancelled() const {
    if (m_cancel.isCancelled()) {
        throw BackendError("Operation cancelled");
    }
}

void LocalBackend::setActiveAccount(const Account& account) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_account = account;
}

void LocalBackend::setDownloadListener(DownloadQueue::ProgressListener listener) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_downloadListener = std::move(listener);
}

LauncherConfig LocalBackend::getSettings() {
    LauncherConfig config = m_settingsStore.load();
    applySettings(config);
    return config;
}

void LocalBackend::saveSettings(const LauncherConfig& config) {
    m_settingsStore.save(config);
    applySettings(config);
}

std::vector<JavaInstallation> LocalBackend::detectJava() {
    return m_javaManager.detectInstallations();
}

std::vector<unsigned int> LocalBackend::fetchAvailableJavaVersions() {
    throwIfCancelled();
    return m_javaManager.availableReleases();
}

JavaInstallation LocalBackend::downloadAdoptiumJava(unsigned int majorVersion, ImageType imageType,
                                                    const std::optional<std::filesystem::path>& customPath) {
    throwIfCancelled();
    return m_javaManager.installAdoptium(majorVersion, imageType, customPath, &m_cancel);
}

std::vector<Version> LocalBackend::getVersions() {
    throwIfCancelled();
    return m_versions.fetchManifest();
}

std::vector<std::string> LocalBackend::getInstalledVersions() {
    return m_versions.installedVersionIds();
}

std::vector<std::string> LocalBackend::listInstalledFabricVersions() {
    return m_versions.installedLoaderIds(LoaderKind::FABRIC);
}

std::vector<std::string> LocalBackend::listInstalledForgeVersions() {
    return m_versions.installedLoaderIds(LoaderKind::FORGE);
}

std::vector<std::string> LocalBackend::getFabricLoaderVersions(const std::string& gameVersion) {
    throwIfCancelled();
    return m_fabric.loaderVersions(gameVersion);
}

std::vector<std::string> LocalBackend::getForgeVersions(const std::string& gameVersion) {
    throwIfCancelled();
    return m_forge.versions(gameVersion);
}

std::string LocalBackend::installFabric(const std::string& gameVersion, const std::string& loaderVersion) {
    throwIfCancelled();
    return m_fabric.install(gameVersion, loaderVersion);
}

std::string LocalBackend::installForge(const std::string& gameVersion, const std::string& loaderVersion) {
    throwIfCancelled();
    const std::filesystem::path java = JavaManager::normalizeJavaPath(currentSettings().javaPath);
    return m_forge.install(gameVersion, loaderVersion, java, &m_cancel);
}

std::string LocalBackend::startGame(const std::string& versionId) {
    throwIfCancelled();
    std::optional<Account> account;
    DownloadQueue::ProgressListener listener;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        account = m_account;
        listener = m_downloadListener;
    }
    if (!account) {
        throw BackendError("No account is signed in");
    }
    return m_launcher.launch(versionId, *account, currentSettings(), &m_cancel, listener);
}

} // namespace Ember
