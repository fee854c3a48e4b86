// include/Ember/LocalBackend.hpp
#ifndef EMBER_LOCAL_BACKEND_HPP
#define EMBER_LOCAL_BACKEND_HPP

#include <Ember/Backend.hpp>
#include <Ember/Config.hpp>
#include <Ember/DownloadQueue.hpp>
#include <Ember/FabricInstaller.hpp>
#include <Ember/ForgeInstaller.hpp>
#include <Ember/GameInstaller.hpp>
#include <Ember/GameLauncher.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/JavaManager.hpp>
#include <Ember/SettingsStore.hpp>
#include <Ember/VersionRepository.hpp>
#include <Ember/Types/Account.hpp>
#include <Ember/Utils/Cancellation.hpp>

#include <mutex>
#include <optional>
#include <spdlog/logger.h>

namespace Ember {

    // Backend that does the work in-process against the local data directory and the public
    // Mojang, Adoptium, Fabric and Forge services.
    class LocalBackend : public Backend {
    public:
        explicit LocalBackend(Config& config);

        LauncherConfig getSettings() override;
        void saveSettings(const LauncherConfig& config) override;

        std::vector<JavaInstallation> detectJava() override;
        std::vector<unsigned int> fetchAvailableJavaVersions() override;
        JavaInstallation downloadAdoptiumJava(unsigned int majorVersion, ImageType imageType,
                                              const std::optional<std::filesystem::path>& customPath) override;

        std::vector<Version> getVersions() override;
        std::vector<std::string> getInstalledVersions() override;
        std::vector<std::string> listInstalledFabricVersions() override;
        std::vector<std::string> listInstalledForgeVersions() override;

        std::vector<std::string> getFabricLoaderVersions(const std::string& gameVersion) override;
        std::vector<std::string> getForgeVersions(const std::string& gameVersion) override;
        std::string installFabric(const std::string& gameVersion, const std::string& loaderVersion) override;
        std::string installForge(const std::string& gameVersion, const std::string& loaderVersion) override;

        std::string startGame(const std::string& versionId) override;

        // The identity start_game launches with
        void setActiveAccount(const Account& account);
        void setDownloadListener(DownloadQueue::ProgressListener listener);

        // Aborts in-flight transfers; later calls fail until resetCancellation()
        void cancel() { m_cancel.cancel(); }
        void resetCancellation() { m_cancel.reset(); }

    private:
        Config& m_config;
        HttpManager m_http;
        SettingsStore m_settingsStore;
        JavaManager m_javaManager;
        VersionRepository m_versions;
        GameInstaller m_installer;
        FabricInstaller m_fabric;
        ForgeInstaller m_forge;
        GameLauncher m_launcher;
        Utils::CancellationToken m_cancel;

        std::mutex m_stateMutex;
        LauncherConfig m_settings;
        std::optional<Account> m_account;
        DownloadQueue::ProgressListener m_downloadListener;

        std::shared_ptr<spdlog::logger> m_logger;

        void applySettings(const LauncherConfig& config);
        LauncherConfig currentSettings();
        void throwIfCancelled() const;
    };

} // namespace Ember

#endif // EMBER_LOCAL_BACKEND_HPP
