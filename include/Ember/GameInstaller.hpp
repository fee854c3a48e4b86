// include/Ember/GameInstaller.hpp
#ifndef EMBER_GAME_INSTALLER_HPP
#define EMBER_GAME_INSTALLER_HPP

#include <Ember/Config.hpp>
#include <Ember/DownloadQueue.hpp>
#include <Ember/Types/GameVersion.hpp>
#include <Ember/Types/Rule.hpp>

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace Ember {

    class HttpManager;
    class VersionRepository;

    // Puts everything a resolved version needs on disk: client jar, libraries, natives, assets.
    class GameInstaller {
    public:
        static constexpr const char* RESOURCES_URL = "https://resources.download.minecraft.net/";

        GameInstaller(const Config& config, VersionRepository& versions, HttpManager& httpManager);

        // Throws BackendError
        void install(const GameVersion& version, unsigned int downloadThreads,
                     const Utils::CancellationToken* cancel = nullptr,
                     const DownloadQueue::ProgressListener& listener = {});

        // Client jar, libraries and native jars allowed on ctx, plus the asset index
        std::vector<DownloadTask> collectTasks(const GameVersion& version, const RuleContext& ctx) const;

        // Unpacks the native jars into dir, honouring each library's extract excludes.
        void extractNatives(const GameVersion& version, const RuleContext& ctx, const std::filesystem::path& dir) const;

        static std::vector<DownloadTask> assetObjectTasks(const nlohmann::json& assetIndex,
                                                          const std::filesystem::path& assetsDir);
        // "64" or "32", substituted for ${arch} in native classifiers
        static std::string archBits(const RuleContext& ctx);

    private:
        const Config& m_config;
        VersionRepository& m_versions;
        HttpManager& m_httpManager;
        std::shared_ptr<spdlog::logger> m_logger;

        std::filesystem::path assetIndexPath(const GameVersion& version) const;
    };

} // namespace Ember

#endif // EMBER_GAME_INSTALLER_HPP
