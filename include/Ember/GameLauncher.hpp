// include/Ember/GameLauncher.hpp
#ifndef EMBER_GAME_LAUNCHER_HPP
#define EMBER_GAME_LAUNCHER_HPP

#include <Ember/Config.hpp>
#include <Ember/DownloadQueue.hpp>
#include <Ember/Types/Account.hpp>
#include <Ember/Types/GameVersion.hpp>
#include <Ember/Types/LauncherConfig.hpp>
#include <Ember/Types/Rule.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Ember {

    class GameInstaller;
    class VersionRepository;

    // Everything the command line depends on
    struct LaunchContext {
        GameVersion version; // already merged with its parents
        Account account;
        LauncherConfig settings;
        std::filesystem::path javaExecutable;
        std::filesystem::path gameDir;
        std::filesystem::path assetsDir;
        std::filesystem::path librariesDir;
        std::filesystem::path nativesDir;
        std::filesystem::path clientJar;
        RuleContext rules;
        char classpathSeparator = ':';
    };

    class GameLauncher {
    public:
        static constexpr const char* LAUNCHER_NAME = "ember";
        static constexpr const char* LAUNCHER_VERSION = "1.0";

        GameLauncher(const Config& config, VersionRepository& versions, GameInstaller& installer);

        // Resolves and installs versionId, then starts the game detached.
        // Returns "Launched <id> (pid <n>)". Throws BackendError.
        std::string launch(const std::string& versionId, const Account& account, const LauncherConfig& settings,
                           const Utils::CancellationToken* cancel = nullptr,
                           const DownloadQueue::ProgressListener& listener = {});

        // java, JVM arguments, main class, game arguments
        static std::vector<std::string> buildCommand(const LaunchContext& ctx);
        // One entry per group:artifact[:classifier], earlier libraries win, client jar last
        static std::string buildClasspath(const LaunchContext& ctx);
        static std::map<std::string, std::string> placeholderValues(const LaunchContext& ctx, const std::string& classpath);
        // ${name} is replaced when vars has it, kept verbatim otherwise
        static std::string substitutePlaceholders(const std::string& arg, const std::map<std::string, std::string>& vars);

    private:
        const Config& m_config;
        VersionRepository& m_versions;
        GameInstaller& m_installer;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_GAME_LAUNCHER_HPP
