// include/Ember/Config.hpp
#ifndef EMBER_CONFIG_HPP
#define EMBER_CONFIG_HPP

#include <filesystem>

namespace Ember {

    // On-disk layout of the launcher data directory. Constructing a Config creates the directories.
    struct Config {
        std::filesystem::path baseDataPath;
        std::filesystem::path javaRuntimesDir;
        std::filesystem::path downloadsDir;
        std::filesystem::path assetsDir;
        std::filesystem::path librariesDir;
        std::filesystem::path versionsDir;
        std::filesystem::path logsDir;
        std::filesystem::path settingsFile;

        explicit Config(const std::filesystem::path& base = "./.ember");

        // Game data (versions, libraries, assets) may live elsewhere than the launcher's own files.
        void setGameDirectory(const std::filesystem::path& gameDir);
        const std::filesystem::path& gameDirectory() const { return m_gameDir; }

    private:
        std::filesystem::path m_gameDir;

        void ensureDirectories() const;
    };

} // namespace Ember

#endif // EMBER_CONFIG_HPP
