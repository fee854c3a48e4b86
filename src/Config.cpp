// src/Config.cpp
#include <Ember/Config.hpp>
#include <Ember/Utils/Logger.hpp>

#include <string>

namespace Ember {

Config::Config(const std::filesystem::path& base) : baseDataPath(base) {
    javaRuntimesDir = baseDataPath / "java_runtimes";
    downloadsDir = baseDataPath / "downloads";
    logsDir = baseDataPath / "logs";
    settingsFile = baseDataPath / "settings.json";
    setGameDirectory(baseDataPath);
}

void Config::setGameDirectory(const std::filesystem::path& gameDir) {
    m_gameDir = gameDir;
    assetsDir = m_gameDir / "assets";
    librariesDir = m_gameDir / "libraries";
    versionsDir = m_gameDir / "versions";
    ensureDirectories();
}

void Config::ensureDirectories() const {
    auto create_dir_if_not_exists = [](const std::filesystem::path& p, const std::string& name) {
        std::error_code ec;
        if (std::filesystem::exists(p, ec)) {
            return;
        }
        if (std::filesystem::create_directories(p, ec)) {
            CORE_LOG_TRACE("Created {} directory: {}", name, p.string());
        } else {
            CORE_LOG_ERROR("Failed to create {} directory {}: {}", name, p.string(), ec.message());
        }
    };

    create_dir_if_not_exists(baseDataPath, "Base Data");
    create_dir_if_not_exists(javaRuntimesDir, "Java Runtimes");
    create_dir_if_not_exists(downloadsDir, "Downloads");
    create_dir_if_not_exists(m_gameDir, "Game");
    create_dir_if_not_exists(assetsDir / "objects", "Asset Objects");
    create_dir_if_not_exists(assetsDir / "indexes", "Asset Indexes");
    create_dir_if_not_exists(librariesDir, "Libraries");
    create_dir_if_not_exists(versionsDir, "Versions");
}

} // namespace Ember
