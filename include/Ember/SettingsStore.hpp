// include/Ember/SettingsStore.hpp
#ifndef EMBER_SETTINGS_STORE_HPP
#define EMBER_SETTINGS_STORE_HPP

#include <Ember/Types/LauncherConfig.hpp>

#include <filesystem>
#include <memory>
#include <spdlog/logger.h>

namespace Ember {

    // settings.json on disk
    class SettingsStore {
    public:
        explicit SettingsStore(std::filesystem::path file);

        // Defaults when the file does not exist. Throws BackendError if it cannot be read or parsed.
        LauncherConfig load() const;
        // Writes a sibling temp file and renames it over the target. Throws BackendError.
        void save(const LauncherConfig& config) const;

        const std::filesystem::path& path() const { return m_file; }

    private:
        std::filesystem::path m_file;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_SETTINGS_STORE_HPP
