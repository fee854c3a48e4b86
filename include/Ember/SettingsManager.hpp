// include/Ember/SettingsManager.hpp
#ifndef EMBER_SETTINGS_MANAGER_HPP
#define EMBER_SETTINGS_MANAGER_HPP

#include <Ember/Types/LauncherConfig.hpp>

#include <memory>
#include <spdlog/logger.h>

namespace Ember {

    class Backend;
    class StatusBoard;

    // Owns the launcher's in-memory settings and syncs them with the backend.
    class SettingsManager {
    public:
        SettingsManager(Backend& backend, StatusBoard& status);

        // Pulls settings from the backend. A theme other than the pinned one is corrected and
        // saved straight away. On failure the current settings are kept.
        bool load();
        bool save();

        LauncherConfig& settings() { return m_settings; }
        const LauncherConfig& settings() const { return m_settings; }

    private:
        Backend& m_backend;
        StatusBoard& m_status;
        LauncherConfig m_settings;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_SETTINGS_MANAGER_HPP
