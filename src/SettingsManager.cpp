// src/SettingsManager.cpp
#include <Ember/SettingsManager.hpp>
#include <Ember/Backend.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/Utils/Logger.hpp>

namespace Ember {

SettingsManager::SettingsManager(Backend& backend, StatusBoard& status)
    : m_backend(backend), m_status(status) {
    m_logger = Utils::Logger::GetOrCreateLogger("Settings");
}

bool SettingsManager::load() {
    try {
        m_settings = m_backend.getSettings();
    } catch (const std::exception& e) {
        m_logger->error("Failed to load settings: {}", e.what());
        return false;
    }

    if (m_settings.theme != PINNED_THEME) {
        m_logger->info("Stored theme '{}' is not supported, switching to '{}'", m_settings.theme, PINNED_THEME);
        m_settings.theme = PINNED_THEME;
        save();
    }
    return true;
}

bool SettingsManager::save() {
    try {
        m_backend.saveSettings(m_settings);
        m_status.setStatus("Settings saved!");
        return true;
    } catch (const std::exception& e) {
        m_logger->error("Failed to save settings: {}", e.what());
        m_status.setStatus(std::string("Error saving settings: ") + e.what());
        return false;
    }
}

} // namespace Ember
