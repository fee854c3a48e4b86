// src/SettingsStore.cpp
#include <Ember/SettingsStore.hpp>
#include <Ember/Backend.hpp>
#include <Ember/Utils/Logger.hpp>

#include <fstream>
#include <sstream>

namespace Ember {

SettingsStore::SettingsStore(std::filesystem::path file) : m_file(std::move(file)) {
    m_logger = Utils::Logger::GetOrCreateLogger("SettingsStore");
}

LauncherConfig SettingsStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_file, ec)) {
        m_logger->info("No settings file at {}, using defaults", m_file.string());
        return LauncherConfig{};
    }

    std::ifstream in(m_file);
    if (!in) {
        throw BackendError("Failed to open settings file: " + m_file.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return LauncherConfig::from_json(nlohmann::json::parse(buffer.str()));
    } catch (const nlohmann::json::exception& e) {
        m_logger->error("Settings file {} is invalid: {}", m_file.string(), e.what());
        throw BackendError(std::string("Failed to parse settings: ") + e.what());
    }
}

void SettingsStore::save(const LauncherConfig& config) const {
    std::error_code ec;
    if (m_file.has_parent_path()) {
        std::filesystem::create_directories(m_file.parent_path(), ec);
        if (ec) {
            throw BackendError("Failed to create " + m_file.parent_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::path tmp = m_file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw BackendError("Failed to open " + tmp.string() + " for writing");
        }
        out << config.to_json().dump(2);
        if (!out) {
            throw BackendError("Failed to write " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, m_file, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw BackendError("Failed to replace " + m_file.string() + ": " + reason);
    }
    m_logger->debug("Settings written to {}", m_file.string());
}

} // namespace Ember
