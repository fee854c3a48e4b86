// src/LaunchCoordinator.cpp
#include <Ember/LaunchCoordinator.hpp>
#include <Ember/AuthState.hpp>
#include <Ember/Backend.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/VersionCatalog.hpp>
#include <Ember/Utils/Logger.hpp>

#include <stdexcept>

namespace Ember {

std::string launch_outcome_to_string(LaunchOutcome outcome) {
    switch (outcome) {
        case LaunchOutcome::LAUNCHED: return "launched";
        case LaunchOutcome::FAILED: return "failed";
        case LaunchOutcome::NOT_AUTHENTICATED: return "not_authenticated";
        case LaunchOutcome::NO_VERSION_SELECTED: return "no_version_selected";
        case LaunchOutcome::UNKNOWN_VERSION: return "unknown_version";
        default: throw std::runtime_error("Unknown LaunchOutcome enum");
    }
}

LaunchCoordinator::LaunchCoordinator(Backend& backend, AuthState& auth, VersionCatalog& catalog, StatusBoard& status)
    : m_backend(backend), m_auth(auth), m_catalog(catalog), m_status(status) {
    m_logger = Utils::Logger::GetOrCreateLogger("LaunchCoordinator");
}

LaunchOutcome LaunchCoordinator::launch() {
    if (!m_auth.currentAccount()) {
        m_logger->info("Launch requested without an account");
        m_auth.requestLogin();
        m_status.setStatus("Please login first!");
        return LaunchOutcome::NOT_AUTHENTICATED;
    }

    const std::string versionId = m_catalog.selectedVersion();
    if (versionId.empty()) {
        m_status.setStatus("Please select a version!");
        return LaunchOutcome::NO_VERSION_SELECTED;
    }
    if (!m_catalog.contains(versionId)) {
        m_logger->warn("Refusing to launch '{}', not in the catalog", versionId);
        m_status.setStatus("Version " + versionId + " is not installed or unknown");
        return LaunchOutcome::UNKNOWN_VERSION;
    }

    m_status.setStatus("Preparing to launch " + versionId + "...");
    m_logger->info("Launching {} as {}", versionId, m_auth.currentAccount()->username);
    try {
        std::string result = m_backend.startGame(versionId);
        m_status.setStatus(result);
        return LaunchOutcome::LAUNCHED;
    } catch (const std::exception& e) {
        m_logger->error("Launch of {} failed: {}", versionId, e.what());
        m_status.setStatus(std::string("Error: ") + e.what());
        return LaunchOutcome::FAILED;
    }
}

} // namespace Ember
