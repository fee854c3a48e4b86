// include/Ember/LaunchCoordinator.hpp
#ifndef EMBER_LAUNCH_COORDINATOR_HPP
#define EMBER_LAUNCH_COORDINATOR_HPP

#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Ember {

    class AuthState;
    class Backend;
    class StatusBoard;
    class VersionCatalog;

    enum class LaunchOutcome {
        LAUNCHED,          // start_game returned, its text is on the status line
        FAILED,            // start_game threw
        NOT_AUTHENTICATED,
        NO_VERSION_SELECTED,
        UNKNOWN_VERSION,
    };

    std::string launch_outcome_to_string(LaunchOutcome outcome);

    // Checks the launch preconditions and, when they hold, issues exactly one start_game.
    class LaunchCoordinator {
    public:
        LaunchCoordinator(Backend& backend, AuthState& auth, VersionCatalog& catalog, StatusBoard& status);

        LaunchOutcome launch();

    private:
        Backend& m_backend;
        AuthState& m_auth;
        VersionCatalog& m_catalog;
        StatusBoard& m_status;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_LAUNCH_COORDINATOR_HPP
