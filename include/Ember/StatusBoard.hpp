// include/Ember/StatusBoard.hpp
#ifndef EMBER_STATUS_BOARD_HPP
#define EMBER_STATUS_BOARD_HPP

#include <functional>
#include <string>

namespace Ember {

    // The single user-visible status line. Components write to it; the front end renders it.
    class StatusBoard {
    public:
        using Listener = std::function<void(const std::string&)>;

        void setStatus(const std::string& status);
        const std::string& current() const { return m_current; }

        // Called synchronously on every setStatus()
        void setListener(Listener listener) { m_listener = std::move(listener); }

    private:
        std::string m_current;
        Listener m_listener;
    };

} // namespace Ember

#endif // EMBER_STATUS_BOARD_HPP
