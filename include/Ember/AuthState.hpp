// include/Ember/AuthState.hpp
#ifndef EMBER_AUTH_STATE_HPP
#define EMBER_AUTH_STATE_HPP

#include <Ember/Types/Account.hpp>

#include <functional>
#include <optional>

namespace Ember {

    // Holds the identity used for launching. How an identity is obtained is up to the
    // login handler; this class only knows whether one is present.
    class AuthState {
    public:
        const std::optional<Account>& currentAccount() const { return m_current; }
        void setAccount(const Account& account) { m_current = account; }
        void logout() { m_current.reset(); }

        void setLoginHandler(std::function<void()> handler) { m_loginHandler = std::move(handler); }

        // Starts the re-authentication flow
        void requestLogin();
        unsigned int loginRequestCount() const { return m_loginRequests; }

    private:
        std::optional<Account> m_current;
        std::function<void()> m_loginHandler;
        unsigned int m_loginRequests = 0;
    };

} // namespace Ember

#endif // EMBER_AUTH_STATE_HPP
