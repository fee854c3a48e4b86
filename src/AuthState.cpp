// src/AuthState.cpp
#include <Ember/AuthState.hpp>
#include <Ember/Utils/Logger.hpp>

namespace Ember {

void AuthState::requestLogin() {
    ++m_loginRequests;
    if (m_loginHandler) {
        m_loginHandler();
    } else {
        CORE_LOG_WARN("Login requested but no login handler is registered");
    }
}

} // namespace Ember
