// src/StatusBoard.cpp
#include <Ember/StatusBoard.hpp>

namespace Ember {

void StatusBoard::setStatus(const std::string& status) {
    m_current = status;
    if (m_listener) {
        m_listener(m_current);
    }
}

} // namespace Ember
