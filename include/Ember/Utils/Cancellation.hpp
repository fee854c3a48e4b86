// include/Ember/Utils/Cancellation.hpp
#ifndef EMBER_CANCELLATION_HPP
#define EMBER_CANCELLATION_HPP

#include <atomic>

namespace Ember::Utils {

    // Shared flag polled by long-running transfers. Once cancelled it stays cancelled until reset().
    class CancellationToken {
    public:
        void cancel() noexcept { m_cancelled.store(true); }
        void reset() noexcept { m_cancelled.store(false); }
        bool isCancelled() const noexcept { return m_cancelled.load(); }

    private:
        std::atomic<bool> m_cancelled{false};
    };

} // namespace Ember::Utils

#endif // EMBER_CANCELLATION_HPP
