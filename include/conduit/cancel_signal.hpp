#pragma once

#include <functional>
#include <mutex>
#include <utility>

namespace conduit {

    /**
     * @brief One-shot cancellation flag with an interrupt hook.
     *
     * Whoever is blocked on behalf of the signal (a connector mid-handshake,
     * a carrier between exchanges) installs a hook that interrupts it. The
     * hook runs under the signal's own mutex, so once clear_hook() returns the
     * hook is neither running nor going to run.
     *
     * @note Thread-safe. cancel() may be called from any thread.
     */
    class CancelSignal {
       public:
        using Hook = std::function<void()>;

        CancelSignal() = default;
        CancelSignal(const CancelSignal&) = delete;
        CancelSignal& operator=(const CancelSignal&) = delete;

        /// @brief Install @p hook. Runs it at once if already canceled.
        void set_hook(Hook hook) {
            std::lock_guard<std::mutex> lk(m_mu);
            m_hook = std::move(hook);
            if (m_canceled && m_hook) m_hook();
        }

        void clear_hook() {
            std::lock_guard<std::mutex> lk(m_mu);
            m_hook = nullptr;
        }

        /// @brief Set the flag and run the hook. Idempotent.
        void cancel() {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_canceled) return;
            m_canceled = true;
            if (m_hook) m_hook();
        }

        bool canceled() const {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_canceled;
        }

       private:
        mutable std::mutex m_mu;
        bool m_canceled{false};
        Hook m_hook;
    };

}  // namespace conduit
