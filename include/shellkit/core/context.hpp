/*
 * Cancellation context - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Copyable handle to shared cancellation state. A context is cancelled
 *   explicitly through the CancelFn returned at creation, when its parent is
 *   cancelled, or once its deadline has passed. Deadlines are observed at
 *   checkpoints (cancelled(), waits) rather than by a timer thread.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace shellkit {

namespace detail { struct ContextState; }

using CancelFn = std::function<void()>;

// Unregisters an on_cancel callback when destroyed.
class CancelRegistration {
public:
    CancelRegistration() = default;
    CancelRegistration(std::weak_ptr<detail::ContextState> state, std::uint64_t id);
    ~CancelRegistration();
    CancelRegistration(CancelRegistration&& other) noexcept;
    CancelRegistration& operator=(CancelRegistration&& other) noexcept;
    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;
    void reset();
private:
    std::weak_ptr<detail::ContextState> m_state;
    std::uint64_t m_id = 0;
};

class Context {
public:
    using Clock = std::chrono::steady_clock;

    // Never cancelled, no deadline.
    static Context background();
    static std::pair<Context, CancelFn> with_cancel(const Context& parent);
    static std::pair<Context, CancelFn> with_timeout(const Context& parent, Clock::duration timeout);

    bool cancelled() const;
    // "cancelled" or "deadline exceeded"; empty while still active.
    std::string reason() const;
    std::optional<Clock::time_point> deadline() const;

    // fn runs exactly once on cancellation (immediately if already cancelled),
    // on the cancelling thread and without any context lock held.
    [[nodiscard]] CancelRegistration on_cancel(std::function<void()> fn) const;

    // Cancellable sleep; returns true when cut short by cancellation.
    bool wait_for(Clock::duration d) const;

private:
    explicit Context(std::shared_ptr<detail::ContextState> state) : m_state(std::move(state)) {}
    std::shared_ptr<detail::ContextState> m_state; // null for background
};

} // namespace shellkit
