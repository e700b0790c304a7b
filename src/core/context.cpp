/*
 * Cancellation context implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/core/context.hpp>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace shellkit {
namespace detail {

struct ContextState {
    std::mutex mu;
    bool cancelled = false;
    std::string reason;
    std::optional<Context::Clock::time_point> deadline;
    std::map<std::uint64_t, std::function<void()>> callbacks;
    std::uint64_t next_id = 1;
    std::shared_ptr<ContextState> parent;
    std::uint64_t parent_reg = 0;

    ~ContextState();
};

static void remove_callback(ContextState& st, std::uint64_t id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(st.mu);
    st.callbacks.erase(id);
}

ContextState::~ContextState() {
    if (parent) remove_callback(*parent, parent_reg);
}

// Callbacks are moved out under the lock and invoked after releasing it.
static void fire(ContextState& st, std::unique_lock<std::mutex>& lock, const std::string& reason) {
    st.cancelled = true;
    st.reason = reason;
    std::map<std::uint64_t, std::function<void()>> cbs;
    cbs.swap(st.callbacks);
    lock.unlock();
    for (auto& kv : cbs) kv.second();
}

static void cancel_state(ContextState& st, const std::string& reason) {
    std::unique_lock<std::mutex> lock(st.mu);
    if (st.cancelled) return;
    fire(st, lock, reason);
}

static bool check_state(ContextState& st) {
    std::unique_lock<std::mutex> lock(st.mu);
    if (st.cancelled) return true;
    if (st.deadline && Context::Clock::now() >= *st.deadline) {
        fire(st, lock, "deadline exceeded");
        return true;
    }
    return false;
}

// Returns 0 when the state was already cancelled; fn has run in that case.
static std::uint64_t add_callback(ContextState& st, std::function<void()> fn) {
    if (check_state(st)) { fn(); return 0; }
    std::unique_lock<std::mutex> lock(st.mu);
    if (st.cancelled) { lock.unlock(); fn(); return 0; }
    std::uint64_t id = st.next_id++;
    st.callbacks.emplace(id, std::move(fn));
    return id;
}

} // namespace detail

CancelRegistration::CancelRegistration(std::weak_ptr<detail::ContextState> state, std::uint64_t id)
    : m_state(std::move(state)), m_id(id) {}

CancelRegistration::~CancelRegistration() { reset(); }

CancelRegistration::CancelRegistration(CancelRegistration&& other) noexcept
    : m_state(std::move(other.m_state)), m_id(other.m_id) { other.m_id = 0; }

CancelRegistration& CancelRegistration::operator=(CancelRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        m_state = std::move(other.m_state);
        m_id = other.m_id; other.m_id = 0;
    }
    return *this;
}

void CancelRegistration::reset() {
    if (m_id == 0) return;
    if (auto st = m_state.lock()) detail::remove_callback(*st, m_id);
    m_id = 0;
    m_state.reset();
}

Context Context::background() { return Context(nullptr); }

std::pair<Context, CancelFn> Context::with_cancel(const Context& parent) {
    auto st = std::make_shared<detail::ContextState>();
    if (parent.m_state) {
        {
            std::lock_guard<std::mutex> lock(parent.m_state->mu);
            st->deadline = parent.m_state->deadline;
        }
        st->parent = parent.m_state;
        std::weak_ptr<detail::ContextState> weak_child = st;
        std::weak_ptr<detail::ContextState> weak_parent = parent.m_state;
        st->parent_reg = detail::add_callback(*parent.m_state, [weak_child, weak_parent]{
            auto child = weak_child.lock();
            if (!child) return;
            std::string why = "cancelled";
            if (auto p = weak_parent.lock()) { std::lock_guard<std::mutex> lock(p->mu); why = p->reason; }
            detail::cancel_state(*child, why);
        });
    }
    std::weak_ptr<detail::ContextState> weak = st;
    CancelFn cancel = [weak]{ if (auto s = weak.lock()) detail::cancel_state(*s, "cancelled"); };
    return {Context(st), std::move(cancel)};
}

std::pair<Context, CancelFn> Context::with_timeout(const Context& parent, Clock::duration timeout) {
    auto res = with_cancel(parent);
    auto when = Clock::now() + timeout;
    {
        std::lock_guard<std::mutex> lock(res.first.m_state->mu);
        auto& dl = res.first.m_state->deadline;
        if (!dl || when < *dl) dl = when;
    }
    return res;
}

bool Context::cancelled() const {
    if (!m_state) return false;
    return detail::check_state(*m_state);
}

std::string Context::reason() const {
    if (!m_state || !cancelled()) return "";
    std::lock_guard<std::mutex> lock(m_state->mu);
    return m_state->reason;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    if (!m_state) return std::nullopt;
    std::lock_guard<std::mutex> lock(m_state->mu);
    return m_state->deadline;
}

CancelRegistration Context::on_cancel(std::function<void()> fn) const {
    if (!m_state) return CancelRegistration();
    auto id = detail::add_callback(*m_state, std::move(fn));
    return CancelRegistration(m_state, id);
}

namespace {
struct Waiter {
    std::mutex mu;
    std::condition_variable cv;
    bool fired = false;
};
}

bool Context::wait_for(Clock::duration d) const {
    if (!m_state) { std::this_thread::sleep_for(d); return false; }
    auto w = std::make_shared<Waiter>();
    auto reg = on_cancel([w]{
        { std::lock_guard<std::mutex> lock(w->mu); w->fired = true; }
        w->cv.notify_all();
    });
    auto until = Clock::now() + d;
    if (auto dl = deadline()) if (*dl < until) until = *dl;
    {
        std::unique_lock<std::mutex> lock(w->mu);
        w->cv.wait_until(lock, until, [&]{ return w->fired; });
    }
    return cancelled();
}

} // namespace shellkit
