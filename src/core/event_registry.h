#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

// Core EventRegistry subsystem
// Responsible for: synchronous fan-out of events to subscribers with explicit unsubscribe tokens.
// Should NOT do: queuing, deferred dispatch, or cross-thread delivery.
namespace railyard::core {

using SubscriptionToken = std::uint64_t;

inline constexpr SubscriptionToken kInvalidSubscriptionToken = 0;

template <typename Event>
class EventRegistry {
public:
    using Callback = std::function<void(const Event&)>;

    SubscriptionToken subscribe(Callback callback) {
        if (!callback) {
            return kInvalidSubscriptionToken;
        }
        const SubscriptionToken token = ++m_lastToken;
        m_subscribers.emplace_back(token, std::move(callback));
        return token;
    }

    bool unsubscribe(SubscriptionToken token) {
        const auto it = std::find_if(m_subscribers.begin(), m_subscribers.end(), [token](const auto& entry) {
            return entry.first == token;
        });
        if (it == m_subscribers.end()) {
            return false;
        }
        m_subscribers.erase(it);
        return true;
    }

    // Delivered in subscription order before returning. A callback that
    // unsubscribes during dispatch still sees the current event.
    void notify(const Event& event) const {
        const std::vector<std::pair<SubscriptionToken, Callback>> snapshot = m_subscribers;
        for (const auto& entry : snapshot) {
            entry.second(event);
        }
    }

    [[nodiscard]] std::size_t subscriberCount() const { return m_subscribers.size(); }

private:
    std::vector<std::pair<SubscriptionToken, Callback>> m_subscribers;
    SubscriptionToken m_lastToken = kInvalidSubscriptionToken;
};

} // namespace railyard::core
