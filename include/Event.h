#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace SnAPI::StateSync
{

/**
 * @brief Handle returned by TMulticastEvent::Add, used to remove a listener.
 */
using ListenerHandle = uint64_t;

/**
 * @brief Ordered list of callbacks invoked together.
 * @tparam Args Callback argument types.
 * @remarks
 * Listeners are called in subscription order. A listener may remove itself
 * (or others) while the event is broadcasting; removals take effect for the
 * next broadcast.
 */
template<typename... Args>
class TMulticastEvent
{
public:
    using Callback = std::function<void(Args...)>;

    ListenerHandle Add(Callback Listener)
    {
        const ListenerHandle Handle = ++m_lastHandle;
        m_listeners.push_back({Handle, std::move(Listener)});
        return Handle;
    }

    bool Remove(ListenerHandle Handle)
    {
        const auto It = std::find_if(m_listeners.begin(), m_listeners.end(), [Handle](const Entry& Item) {
            return Item.Handle == Handle;
        });
        if (It == m_listeners.end())
        {
            return false;
        }
        m_listeners.erase(It);
        return true;
    }

    void Clear()
    {
        m_listeners.clear();
    }

    bool Empty() const
    {
        return m_listeners.empty();
    }

    std::size_t Size() const
    {
        return m_listeners.size();
    }

    void Broadcast(Args... Values) const
    {
        if (m_listeners.empty())
        {
            return;
        }
        const auto Snapshot = m_listeners;
        for (const auto& Item : Snapshot)
        {
            Item.Listener(Values...);
        }
    }

private:
    struct Entry
    {
        ListenerHandle Handle = 0;
        Callback Listener;
    };

    std::vector<Entry> m_listeners{}; /**< @brief Listeners in subscription order. */
    ListenerHandle m_lastHandle = 0; /**< @brief Last handle issued. */
};

} // namespace SnAPI::StateSync
