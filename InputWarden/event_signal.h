#pragma once
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

// Subscriber list for one notification kind.
// Handlers are invoked in subscription order, outside the internal lock,
// on the thread that calls Emit().
template <typename... Args>
class Signal
{
public:
    using Handler = std::function<void(Args...)>;

    int Connect(Handler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        int id = m_nextId++;
        m_handlers.emplace_back(id, std::move(handler));
        return id;
    }

    void Disconnect(int id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_handlers.begin(); it != m_handlers.end(); ++it)
        {
            if (it->first == id) { m_handlers.erase(it); return; }
        }
    }

    void Emit(Args... args) const
    {
        std::vector<std::pair<int, Handler>> copy;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_handlers.empty()) return;
            copy = m_handlers;
        }
        for (const auto& h : copy)
            h.second(args...);
    }

    size_t Count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_handlers.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<int, Handler>> m_handlers;
    int m_nextId = 1;
};
