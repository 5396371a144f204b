#include "bridge/recent_message_cache.hpp"

#include <algorithm>
#include <stdexcept>

namespace irbridge::bridge
{

RecentMessageCache::RecentMessageCache(std::size_t capacity) : m_capacity(capacity)
{
    if (m_capacity == 0)
    {
        throw std::invalid_argument("RecentMessageCache: capacity must be positive");
    }
}

void RecentMessageCache::put(nlohmann::json item)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_items.push_back(std::move(item));
    if (m_items.size() > m_capacity)
    {
        m_items.pop_front();
    }
}

bool RecentMessageCache::has(const nlohmann::json& item)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find(m_items.begin(), m_items.end(), item);
    if (it == m_items.end())
    {
        return false;
    }
    m_items.erase(it);
    return true;
}

std::size_t RecentMessageCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
}

} // namespace irbridge::bridge
