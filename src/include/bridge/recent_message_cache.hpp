#pragma once
/**
 * @file recent_message_cache.hpp
 * @brief Bounded per-device memory of recently relayed messages.
 */
#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <mutex>

namespace irbridge::bridge
{

/**
 * @class RecentMessageCache
 * @brief FIFO of at most capacity() payloads with a consume-on-hit lookup.
 *
 * put() appends and evicts the oldest entry once the capacity is exceeded.
 * has() removes the first structurally equal entry and reports whether it
 * found one, so a payload put once passes the gate exactly once.
 *
 * All members are thread-safe.
 */
class RecentMessageCache
{
public:
    static constexpr std::size_t kDefaultCapacity = 5;

    explicit RecentMessageCache(std::size_t capacity = kDefaultCapacity);

    void put(nlohmann::json item);

    /// Finds and removes the first entry equal to `item`.
    [[nodiscard]] bool has(const nlohmann::json& item);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::deque<nlohmann::json> m_items;
};

} // namespace irbridge::bridge
