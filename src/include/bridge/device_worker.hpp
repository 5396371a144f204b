#pragma once
/**
 * @file device_worker.hpp
 * @brief One device's polling loop, outbound queue and lifecycle state.
 *
 * State machine:
 *
 *     Active --inactivate()--> Draining(n) --tick, n reaches 0--> Terminated
 *        ^                         |
 *        +-------activate()--------+
 *
 * The worker thread wakes once per poll interval. Each wake-up is one tick:
 * a Draining worker counts down, then (if still alive) performs a GET against
 * the device and publishes any new signal on the device's message topic.
 * Messages handed to post() are queued and sent by the same thread between
 * ticks, so callers never block on the device.
 *
 * Every GET and POST holds the worker's wire mutex: a poll and a post for
 * the same device never overlap on the wire.
 */
#include "bridge/bus_client.hpp"
#include "bridge/device_endpoint.hpp"
#include "bridge/recent_message_cache.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace irbridge::bridge
{

enum class DeviceState
{
    Active,
    Draining,
    Terminated
};

const char* to_string(DeviceState state) noexcept;

struct DeviceWorkerOptions
{
    std::chrono::milliseconds poll_interval{5000};
    int drain_ticks{60};
    std::chrono::milliseconds get_timeout{3000};
    std::chrono::milliseconds post_timeout{5000};
    std::size_t recent_cache_size{RecentMessageCache::kDefaultCapacity};
};

class DeviceWorkerListener
{
public:
    virtual ~DeviceWorkerListener() = default;

    /// Called once from the worker's own thread when its loop ends by draining.
    virtual void on_worker_finished(const std::string& name) = 0;
};

class DeviceWorker
{
public:
    DeviceWorker(std::string name, std::string message_topic,
                 std::unique_ptr<DeviceEndpoint> endpoint, BusClient& bus,
                 DeviceWorkerListener& listener, DeviceWorkerOptions options = {});

    /// Stops and joins the thread if it is still running.
    ~DeviceWorker();

    DeviceWorker(const DeviceWorker&) = delete;
    DeviceWorker& operator=(const DeviceWorker&) = delete;

    /// Launches the worker thread. Calling it twice is a no-op.
    void start();

    /**
     * @brief Ends the loop early and joins the thread. Thread-safe, idempotent.
     * A worker stopped this way does not report on_worker_finished().
     */
    void stop();

    /**
     * @brief Returns the worker to Active, cancelling a pending drain.
     * @return false if the worker has already terminated.
     */
    [[nodiscard]] bool activate();

    /// Starts the drain countdown (no-op once Terminated).
    void inactivate();

    /**
     * @brief Queues a message for transmission to the device.
     *
     * A message that matches an entry of the recent-message cache is consumed
     * from the cache and dropped: it is the bus echo of a signal this worker
     * just published. Successful POSTs are not cached, so repeated commands
     * all reach the device.
     */
    void post(const nlohmann::json& message);

    /**
     * @brief Sends every queued message, on the calling thread.
     * The worker thread calls this between ticks.
     */
    void flush_posts();

    /**
     * @brief Empties the queue without sending, logging how many were lost.
     * The worker thread calls this when its loop ends.
     * @return the number of messages dropped.
     */
    std::size_t discard_posts();

    /**
     * @brief Evaluates liveness for one tick.
     * Active stays alive; Draining decrements its counter and stays alive
     * while it is positive, otherwise becomes Terminated.
     * @return true while the worker should keep running.
     */
    bool check_in_service();

    /// One GET against the device and, for a new signal, one publication.
    void poll_once();

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const std::string& message_topic() const noexcept { return m_message_topic; }
    [[nodiscard]] DeviceState state() const;
    [[nodiscard]] int remaining_ticks() const;
    [[nodiscard]] std::size_t queued_posts() const;

private:
    void run();
    void send(const nlohmann::json& message);

    const std::string m_name;
    const std::string m_message_topic;
    const DeviceWorkerOptions m_options;
    std::unique_ptr<DeviceEndpoint> m_endpoint;
    BusClient& m_bus;
    DeviceWorkerListener& m_listener;
    RecentMessageCache m_recent;

    mutable std::mutex m_state_mutex;
    DeviceState m_state{DeviceState::Active};
    int m_remaining_ticks{0};

    std::mutex m_wire_mutex;

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_wakeup;
    std::deque<nlohmann::json> m_outbox;
    bool m_stop_requested{false};

    std::mutex m_thread_mutex;
    std::thread m_thread;
};

} // namespace irbridge::bridge
