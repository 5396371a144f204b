#pragma once
/**
 * @file bridge_test_doubles.h
 * @brief Test doubles for the bridge's collaborators: bus, device endpoint,
 *        endpoint factory and discovery source.
 *
 * RecordingBusClient and FakeDeviceEndpoint are called from worker threads,
 * so they record under a mutex and offer wait_for_* helpers with a timeout.
 * MockBusClient is for single-threaded tests with exact expectations.
 */
#include "bridge/bus_client.hpp"
#include "bridge/device_endpoint.hpp"
#include "bridge/device_worker.hpp"
#include "bridge/discovery_source.hpp"

#include "gmock/gmock.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace irbridge::tests
{

using namespace std::chrono_literals;
using bridge::DeviceIoError;
using bridge::DeviceIoResult;

inline constexpr auto kWaitTimeout = 3s;

// ============================================================================
// Bus
// ============================================================================

class MockBusClient : public bridge::BusClient
{
  public:
    MOCK_METHOD(void, start, (bridge::BusListener & listener), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, publish, (const std::string &topic, const std::string &payload), (override));
    MOCK_METHOD(void, subscribe, (const std::string &topic), (override));
    MOCK_METHOD(void, unsubscribe, (const std::string &topic), (override));
};

struct Publication
{
    std::string topic;
    std::string payload;
};

class RecordingBusClient : public bridge::BusClient
{
  public:
    void start(bridge::BusListener &listener) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = &listener;
        ++starts_;
    }

    void stop() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = nullptr;
        ++stops_;
    }

    void publish(const std::string &topic, const std::string &payload) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            publications_.push_back({topic, payload});
        }
        cv_.notify_all();
    }

    void subscribe(const std::string &topic) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribed_.insert(topic);
        ++subscribe_calls_[topic];
    }

    void unsubscribe(const std::string &topic) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribed_.erase(topic);
        ++unsubscribe_calls_[topic];
    }

    std::vector<Publication> publications() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return publications_;
    }

    std::vector<Publication> publications_on(const std::string &topic) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Publication> out;
        for (const auto &p : publications_)
        {
            if (p.topic == topic)
                out.push_back(p);
        }
        return out;
    }

    bool wait_for_publications(std::size_t count, std::chrono::milliseconds timeout = kWaitTimeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return publications_.size() >= count; });
    }

    std::set<std::string> subscribed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribed_;
    }

    int subscribe_calls(const std::string &topic) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribe_calls_.find(topic);
        return it == subscribe_calls_.end() ? 0 : it->second;
    }

    int unsubscribe_calls(const std::string &topic) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = unsubscribe_calls_.find(topic);
        return it == unsubscribe_calls_.end() ? 0 : it->second;
    }

    bridge::BusListener *listener() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return listener_;
    }

    int starts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return starts_;
    }

    int stops() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stops_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Publication> publications_;
    std::set<std::string> subscribed_;
    std::map<std::string, int> subscribe_calls_;
    std::map<std::string, int> unsubscribe_calls_;
    bridge::BusListener *listener_{nullptr};
    int starts_{0};
    int stops_{0};
};

// ============================================================================
// Device endpoint
// ============================================================================

/// State shared between a FakeDeviceEndpoint and the test that scripted it.
class FakeDeviceState
{
  public:
    /// Queues the body of a future GET. When the script is empty GET returns "".
    void script_get(std::string body)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        get_script_.push_back(DeviceIoResult::ok(std::move(body)));
    }

    void script_get_error(DeviceIoError err, int code = 0)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        get_script_.push_back(DeviceIoResult::error(err, code));
    }

    /// Makes every following POST fail with ConnectionFailed, or succeed again.
    void fail_posts(bool fail)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_posts_ = fail;
    }

    /// Every GET and POST sleeps this long, outside the state mutex.
    void set_call_delay(std::chrono::milliseconds delay)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call_delay_ = delay;
    }

    DeviceIoResult next_get()
    {
        enter_call();
        DeviceIoResult r = DeviceIoResult::ok(std::string{});
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++gets_;
            if (!get_script_.empty())
            {
                r = std::move(get_script_.front());
                get_script_.pop_front();
            }
        }
        leave_call();
        return r;
    }

    DeviceIoResult record_post(const std::string &body)
    {
        enter_call();
        DeviceIoResult r;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            posts_.push_back(body);
            r = fail_posts_ ? DeviceIoResult::error(DeviceIoError::ConnectionFailed, 111)
                            : DeviceIoResult::ok(std::string{});
        }
        leave_call();
        cv_.notify_all();
        return r;
    }

    /// Highest number of GET/POST calls that were ever in progress at once.
    int max_in_flight() const { return max_in_flight_.load(); }

    std::vector<std::string> posts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return posts_;
    }

    int gets() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return gets_;
    }

    bool wait_for_posts(std::size_t count, std::chrono::milliseconds timeout = kWaitTimeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return posts_.size() >= count; });
    }

    std::string address;
    std::uint16_t port{0};

  private:
    void enter_call()
    {
        const int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now))
        {
        }
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay = call_delay_;
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
    }

    void leave_call() { --in_flight_; }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DeviceIoResult> get_script_;
    std::vector<std::string> posts_;
    int gets_{0};
    bool fail_posts_{false};
    std::chrono::milliseconds call_delay_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

class FakeDeviceEndpoint : public bridge::DeviceEndpoint
{
  public:
    explicit FakeDeviceEndpoint(std::shared_ptr<FakeDeviceState> state) : state_(std::move(state))
    {
    }

    DeviceIoResult get_messages(std::chrono::milliseconds /*timeout*/) override
    {
        return state_->next_get();
    }

    DeviceIoResult post_messages(const std::string &body,
                                 std::chrono::milliseconds /*timeout*/) override
    {
        return state_->record_post(body);
    }

    std::string describe() const override
    {
        return state_->address + ":" + std::to_string(state_->port);
    }

  private:
    std::shared_ptr<FakeDeviceState> state_;
};

class FakeEndpointFactory : public bridge::DeviceEndpointFactory
{
  public:
    std::unique_ptr<bridge::DeviceEndpoint> create(const std::string &address,
                                                   std::uint16_t port) override
    {
        auto state = std::make_shared<FakeDeviceState>();
        state->address = address;
        state->port = port;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            created_.push_back(state);
        }
        return std::make_unique<FakeDeviceEndpoint>(state);
    }

    std::size_t created() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.size();
    }

    /// State of the n-th endpoint created (0-based).
    std::shared_ptr<FakeDeviceState> state(std::size_t n) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return n < created_.size() ? created_[n] : nullptr;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakeDeviceState>> created_;
};

// ============================================================================
// Worker listener and discovery
// ============================================================================

class RecordingWorkerListener : public bridge::DeviceWorkerListener
{
  public:
    void on_worker_finished(const std::string &name) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(name);
        }
        cv_.notify_all();
    }

    std::vector<std::string> finished() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    bool wait_for_finished(std::size_t count, std::chrono::milliseconds timeout = kWaitTimeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return finished_.size() >= count; });
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> finished_;
};

class FakeDiscoverySource : public bridge::DiscoverySource
{
  public:
    void start(bridge::DiscoveryListener &listener) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = &listener;
    }

    void stop() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = nullptr;
        stopped_ = true;
    }

    bridge::DiscoveryListener *listener() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return listener_;
    }

    bool stopped() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

  private:
    mutable std::mutex mutex_;
    bridge::DiscoveryListener *listener_{nullptr};
    bool stopped_{false};
};

/// Polls `pred` until it holds or `timeout` elapses.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = kWaitTimeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace irbridge::tests
