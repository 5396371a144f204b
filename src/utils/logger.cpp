/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"
#include "utils/logger_sinks/syslog_sink.hpp"

#include <sys/syscall.h>
#include <unistd.h>

namespace irbridge::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

namespace
{
uint64_t current_thread_id() noexcept
{
    return static_cast<uint64_t>(::syscall(SYS_gettid));
}

constexpr std::chrono::milliseconds kLoggerShutdownTimeoutMs{5000};
} // namespace

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

namespace
{
void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &)
    {
        // already satisfied
    }
}
} // namespace

struct Logger::Impl
{
    Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void handle_command(LogMessage &msg);
    void handle_command(SetSinkCommand &cmd);
    void handle_command(FlushCommand &cmd);
    void handle_command(SetErrorCallbackCommand &cmd);
    void report_write_error(const std::string &what);
    bool install_sink(std::unique_ptr<Sink> sink);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

void Logger::Impl::start_worker()
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!worker_thread_.joinable())
    {
        shutdown_requested_.store(false, std::memory_order_release);
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire) || !worker_thread_.joinable())
        {
            reject_command(cmd);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_write_error(const std::string &what)
{
    if (error_callback_)
    {
        error_callback_(what);
    }
    else
    {
        fmt::print(stderr, "[LOGGER] sink write failed: {}\n", what);
    }
}

void Logger::Impl::handle_command(LogMessage &msg)
{
    try
    {
        sink_->write(msg);
    }
    catch (const std::exception &e)
    {
        report_write_error(e.what());
    }
}

void Logger::Impl::handle_command(SetSinkCommand &cmd)
{
    try
    {
        sink_->flush();
    }
    catch (const std::exception &e)
    {
        report_write_error(e.what());
    }
    sink_ = std::move(cmd.new_sink);
    promise_set_safe(cmd.promise, true);
}

void Logger::Impl::handle_command(FlushCommand &cmd)
{
    try
    {
        sink_->flush();
    }
    catch (const std::exception &e)
    {
        report_write_error(e.what());
    }
    promise_set_safe(cmd.promise, true);
}

void Logger::Impl::handle_command(SetErrorCallbackCommand &cmd)
{
    error_callback_ = std::move(cmd.callback);
    promise_set_safe(cmd.promise, true);
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load();
        }

        for (auto &cmd : local_queue)
        {
            std::visit([this](auto &arg) { handle_command(arg); }, cmd);
        }
        local_queue.clear();

        if (stopping)
        {
            break;
        }
    }

    try
    {
        sink_->flush();
    }
    catch (const std::exception &e)
    {
        report_write_error(e.what());
    }
}

bool Logger::Impl::install_sink(std::unique_ptr<Sink> sink)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    static_cast<void>(enqueue_command(SetSinkCommand{std::move(sink), promise}));
    return future.get();
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    pImpl->shutdown();
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    const auto lower = format_tools::to_lower(format_tools::trim(name));
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warn" || lower == "warning")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        LogMessage msg{std::chrono::system_clock::now(), current_thread_id(),
                       static_cast<int>(lvl), std::move(body)};
        static_cast<void>(pImpl->enqueue_command(std::move(msg)));
    }
    catch (const std::bad_alloc &)
    {
        // nothing sensible can be done when the queue cannot grow
    }
}


bool Logger::set_console()
{
    return pImpl->install_sink(std::make_unique<ConsoleSink>());
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::runtime_error &e)
    {
        LOGGER_ERROR("Logger: {}", e.what());
        return false;
    }
    return pImpl->install_sink(std::move(sink));
}

bool Logger::set_syslog(const char *ident, int option, int facility)
{
    return pImpl->install_sink(std::make_unique<SyslogSink>(ident, option, facility));
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    static_cast<void>(pImpl->enqueue_command(FlushCommand{promise}));
    static_cast<void>(future.get());
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    static_cast<void>(pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise}));
    static_cast<void>(future.get());
}

// ============================================================================
// Lifecycle
// ============================================================================

void do_logger_startup(const char * /*arg*/)
{
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char * /*arg*/)
{
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("irbridge::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, kLoggerShutdownTimeoutMs);
    return module;
}

} // namespace irbridge::utils
