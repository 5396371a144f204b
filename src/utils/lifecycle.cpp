/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of ModuleDef and LifecycleManager.
 *
 * The manager keeps its module graph in the pimpl. Diagnostics are written
 * straight to stderr: the Logger is itself a lifecycle module and may not be
 * running while modules are being started or stopped.
 ******************************************************************************/
#include "utils/lifecycle.hpp"
#include "utils/format_tools.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>

namespace irbridge::utils
{

namespace
{

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

// Runs `func` on a helper thread and waits at most `timeout` for it. A callback
// that overruns is detached and reported as timed out.
ShutdownOutcome timedShutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    auto completed = std::make_shared<std::atomic<bool>>(false);
    auto ex_ptr = std::make_shared<std::exception_ptr>();
    std::thread thread(
        [func, completed, ex_ptr]()
        {
            try
            {
                func();
            }
            catch (...)
            {
                *ex_ptr = std::current_exception();
            }
            completed->store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!completed->load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }

    thread.join();

    if (*ex_ptr)
    {
        try
        {
            std::rethrow_exception(*ex_ptr);
        }
        catch (const std::exception &e)
        {
            return {false, false, e.what()};
        }
        catch (...)
        {
            return {false, false, "unknown exception"};
        }
    }
    return {true, false, {}};
}

void validate_module_name(std::string_view name, const char *what)
{
    if (name.empty())
    {
        throw std::invalid_argument(fmt::format("Lifecycle: {} must not be empty.", what));
    }
    if (name.size() > ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("Lifecycle: {} exceeds maximum length.", what));
    }
}

} // namespace

// ============================================================================
// ModuleDef
// ============================================================================

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup{nullptr};
    std::string startup_arg;
    LifecycleCallback shutdown{nullptr};
    std::chrono::milliseconds shutdown_timeout{0};
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    validate_module_name(dependency_name, "dependency name");
    pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->startup = startup_func;
    pImpl->startup_arg.clear();
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    pImpl->startup = startup_func;
    pImpl->startup_arg = std::string(arg);
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    pImpl->shutdown = shutdown_func;
    pImpl->shutdown_timeout = timeout;
}

std::string_view ModuleDef::name() const noexcept
{
    return pImpl ? std::string_view(pImpl->name) : std::string_view{};
}

// ============================================================================
// LifecycleManager
// ============================================================================

class LifecycleManagerImpl
{
  public:
    std::vector<ModuleDefImpl> topological_order() const;
    void shutdown_started(std::size_t count);

    mutable std::mutex m_mutex;
    std::vector<ModuleDefImpl> m_modules;
    std::vector<ModuleDefImpl> m_started;
    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_finalized{false};
};

// Kahn's algorithm. Among modules whose dependencies are satisfied, the one
// registered first goes first, so the order is deterministic.
std::vector<ModuleDefImpl> LifecycleManagerImpl::topological_order() const
{
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < m_modules.size(); ++i)
    {
        index.emplace(m_modules[i].name, i);
    }

    std::vector<std::size_t> remaining_deps(m_modules.size(), 0);
    std::vector<std::vector<std::size_t>> dependents(m_modules.size());
    for (std::size_t i = 0; i < m_modules.size(); ++i)
    {
        for (const auto &dep : m_modules[i].dependencies)
        {
            auto it = index.find(dep);
            if (it == index.end())
            {
                throw std::runtime_error(fmt::format(
                    "Lifecycle: module '{}' depends on unknown module '{}'.", m_modules[i].name, dep));
            }
            ++remaining_deps[i];
            dependents[it->second].push_back(i);
        }
    }

    std::vector<ModuleDefImpl> ordered;
    std::vector<bool> emitted(m_modules.size(), false);
    while (ordered.size() < m_modules.size())
    {
        bool progressed = false;
        for (std::size_t i = 0; i < m_modules.size(); ++i)
        {
            if (emitted[i] || remaining_deps[i] != 0)
            {
                continue;
            }
            emitted[i] = true;
            ordered.push_back(m_modules[i]);
            for (auto d : dependents[i])
            {
                --remaining_deps[d];
            }
            progressed = true;
            break;
        }
        if (!progressed)
        {
            throw std::runtime_error("Lifecycle: dependency cycle detected among modules.");
        }
    }
    return ordered;
}

void LifecycleManagerImpl::shutdown_started(std::size_t count)
{
    for (std::size_t n = count; n > 0; --n)
    {
        const auto &mod = m_started[n - 1];
        if (mod.shutdown == nullptr)
        {
            continue;
        }
        const auto callback = mod.shutdown;
        auto outcome = timedShutdown([callback]() { callback(nullptr); }, mod.shutdown_timeout);
        if (outcome.timed_out)
        {
            fmt::print(stderr, "[IRB_LifeCycle] Module '{}' did not shut down within {} ms.\n",
                       mod.name, mod.shutdown_timeout.count());
        }
        else if (!outcome.success)
        {
            fmt::print(stderr, "[IRB_LifeCycle] Module '{}' shutdown threw: {}\n", mod.name,
                       outcome.exception_msg);
        }
    }
    m_started.clear();
}

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}

LifecycleManager::~LifecycleManager()
{
    finalize();
}

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    if (pImpl->m_initialized.load(std::memory_order_acquire))
    {
        throw std::logic_error("Lifecycle: cannot register a module after initialization.");
    }
    auto &def = *module_def.pImpl;
    const bool duplicate =
        std::any_of(pImpl->m_modules.begin(), pImpl->m_modules.end(),
                    [&def](const ModuleDefImpl &m) { return m.name == def.name; });
    if (duplicate)
    {
        throw std::logic_error(fmt::format("Lifecycle: module '{}' already registered.", def.name));
    }
    pImpl->m_modules.push_back(std::move(def));
}

void LifecycleManager::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    if (pImpl->m_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    std::vector<ModuleDefImpl> ordered;
    try
    {
        ordered = pImpl->topological_order();
    }
    catch (const std::runtime_error &)
    {
        pImpl->m_initialized.store(false, std::memory_order_release);
        throw;
    }

    for (auto &mod : ordered)
    {
        try
        {
            if (mod.startup != nullptr)
            {
                mod.startup(mod.startup_arg.empty() ? nullptr : mod.startup_arg.c_str());
            }
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[IRB_LifeCycle] Startup of '{}' failed: {} ({}:{})\n", mod.name,
                       e.what(), format_tools::filename_only(loc.file_name()), loc.line());
            pImpl->shutdown_started(pImpl->m_started.size());
            pImpl->m_initialized.store(false, std::memory_order_release);
            throw;
        }
        pImpl->m_started.push_back(std::move(mod));
    }
}

void LifecycleManager::finalize(std::source_location /*loc*/)
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    if (!pImpl->m_initialized.load(std::memory_order_acquire) ||
        pImpl->m_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    pImpl->shutdown_started(pImpl->m_started.size());
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->m_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->m_finalized.load(std::memory_order_acquire);
}

std::vector<std::string> LifecycleManager::startup_order() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    std::vector<std::string> names;
    names.reserve(pImpl->m_started.size());
    for (const auto &m : pImpl->m_started)
    {
        names.push_back(m.name);
    }
    return names;
}

} // namespace irbridge::utils
