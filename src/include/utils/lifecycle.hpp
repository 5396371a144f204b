#pragma once
/**
 * @file lifecycle.hpp
 * @brief Ordered startup and shutdown of process-wide modules.
 *
 * Modules (the Logger, the ZeroMQ context, ...) are registered as ModuleDef
 * objects. `initialize()` runs their startup callbacks in topological order of
 * their dependencies; `finalize()` runs the shutdown callbacks in the exact
 * reverse order, each bounded by its own timeout.
 *
 * Typical use in main():
 * @code
 *     irbridge::utils::LifecycleGuard lifecycle(irbridge::utils::MakeModDefList(
 *         irbridge::utils::Logger::GetLifecycleModule(),
 *         irbridge::GetZMQContextModule()));
 * @endcode
 */
#include "irbridge_utils_export.h"
#include "utils/module_def.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace irbridge::utils
{

class LifecycleManagerImpl;

// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief Owns a set of modules and drives their startup and shutdown.
 *
 * The process uses the singleton from instance(); independent instances can
 * be constructed (tests do so).
 */
class IRBRIDGE_UTILS_EXPORT LifecycleManager
{
  public:
    LifecycleManager();
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

    static LifecycleManager &instance();

    /**
     * @brief Adds a module. Must be called before initialize().
     * @throws std::logic_error if called after initialize() or for a duplicate name.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts all registered modules in dependency order.
     * @throws std::runtime_error on an unknown dependency or a dependency cycle.
     *         If a startup callback throws, modules already started are shut
     *         down again and the exception is rethrown.
     */
    void initialize(std::source_location loc = std::source_location::current());

    /// Shuts down started modules in reverse startup order. Idempotent.
    void finalize(std::source_location loc = std::source_location::current());

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;

    /// Names of the started modules in the order they were started.
    [[nodiscard]] std::vector<std::string> startup_order() const;

  private:
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the process lifecycle.
 *
 * The first guard constructed registers its modules and initializes the
 * application; its destructor finalizes. Later guards are no-ops.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                RegisterModule(std::move(m));
            }
            InitializeApp(m_loc);
        }
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            FinalizeApp(m_loc);
        }
    }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace irbridge::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
