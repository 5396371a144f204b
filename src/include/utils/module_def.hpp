#pragma once
/**
 * @file module_def.hpp
 * @brief Declares ModuleDef, the builder used to describe a lifecycle module.
 *
 * A module has a unique name, an optional list of modules it depends on, a
 * startup callback and a shutdown callback with a timeout. ModuleDef objects
 * are handed to the LifecycleManager (see lifecycle.hpp), which starts modules
 * in dependency order and shuts them down in reverse.
 */
#include "irbridge_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace irbridge::utils
{

class ModuleDefImpl;
class LifecycleManager;

using LifecycleCallback = void (*)(const char *arg);

class IRBRIDGE_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @brief Constructs a module definition.
     * @param name Unique, non-empty module name.
     * @throws std::invalid_argument if the name is empty.
     * @throws std::length_error if the name exceeds MAX_MODULE_NAME_LEN.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// Declares that this module must start after (and stop before) `dependency_name`.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback.
     * @param timeout If the callback has not returned after this long, the
     *        manager abandons it and continues with the next module.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

    [[nodiscard]] std::string_view name() const noexcept;

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace irbridge::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
