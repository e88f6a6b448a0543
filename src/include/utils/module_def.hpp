#pragma once
#include "servefleet_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace servefleet::utils
{

class LifecycleManager;
struct ModuleSpec;

/// Plain C callback so module tables can be built in one shared object and run in another.
/// `arg` is the string given at registration, or "" when none was given.
using LifecycleCallback = void (*)(const char *arg);

/**
 * @brief Describes one lifecycle module: its name, the modules it needs started first, and
 *        its startup and shutdown callbacks.
 *
 * Move-only. Registering it hands its contents to the LifecycleManager.
 */
class SERVEFLEET_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr std::size_t MAX_MODULE_NAME_LEN = 256;

    /// @throws std::invalid_argument on an empty name, std::length_error on an overlong one.
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();
    ModuleDef(ModuleDef &&) noexcept;
    ModuleDef &operator=(ModuleDef &&) noexcept;

    /// Empty names are ignored.
    void add_dependency(std::string_view name);

    void set_startup(LifecycleCallback fn, std::string_view arg = {});

    /// A zero `timeout` waits for the callback indefinitely.
    void set_shutdown(LifecycleCallback fn, std::chrono::milliseconds timeout,
                      std::string_view arg = {});

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleSpec> m_spec;
};

} // namespace servefleet::utils
