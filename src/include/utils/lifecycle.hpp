#pragma once
/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Dependency-ordered startup and shutdown of process-wide modules.
 *
 * `initialize()` starts every registered module after the modules it depends on;
 * `finalize()` stops them in the opposite order, giving each shutdown callback its own
 * deadline. Unknown dependencies, cycles and startup exceptions abort the process.
 *
 * ```cpp
 * servefleet::utils::LifecycleGuard lifecycle(servefleet::utils::MakeModDefList(
 *     servefleet::utils::Logger::GetLifecycleModule(), servefleet::ipc::GetZMQContextModule()));
 * ```
 ******************************************************************************/
#include "utils/module_def.hpp"

#include <memory>
#include <source_location>
#include <type_traits>
#include <vector>

namespace servefleet::utils
{

template <typename... Mods> std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList takes ModuleDef values");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(mods));
    (list.push_back(std::forward<Mods>(mods)), ...);
    return list;
}

class SERVEFLEET_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /// Registering once `initialize()` has run is fatal.
    void register_module(ModuleDef &&def);

    /// Both are idempotent.
    void initialize(std::source_location loc = std::source_location::current());
    void finalize(std::source_location loc = std::source_location::current());

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

inline void RegisterModule(ModuleDef &&def)
{
    LifecycleManager::instance().register_module(std::move(def));
}
inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}
inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}
inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}
inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

/**
 * @brief Scope owner of the process lifecycle.
 *
 * Only the first guard of a process registers its modules, initializes, and finalizes on
 * destruction. Later guards print a warning and do nothing.
 */
class SERVEFLEET_UTILS_EXPORT LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules = {},
                            std::source_location loc = std::source_location::current());
    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current());
    ~LifecycleGuard();

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;

  private:
    std::source_location m_loc;
    bool m_owner = false;
};

} // namespace servefleet::utils
