#pragma once

/// @file system_scheduler.hpp
/// @brief Staged system scheduling with explicit ordering dependencies.
///
/// SystemScheduler manages system registration, stage grouping,
/// dependency-driven topological ordering within a stage, and runtime
/// enable/disable.  Execution is sequential: the AI tick loop is
/// cooperative and single-threaded, and same-stage ordering is what
/// lets a decision made by AISystem be visible to movement in the
/// same frame.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "npc/foundation/npc_result.hpp"

namespace npc::ecs {

/// Integer type used to identify system types at runtime.
using SystemTypeId = uint32_t;

constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Obtain the unique SystemTypeId for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

/// Execution stage for a system: PreUpdate -> Update -> PostUpdate.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Sensing, turn bookkeeping
    Update,      ///< Decisions (AI) and their resolution (movement)
    PostUpdate   ///< Cleanup, diagnostics
};

/// Abstract base class for ECS systems.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Run this system for one frame.
    ///
    /// @param deltaTime  Frame delta time in milliseconds.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

/// Registers systems, orders them and runs them stage by stage.
///
/// Systems are grouped by stage and topologically sorted within each
/// stage according to explicit dependencies.  Systems without a
/// dependency between them keep registration order.
class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    /// Register a system of type `T`, constructing it in-place.
    ///
    /// Re-registering the same type returns the existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    [[nodiscard]] std::size_t SystemCount() const noexcept { return systems_.size(); }

    /// Declare that `before` must execute before `after`.
    ///
    /// @return false if either system is not registered or they belong
    ///         to different stages.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    template <typename Before, typename After>
    bool AddDependency() {
        return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
    }

    /// Disabled systems are skipped without changing the plan.
    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled) {
        SetEnabled(SystemType<T>::Id(), enabled);
    }

    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    /// Build the execution plan (topological sort per stage).
    ///
    /// @return CircularDependency error naming the systems in the cycle.
    foundation::NpcResult<void> Build();

    /// Execute all enabled systems in stage order.
    ///
    /// Builds the plan first if registrations changed since the last
    /// Build(); an unbuildable plan runs nothing and is logged.
    void Execute(float deltaTime);

    template <typename T>
    [[nodiscard]] T* GetSystem();

    /// Execution order for a stage (after Build).
    [[nodiscard]] const std::vector<SystemTypeId>& GetExecutionOrder(SystemStage stage) const;

private:
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemTypeId typeId = kInvalidSystemTypeId;
        SystemStage stage = SystemStage::Update;
        bool enabled = true;
    };

    /// Kahn's algorithm over one stage; false on a cycle.
    [[nodiscard]] bool topologicalSort(const std::vector<SystemTypeId>& ids,
                                       std::vector<SystemTypeId>& sorted,
                                       std::string& error) const;

    std::unordered_map<SystemTypeId, SystemEntry> systems_;

    /// Systems grouped by stage (registration order within stage).
    std::unordered_map<SystemStage, std::vector<SystemTypeId>> stageGroups_;

    /// dependencies_[A] contains all B where A runs before B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> dependencies_;

    /// reverseDeps_[B] contains all A where A runs before B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> reverseDeps_;

    std::unordered_map<SystemStage, std::vector<SystemTypeId>> executionOrder_;

    bool built_ = false;

    static const std::vector<SystemTypeId> kEmptyOrder_;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>, "T must derive from ISystem");

    const auto typeId = SystemType<T>::Id();

    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T&>(*it->second.instance);
    }

    auto system = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *system;

    SystemEntry entry;
    entry.instance = std::move(system);
    entry.typeId = typeId;
    entry.stage = ref.GetStage();

    stageGroups_[entry.stage].push_back(typeId);
    systems_.emplace(typeId, std::move(entry));

    built_ = false;
    return ref;
}

template <typename T>
T* SystemScheduler::GetSystem() {
    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T*>(it->second.instance.get());
    }
    return nullptr;
}

} // namespace npc::ecs
