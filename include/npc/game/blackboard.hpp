#pragma once

/// @file blackboard.hpp
/// @brief Per-entity key/value scratch store for behavior tree nodes.

#include "npc/ecs/entity.hpp"
#include "npc/game/grid_types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace npc::game {

class MemorySystem;

/// The closed set of value kinds a blackboard may hold.
///
/// `MemorySystem*` is a non-owning reference to the owning entity's
/// memory, injected by AISystem under bbkeys::kMemorySystem.
using BlackboardValue = std::variant<bool,
                                     int32_t,
                                     double,
                                     GridPosition,
                                     ecs::Entity,
                                     Path,
                                     PositionList,
                                     MemorySystem*>;

namespace detail {

template <typename T, typename Variant>
struct IsVariantMember;

template <typename T, typename... Ts>
struct IsVariantMember<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

}  // namespace detail

/// True when T is one of the permitted blackboard value kinds.
template <typename T>
inline constexpr bool kIsBlackboardValue = detail::IsVariantMember<T, BlackboardValue>::value;

/// Key-value store shared by the nodes of one tree.
///
/// Each BehaviorTree owns exactly one Blackboard bound to its entity.
/// A missing key is an ordinary state: getters return nullptr or the
/// supplied default and never raise.
class Blackboard {
public:
    explicit Blackboard(ecs::Entity owner = ecs::Entity::invalid()) : owner_(owner) {}

    /// The entity this blackboard belongs to.
    [[nodiscard]] ecs::Entity GetEntity() const noexcept { return owner_; }

    /// Store a value under the given key (overwrites any existing value).
    template <typename T>
    void Set(std::string_view key, T value) {
        static_assert(kIsBlackboardValue<T>, "type is not a permitted blackboard value kind");
        SetValue(key, BlackboardValue(std::in_place_type<T>, std::move(value)));
    }

    void SetValue(std::string_view key, BlackboardValue value) {
        auto it = data_.find(key);
        if (it == data_.end()) {
            data_.emplace(std::string(key), std::move(value));
        } else {
            it->second = std::move(value);
        }
    }

    /// Mutable pointer to the stored value, or nullptr if the key is
    /// absent or holds another kind.
    template <typename T>
    T* Get(std::string_view key) {
        static_assert(kIsBlackboardValue<T>, "type is not a permitted blackboard value kind");
        auto it = data_.find(key);
        if (it == data_.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    template <typename T>
    const T* Get(std::string_view key) const {
        static_assert(kIsBlackboardValue<T>, "type is not a permitted blackboard value kind");
        auto it = data_.find(key);
        if (it == data_.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    /// Raw stored value of any kind, or nullptr.
    [[nodiscard]] const BlackboardValue* Find(std::string_view key) const {
        auto it = data_.find(key);
        return it == data_.end() ? nullptr : &it->second;
    }

    /// Stored value, or @p fallback when absent or of another kind.
    template <typename T>
    T GetOrDefault(std::string_view key, T fallback) const {
        const T* value = Get<T>(key);
        return value ? *value : fallback;
    }

    [[nodiscard]] bool Has(std::string_view key) const { return data_.find(key) != data_.end(); }

    /// Remove a single entry.  @return false if the key was absent.
    bool Erase(std::string_view key) {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return false;
        }
        data_.erase(it);
        return true;
    }

    void Clear() { data_.clear(); }

    [[nodiscard]] std::size_t Size() const noexcept { return data_.size(); }

    /// All keys in lexicographic order.
    [[nodiscard]] std::vector<std::string> Keys() const {
        std::vector<std::string> keys;
        keys.reserve(data_.size());
        for (const auto& [key, _] : data_) {
            keys.push_back(key);
        }
        return keys;
    }

    /// True when @p key holds a value equal (same kind, same value) to
    /// @p expected.  False for a missing key.
    [[nodiscard]] bool IsConditionMet(std::string_view key, const BlackboardValue& expected) const {
        const auto* actual = Find(key);
        return actual != nullptr && *actual == expected;
    }

private:
    ecs::Entity owner_;
    std::map<std::string, BlackboardValue, std::less<>> data_;
};

}  // namespace npc::game
