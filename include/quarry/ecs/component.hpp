#pragma once

/// @file component.hpp
/// @brief Component types and type-erased column storage for quarry_ecs
///
/// Components are stored as type-erased bytes with metadata for size,
/// alignment, relocation and destruction. Every row also carries the
/// ComponentTicks used by change detection.

#include "fwd.hpp"
#include "tick.hpp"
#include <concepts>
#include <vector>
#include <string>
#include <typeinfo>
#include <typeindex>
#include <unordered_map>
#include <memory>
#include <new>
#include <cstddef>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

namespace quarry_ecs {

// =============================================================================
// StorageType
// =============================================================================

/// Where a component type lives
enum class StorageType : std::uint8_t {
    Table,      ///< Dense column in the entity's table (default)
    SparseSet,  ///< Per-component sparse set keyed by entity index
};

/// Storage type declared by `T`, e.g.
/// `static constexpr StorageType storage_type = StorageType::SparseSet;`
template<typename T>
[[nodiscard]] constexpr StorageType storage_type_of() noexcept {
    if constexpr (requires { { T::storage_type } -> std::convertible_to<StorageType>; }) {
        return T::storage_type;
    } else {
        return StorageType::Table;
    }
}

/// Concept for valid component types
template<typename T>
concept Component = std::is_object_v<T> && !std::is_pointer_v<T> && !std::is_const_v<T>
    && std::is_move_constructible_v<T> && std::is_destructible_v<T>;

// =============================================================================
// ComponentId
// =============================================================================

/// Unique identifier for a component type
struct ComponentId {
    std::uint32_t id;

    static constexpr std::uint32_t INVALID_ID = std::numeric_limits<std::uint32_t>::max();

    constexpr explicit ComponentId(std::uint32_t i = INVALID_ID) noexcept : id(i) {}

    [[nodiscard]] constexpr std::uint32_t value() const noexcept { return id; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != INVALID_ID; }

    [[nodiscard]] constexpr bool operator==(const ComponentId& other) const noexcept { return id == other.id; }
    [[nodiscard]] constexpr bool operator!=(const ComponentId& other) const noexcept { return id != other.id; }
    [[nodiscard]] constexpr bool operator<(const ComponentId& other) const noexcept { return id < other.id; }
};

} // namespace quarry_ecs

template<>
struct std::hash<quarry_ecs::ComponentId> {
    [[nodiscard]] std::size_t operator()(const quarry_ecs::ComponentId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.id);
    }
};

namespace quarry_ecs {

// =============================================================================
// ComponentInfo
// =============================================================================

/// Metadata for a component type
struct ComponentInfo {
    using DropFn = void (*)(void*);
    using MoveFn = void (*)(void* src, void* dst);

    ComponentId id{ComponentId::INVALID_ID};
    std::string name;
    std::size_t size{0};
    std::size_t align{0};
    std::type_index type_id{typeid(void)};
    StorageType storage{StorageType::Table};

    /// Destroy the component at the given address
    DropFn drop_fn{nullptr};

    /// Move-construct a component at dst from src; src stays alive
    MoveFn move_fn{nullptr};

    template<typename T>
    [[nodiscard]] static ComponentInfo of() {
        ComponentInfo info;
        info.name = typeid(T).name();
        info.size = sizeof(T);
        info.align = alignof(T);
        info.type_id = std::type_index(typeid(T));
        info.storage = storage_type_of<T>();
        info.drop_fn = [](void* ptr) {
            static_cast<T*>(ptr)->~T();
        };
        info.move_fn = [](void* src, void* dst) {
            ::new (dst) T(std::move(*static_cast<T*>(src)));
        };
        return info;
    }
};

// =============================================================================
// ComponentRegistry
// =============================================================================

/// Maps C++ types to component ids and metadata
class ComponentRegistry {
public:
    using size_type = std::size_t;

private:
    std::vector<ComponentInfo> components_;
    std::unordered_map<std::type_index, ComponentId> type_map_;

public:
    /// Register a component type
    /// @return Component ID (existing ID if already registered)
    template<Component T>
    ComponentId register_component() {
        std::type_index type_idx = std::type_index(typeid(T));

        auto it = type_map_.find(type_idx);
        if (it != type_map_.end()) {
            return it->second;
        }

        ComponentInfo info = ComponentInfo::of<T>();
        ComponentId id{static_cast<std::uint32_t>(components_.size())};
        info.id = id;
        type_map_.emplace(type_idx, id);
        components_.push_back(std::move(info));
        return id;
    }

    template<typename T>
    [[nodiscard]] std::optional<ComponentId> get_id() const {
        auto it = type_map_.find(std::type_index(typeid(T)));
        if (it != type_map_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] const ComponentInfo* get_info(ComponentId id) const noexcept {
        if (id.id >= components_.size()) {
            return nullptr;
        }
        return &components_[id.id];
    }

    /// Name of a component, or "<unknown>"
    [[nodiscard]] std::string name_of(ComponentId id) const {
        const ComponentInfo* info = get_info(id);
        return info ? info->name : std::string("<unknown>");
    }

    [[nodiscard]] size_type size() const noexcept { return components_.size(); }

    [[nodiscard]] auto begin() const noexcept { return components_.begin(); }
    [[nodiscard]] auto end() const noexcept { return components_.end(); }
};

// =============================================================================
// ComponentStorage
// =============================================================================

/// Type-erased column of one component type plus per-row ticks.
///
/// Rows are relocated with the type's move constructor, never memcpy, so
/// types that point into themselves stay valid across growth and removal.
class ComponentStorage {
public:
    using size_type = std::size_t;

private:
    ComponentInfo info_;
    std::byte* data_{nullptr};
    size_type len_{0};
    size_type capacity_{0};
    std::vector<ComponentTicks> ticks_;

    [[nodiscard]] std::byte* slot(size_type row) const noexcept {
        return data_ + row * info_.size;
    }

    [[nodiscard]] static std::byte* allocate(const ComponentInfo& info, size_type count) {
        if (count == 0) return nullptr;
        return static_cast<std::byte*>(::operator new(count * info.size, std::align_val_t{info.align}));
    }

    static void deallocate(const ComponentInfo& info, std::byte* ptr) noexcept {
        if (ptr) {
            ::operator delete(ptr, std::align_val_t{info.align});
        }
    }

    void grow_to(size_type new_capacity) {
        std::byte* fresh = allocate(info_, new_capacity);
        for (size_type i = 0; i < len_; ++i) {
            void* src = slot(i);
            info_.move_fn(src, fresh + i * info_.size);
            info_.drop_fn(src);
        }
        deallocate(info_, data_);
        data_ = fresh;
        capacity_ = new_capacity;
    }

    /// Reserve the next row's memory; the caller constructs into it
    [[nodiscard]] void* push_uninit() {
        if (len_ == capacity_) {
            grow_to(capacity_ == 0 ? 4 : capacity_ * 2);
        }
        return slot(len_);
    }

public:
    explicit ComponentStorage(ComponentInfo info)
        : info_(std::move(info)) {}

    ~ComponentStorage() {
        clear();
        deallocate(info_, data_);
    }

    ComponentStorage(const ComponentStorage&) = delete;
    ComponentStorage& operator=(const ComponentStorage&) = delete;

    ComponentStorage(ComponentStorage&& other) noexcept
        : info_(std::move(other.info_))
        , data_(std::exchange(other.data_, nullptr))
        , len_(std::exchange(other.len_, 0))
        , capacity_(std::exchange(other.capacity_, 0))
        , ticks_(std::move(other.ticks_)) {}

    ComponentStorage& operator=(ComponentStorage&&) = delete;

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] const ComponentInfo& info() const noexcept { return info_; }
    [[nodiscard]] ComponentId id() const noexcept { return info_.id; }
    [[nodiscard]] size_type size() const noexcept { return len_; }
    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }

    void reserve(size_type additional) {
        if (len_ + additional > capacity_) {
            grow_to(len_ + additional);
        }
        ticks_.reserve(len_ + additional);
    }

    // =========================================================================
    // Typed Operations
    // =========================================================================

    template<typename T>
    void push(T&& value, ComponentTicks ticks) {
        using U = std::remove_cvref_t<T>;
        ::new (push_uninit()) U(std::forward<T>(value));
        ticks_.push_back(ticks);
        ++len_;
    }

    template<typename T>
    [[nodiscard]] const T& get(size_type row) const noexcept {
        return *std::launder(reinterpret_cast<const T*>(slot(row)));
    }

    template<typename T>
    [[nodiscard]] T& get(size_type row) noexcept {
        return *std::launder(reinterpret_cast<T*>(slot(row)));
    }

    // =========================================================================
    // Raw Operations
    // =========================================================================

    [[nodiscard]] void* get_raw(size_type row) noexcept {
        return row < len_ ? slot(row) : nullptr;
    }

    [[nodiscard]] const void* get_raw(size_type row) const noexcept {
        return row < len_ ? slot(row) : nullptr;
    }

    /// Move-construct a new row from `src`; `src` must still be destroyed by its owner
    void push_moved_from(void* src, ComponentTicks ticks) {
        info_.move_fn(src, push_uninit());
        ticks_.push_back(ticks);
        ++len_;
    }

    /// Destroy the row's value and move-construct a replacement from `src`
    void replace_moved_from(size_type row, void* src) {
        void* dst = slot(row);
        info_.drop_fn(dst);
        info_.move_fn(src, dst);
    }

    [[nodiscard]] const ComponentTicks& ticks(size_type row) const noexcept { return ticks_[row]; }
    [[nodiscard]] ComponentTicks& ticks(size_type row) noexcept { return ticks_[row]; }

    /// Destroy the row and move the last row into its place
    void swap_remove(size_type row) {
        size_type last = len_ - 1;
        info_.drop_fn(slot(row));
        if (row != last) {
            info_.move_fn(slot(last), slot(row));
            info_.drop_fn(slot(last));
            ticks_[row] = ticks_[last];
        }
        ticks_.pop_back();
        --len_;
    }

    /// Clamp every row's ticks against `current`
    void check_change_ticks(Tick current) noexcept {
        for (auto& t : ticks_) {
            t.added.check_tick(current);
            t.changed.check_tick(current);
        }
    }

    /// Destroy all rows, keeping capacity
    void clear() noexcept {
        for (size_type i = 0; i < len_; ++i) {
            info_.drop_fn(slot(i));
        }
        ticks_.clear();
        len_ = 0;
    }
};

} // namespace quarry_ecs
