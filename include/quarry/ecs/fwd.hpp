#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for quarry_ecs

#include <cstdint>
#include <cstddef>

namespace quarry_ecs {

// =============================================================================
// Core Types
// =============================================================================

struct Entity;
class EntityAllocator;
struct EntityLocation;

struct Tick;
struct ComponentTicks;
struct Ticks;

// =============================================================================
// Storage Types
// =============================================================================

enum class StorageType : std::uint8_t;
struct ComponentId;
struct ComponentInfo;
class ComponentRegistry;
class ComponentStorage;

struct TableId;
class Table;
class Tables;

class ComponentSparseSet;
class SparseSets;

struct ArchetypeId;
struct ArchetypeEdge;
class Archetype;
class Archetypes;

// =============================================================================
// Access / Query Types
// =============================================================================

enum class BorrowMode : std::uint8_t;
struct BorrowRequest;
class AccessRegistry;
class QueryBorrow;

enum class Access : std::uint8_t;
struct ComponentAccess;
class QueryDescriptor;
class MatchedStorage;
class BatchingStrategy;
class UniqueEntityVec;
class UniqueEntitySlice;

template<typename... Terms>
struct Data;

template<typename... Filters>
struct Filter;

template<typename D, typename F = Filter<>>
class QueryState;

// =============================================================================
// World
// =============================================================================

class World;

template<typename WorldT>
class EntityBuilder;

// =============================================================================
// Common Type Aliases
// =============================================================================

using EntityIndex = std::uint32_t;
using Generation = std::uint32_t;

} // namespace quarry_ecs
