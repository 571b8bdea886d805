#pragma once

#include <pointer-core/fwd.hh>
#include <pointer-core/macros.hh>
#include <pointer-core/type_descriptor.hh>

// =========================================================================================================
// Shadow memory-state tracker
// =========================================================================================================
//
// Every byte obtained through an allocator entry point (mut_raw_ptr::allocate, typed_ptr<T>::allocate,
// the buffer factories, pc::allocation<T>) is registered here and carries a shadow cell:
//
//   untyped / uninitialized      fresh allocation
//   untyped / holding bytes      written by store_bytes or copy_memory, loadable as any trivial type
//   bound to T / uninitialized   after bind_memory<T>, deinitialize or move
//   bound to T / initialized     after initialize, emplace, store, update
//
// Handles report transitions through the on_* hooks below. Violations are reported through the
// assertion handler stack (PC_ASSERTS_ALWAYS) with a message naming the types involved:
//   - reading or loading uninitialized cells
//   - typed access to cells bound to a different type (sub-objects are only reachable through
//     typed_ptr::member, which registers them via on_member)
//   - initializing over a live non-trivial object, deinitializing uninitialized cells
//   - rebinding initialized cells to an unrelated type
//   - deallocating an interior address, deallocating twice, deallocating live non-trivial objects
//   - accesses that run past the end of the allocated region
//
// Memory that was not obtained through an entry point (stack arrays, malloc, foreign buffers) is
// untracked and never checked.
//
// A tracked allocation handed to an arena_resource as backing storage is lent (begin_loan): while the
// arena lives, its sub-allocations are tracked individually and the enclosing allocation cannot be
// released. end_loan returns the bytes to the enclosing allocation as fresh untyped storage.
//
// Fresh allocations are filled with 0xCD, released allocations with 0xDD.
//
// Enabled via PC_SHADOW_STATE_ENABLED (defaults to PC_ASSERT_ENABLED).
// When disabled, all hooks compile to nothing and query() reports everything as untracked.
//
// The registry is process-global and internally synchronized. This does not make concurrent access
// to user memory safe, it only keeps the debug bookkeeping consistent.

namespace pc::memory_state
{
inline constexpr bool is_enabled = PC_SHADOW_STATE_ENABLED != 0;

inline constexpr u8 allocated_poison = 0xCD;
inline constexpr u8 deallocated_poison = 0xDD;

/// Released start addresses are remembered for double-free detection, oldest first out
inline constexpr isize max_remembered_releases = 4096;

enum class cell_state
{
    untracked,
    untyped,
    untyped_bytes,
    bound_uninitialized,
    bound_initialized,
    mixed,
};

/// Uniform state of a byte range, or cell_state::mixed
/// type is the bound type for the bound_* states and nullptr otherwise
struct summary
{
    cell_state state = cell_state::untracked;
    type_descriptor const* type = nullptr;
};

/// Summarizes the shadow state of [p, p + byte_count)
/// Returns untracked for memory outside every registered region (and always when disabled)
[[nodiscard]] summary query(raw_ptr p, isize byte_count);

/// Number of currently registered allocations
[[nodiscard]] isize tracked_allocation_count();

/// Number of released addresses currently remembered, at most max_remembered_releases
[[nodiscard]] isize remembered_release_count();

namespace impl
{
void on_allocate(void* p, isize bytes);
void on_deallocate(void* p);
void on_bind(void const* p, type_descriptor const* type, isize count);
void on_initialize(void const* p, type_descriptor const* type, isize count);
void on_deinitialize(void const* p, type_descriptor const* type, isize count);
void on_read(void const* p, type_descriptor const* type, isize count);
void on_write(void const* p, type_descriptor const* type, isize count);
void on_load(void const* p, isize bytes);
void on_store_bytes(void const* p, isize bytes);
void on_copy_bytes(void const* dest, void const* src, isize bytes);
void on_move_initialize(void const* dest, void const* src, type_descriptor const* type, isize count);
void on_move_update(void const* dest, void const* src, type_descriptor const* type, isize count);
void begin_rebind(void const* p, isize bytes, type_descriptor const* type);
void end_rebind(void const* p, isize bytes);
void on_member(void const* object, type_descriptor const* object_type, void const* member, type_descriptor const* member_type);
void begin_loan(void const* p, isize bytes);
void end_loan(void const* p, isize bytes);
void forget_range(void const* p, isize bytes);
} // namespace impl

// hooks
// each one is a no-op when the tracker is disabled

/// Registers [p, p + bytes) as untyped and uninitialized and poisons it
inline void on_allocate(void* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::on_allocate(p, bytes);
}

/// Unregisters the allocation starting at p and poisons it
/// Untracked addresses are ignored unless they were released before or point into a live allocation.
inline void on_deallocate(void* p)
{
    if constexpr (is_enabled)
        impl::on_deallocate(p);
}

/// Binds count elements of type at p
/// Initialized cells keep their value only if they already hold the same type,
/// raw bytes and the new type is trivial, or both types are trivial and of equal size.
inline void on_bind(void const* p, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_bind(p, type, count);
}

/// Marks count elements bound to type as initialized
inline void on_initialize(void const* p, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_initialize(p, type, count);
}

/// Marks count initialized elements of type as uninitialized
inline void on_deinitialize(void const* p, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_deinitialize(p, type, count);
}

/// Checks that count elements of type are initialized
inline void on_read(void const* p, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_read(p, type, count);
}

/// Assignment to count elements of type
/// Non-trivial types must be initialized, trivial types become initialized
inline void on_write(void const* p, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_write(p, type, count);
}

/// Untyped load: checks that the bytes are initialized, ignores the binding
inline void on_load(void const* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::on_load(p, bytes);
}

/// Untyped store: must not overwrite live non-trivial objects, keeps the binding
inline void on_store_bytes(void const* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::on_store_bytes(p, bytes);
}

/// Untyped copy with memmove semantics: the destination takes over the source's initialization
inline void on_copy_bytes(void const* dest, void const* src, isize bytes)
{
    if constexpr (is_enabled)
        impl::on_copy_bytes(dest, src, bytes);
}

/// Move-construction of count elements, ranges may overlap
/// Afterwards dest is initialized and the part of src outside dest is uninitialized
inline void on_move_initialize(void const* dest, void const* src, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_move_initialize(dest, src, type, count);
}

/// Move-assignment of count elements between non-overlapping ranges
inline void on_move_update(void const* dest, void const* src, type_descriptor const* type, isize count)
{
    if constexpr (is_enabled)
        impl::on_move_update(dest, src, type, count);
}

/// Temporarily binds [p, p + bytes) to type, keeping initialization
/// Must be paired with end_rebind (LIFO), which restores the previous bindings
inline void begin_rebind(void const* p, isize bytes, type_descriptor const* type)
{
    if constexpr (is_enabled)
        impl::begin_rebind(p, bytes, type);
}

inline void end_rebind(void const* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::end_rebind(p, bytes);
}

/// Registers member as a sub-object of type member_type inside the object at object
/// Typed access to the member is accepted for as long as the enclosing object keeps its binding.
inline void on_member(void const* object,
                      type_descriptor const* object_type,
                      void const* member,
                      type_descriptor const* member_type)
{
    if constexpr (is_enabled)
        impl::on_member(object, object_type, member, member_type);
}

/// [p, p + bytes) becomes backing storage of a sub-allocator
/// Untracked storage is accepted as is. Tracked storage must not hold live non-trivial objects.
inline void begin_loan(void const* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::begin_loan(p, bytes);
}

/// Drops the sub-allocations in [p, p + bytes) and hands the bytes back to the enclosing allocation
inline void end_loan(void const* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::end_loan(p, bytes);
}

/// Drops all allocations lying completely inside [p, p + bytes) without checks
/// Used by resources that release their sub-allocations wholesale (arena reset)
inline void forget_range(void const* p, isize bytes)
{
    if constexpr (is_enabled)
        impl::forget_range(p, bytes);
}
} // namespace pc::memory_state
