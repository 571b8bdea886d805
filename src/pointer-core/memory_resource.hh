#pragma once

#include <pointer-core/fwd.hh>
#include <pointer-core/utility.hh>

// Every allocation in pointer-core goes through a pc::memory_resource.
//
// The resource is a POD of function pointers (no virtual dispatch, no constructors), so a resource
// stored in the data segment is usable during static initialization.
// A null resource pointer always means pc::default_memory_resource (the system allocator).
//
// Handles do not store their resource. The pairing of allocate and deallocate is the caller's job:
//   auto p = pc::mut_raw_ptr::allocate(64, 16);          // system resource
//   p.deallocate();                                      // size-free release, system resource only
//
//   auto q = pc::mut_raw_ptr::allocate(64, 16, arena);   // explicit resource
//   q.deallocate(64, 16, arena);                         // same size, alignment, and resource
//
// The free functions allocate_bytes / deallocate_bytes below are the single entry point used by all
// handle factories and pc::allocation<T>. They register and unregister regions with the shadow
// memory-state tracker and never return null.

namespace pc
{
/// System allocator (posix_memalign / free, _aligned_malloc / _aligned_free on Windows)
/// Stored in the data segment, valid during static initialization of other translation units.
extern memory_resource const* const default_memory_resource;
} // namespace pc

struct pc::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment.
    /// bytes == 0 returns nullptr without allocating.
    /// bytes > 0 never returns nullptr, failure is fatal.
    pc::function_ptr<byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Same as allocate_bytes, but returns nullptr if the request cannot be served.
    pc::function_ptr<byte*(isize bytes, isize alignment, void* userdata)> try_allocate_bytes = nullptr;

    /// Release a block obtained from this resource.
    /// `p` must be the exact pointer returned by allocate_bytes or try_allocate_bytes.
    /// `bytes` and `alignment` match the allocation, or are both -1 for a size-free release.
    /// Size-free release is only valid for resources that do not need the size (system, arena).
    pc::function_ptr<void(byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

namespace pc
{
/// Resolves a null resource to the default one
[[nodiscard]] inline memory_resource const& resolve_resource(memory_resource const* resource)
{
    return resource ? *resource : *default_memory_resource;
}

/// Allocates max(bytes, 1) bytes, so the result is never null
/// The region is registered with the shadow tracker as untyped and uninitialized.
/// Preconditions: bytes >= 0, alignment is a positive power of two
[[nodiscard]] byte* allocate_bytes(isize bytes, isize alignment, memory_resource const* resource = nullptr);

/// Like allocate_bytes, but returns nullptr if the resource cannot serve the request
[[nodiscard]] byte* try_allocate_bytes(isize bytes, isize alignment, memory_resource const* resource = nullptr);

/// Releases a block obtained from allocate_bytes or try_allocate_bytes with the same resource
/// bytes and alignment are -1 for a size-free release
void deallocate_bytes(byte* p, isize bytes, isize alignment, memory_resource const* resource = nullptr);
} // namespace pc
