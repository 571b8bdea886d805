#pragma once

#include <pointer-core/fwd.hh>
#include <pointer-core/memory_resource.hh>

/// Bump allocator over a fixed block of bytes
///
/// Allocations advance an offset inside the block. Individual deallocation is a no-op,
/// reset() makes the whole block available again at once.
/// Exposes a pc::memory_resource, so every handle factory and pc::allocation<T> can allocate from it:
///
///   pc::arena_resource arena(4096);
///   auto p = pc::typed_ptr<int>::allocate(16, arena);
///   p.initialize(0, 16);
///   ...
///   p.deinitialize(16);
///   arena.reset();
///
/// The arena owns its block unless it was constructed over caller-provided storage.
/// Caller-provided storage may itself come from a tracked allocation (e.g. mut_raw_ptr::allocate):
/// that allocation is lent to the arena and must outlive it. Afterwards its bytes are fresh untyped storage.
/// Non-copyable and non-movable: the resource's userdata points at the arena.
struct pc::arena_resource
{
    // construction
public:
    /// Allocates a block of capacity_bytes from the system allocator
    explicit arena_resource(isize capacity_bytes);

    /// Uses [storage, storage + capacity_bytes) without taking ownership
    arena_resource(byte* storage, isize capacity_bytes);

    ~arena_resource();

    arena_resource(arena_resource const&) = delete;
    arena_resource& operator=(arena_resource const&) = delete;
    arena_resource(arena_resource&&) = delete;
    arena_resource& operator=(arena_resource&&) = delete;

    // allocation
public:
    /// Returns nullptr if the block cannot serve the request
    /// bytes == 0 returns nullptr without consuming space.
    [[nodiscard]] byte* try_allocate(isize bytes, isize alignment);

    /// Like try_allocate, but exhaustion is fatal
    [[nodiscard]] byte* allocate(isize bytes, isize alignment);

    /// Releases every allocation at once
    /// Tracked sub-allocations are dropped from the shadow memory-state registry without checks,
    /// the allocation the storage was lent from stays tracked.
    void reset();

    // queries
public:
    [[nodiscard]] memory_resource const& resource() const { return _resource; }
    operator memory_resource const&() const { return _resource; }

    [[nodiscard]] isize capacity_bytes() const { return _capacity; }
    [[nodiscard]] isize used_bytes() const { return _offset; }
    [[nodiscard]] isize remaining_bytes() const { return _capacity - _offset; }

    /// True if p points into the arena's block
    [[nodiscard]] bool owns(void const* p) const;

private:
    byte* _block = nullptr;
    isize _capacity = 0;
    isize _offset = 0;
    bool _owns_block = false;
    memory_resource _resource;
};
