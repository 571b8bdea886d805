#include "arena_resource.hh"

#include <pointer-core/asserts.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/utility.hh>

#include <string>

namespace
{
pc::byte* arena_try_allocate_bytes(pc::isize bytes, pc::isize alignment, void* userdata)
{
    return static_cast<pc::arena_resource*>(userdata)->try_allocate(bytes, alignment);
}

pc::byte* arena_allocate_bytes(pc::isize bytes, pc::isize alignment, void* userdata)
{
    return static_cast<pc::arena_resource*>(userdata)->allocate(bytes, alignment);
}

// individual blocks are only released by reset()
void arena_deallocate_bytes(pc::byte* p, pc::isize bytes, pc::isize alignment, void* userdata)
{
    PC_UNUSED(bytes);
    PC_UNUSED(alignment);
    PC_ASSERT(static_cast<pc::arena_resource*>(userdata)->owns(p), "pointer was not allocated from this arena");
}
} // namespace

pc::arena_resource::arena_resource(isize capacity_bytes)
  : _block(nullptr),
    _capacity(capacity_bytes),
    _owns_block(true),
    _resource{
        .allocate_bytes = arena_allocate_bytes,
        .try_allocate_bytes = arena_try_allocate_bytes,
        .deallocate_bytes = arena_deallocate_bytes,
        .userdata = this,
    }
{
    PC_ASSERT(capacity_bytes > 0, "arena capacity must be positive");

    // the block itself is not tracked, only what the arena hands out
    auto const& system = *default_memory_resource;
    _block = system.allocate_bytes(capacity_bytes, alignof(std::max_align_t), system.userdata);
}

pc::arena_resource::arena_resource(byte* storage, isize capacity_bytes)
  : _block(storage),
    _capacity(capacity_bytes),
    _owns_block(false),
    _resource{
        .allocate_bytes = arena_allocate_bytes,
        .try_allocate_bytes = arena_try_allocate_bytes,
        .deallocate_bytes = arena_deallocate_bytes,
        .userdata = this,
    }
{
    PC_ASSERT(storage != nullptr && capacity_bytes > 0, "arena storage must be non-empty");

    // storage from a tracked allocation is set aside while the arena tracks its own sub-allocations
    memory_state::begin_loan(storage, capacity_bytes);
}

pc::arena_resource::~arena_resource()
{
    memory_state::end_loan(_block, _capacity);

    if (_owns_block)
    {
        auto const& system = *default_memory_resource;
        system.deallocate_bytes(_block, _capacity, alignof(std::max_align_t), system.userdata);
    }
}

pc::byte* pc::arena_resource::try_allocate(isize bytes, isize alignment)
{
    PC_ASSERT(bytes >= 0, "byte count must be non-negative");
    PC_ASSERT(alignment > 0 && is_power_of_two(alignment), "alignment must be a power of 2");

    if (bytes == 0)
        return nullptr;

    // align the address, not the offset: a caller-provided block may be less aligned than requested
    auto* const start = pc::align_up(_block + _offset, alignment);
    auto const new_offset = (start - _block) + bytes;
    if (new_offset > _capacity)
        return nullptr;

    _offset = new_offset;
    return start;
}

pc::byte* pc::arena_resource::allocate(isize bytes, isize alignment)
{
    auto* p = try_allocate(bytes, alignment);
    PC_ASSERTS_ALWAYS(bytes == 0 || p != nullptr,
                      "arena exhausted: requested " + std::to_string(bytes) + " bytes with alignment "
                          + std::to_string(alignment) + ", " + std::to_string(remaining_bytes()) + " of "
                          + std::to_string(_capacity) + " bytes left");
    return p;
}

void pc::arena_resource::reset()
{
    memory_state::forget_range(_block, _capacity);
    _offset = 0;
}

bool pc::arena_resource::owns(void const* p) const
{
    auto const* b = static_cast<byte const*>(p);
    return _block <= b && b < _block + _capacity;
}
