#include "memory_resource.hh"

#include <pointer-core/asserts.hh>
#include <pointer-core/memory_state.hh>

#include <cstdlib>
#include <string>

namespace
{
// posix_memalign instead of std::aligned_alloc: no bytes % alignment == 0 requirement
// posix_memalign needs alignment >= sizeof(void*)
pc::byte* system_try_allocate_bytes(pc::isize bytes, pc::isize alignment, void* userdata)
{
    PC_UNUSED(userdata);
    PC_ASSERT(bytes >= 0, "byte count must be non-negative");
    PC_ASSERT(alignment > 0 && pc::is_power_of_two(alignment), "alignment must be a power of 2");

    if (bytes == 0)
        return nullptr;

#ifdef PC_OS_WINDOWS
    return static_cast<pc::byte*>(_aligned_malloc(size_t(bytes), size_t(alignment)));
#else
    void* raw = nullptr;
    auto const effective_alignment = pc::max(alignment, pc::isize(sizeof(void*)));
    auto const result = posix_memalign(&raw, size_t(effective_alignment), size_t(bytes));
    return result == 0 ? static_cast<pc::byte*>(raw) : nullptr;
#endif
}

pc::byte* system_allocate_bytes(pc::isize bytes, pc::isize alignment, void* userdata)
{
    auto* p = system_try_allocate_bytes(bytes, alignment, userdata);
    PC_ASSERTS_ALWAYS(bytes == 0 || p != nullptr,
                      "allocation failed: requested " + std::to_string(bytes) + " bytes with alignment "
                          + std::to_string(alignment));
    return p;
}

// size and alignment are not needed by free, so size-free release (-1, -1) is accepted
void system_deallocate_bytes(pc::byte* p, pc::isize bytes, pc::isize alignment, void* userdata)
{
    PC_UNUSED(bytes);
    PC_UNUSED(alignment);
    PC_UNUSED(userdata);

#ifdef PC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit pc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};
} // namespace

constinit pc::memory_resource const* const pc::default_memory_resource = &system_memory_resource;

pc::byte* pc::allocate_bytes(isize bytes, isize alignment, memory_resource const* resource)
{
    PC_ASSERT(bytes >= 0, "byte count must be non-negative");
    PC_ASSERT(alignment > 0 && is_power_of_two(alignment), "alignment must be a power of 2");

    auto const& res = resolve_resource(resource);
    auto const actual_bytes = pc::max(bytes, isize(1));
    auto* p = res.allocate_bytes(actual_bytes, alignment, res.userdata);
    PC_ASSERT_ALWAYS(p != nullptr, "memory resource returned null for a non-empty request");

    memory_state::on_allocate(p, actual_bytes);
    return p;
}

pc::byte* pc::try_allocate_bytes(isize bytes, isize alignment, memory_resource const* resource)
{
    PC_ASSERT(bytes >= 0, "byte count must be non-negative");
    PC_ASSERT(alignment > 0 && is_power_of_two(alignment), "alignment must be a power of 2");

    auto const& res = resolve_resource(resource);
    auto const actual_bytes = pc::max(bytes, isize(1));
    auto* p = res.try_allocate_bytes(actual_bytes, alignment, res.userdata);
    if (p != nullptr)
        memory_state::on_allocate(p, actual_bytes);
    return p;
}

void pc::deallocate_bytes(byte* p, isize bytes, isize alignment, memory_resource const* resource)
{
    PC_ASSERT(p != nullptr, "cannot deallocate null");
    PC_ASSERT((bytes == -1 && alignment == -1) || (bytes >= 0 && alignment > 0), "invalid deallocation size");

    memory_state::on_deallocate(p);

    auto const& res = resolve_resource(resource);
    // allocate_bytes handed out at least one byte
    res.deallocate_bytes(p, bytes == -1 ? bytes : pc::max(bytes, isize(1)), alignment, res.userdata);
}
