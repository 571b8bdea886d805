#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/memory_resource.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/opaque_ptr.hh>
#include <pointer-core/optional.hh>
#include <pointer-core/tags.hh>
#include <pointer-core/type_descriptor.hh>
#include <pointer-core/utility.hh>

#include <compare>
#include <functional>
#include <type_traits>

// raw_ptr and mut_raw_ptr are non-null, untyped addresses.
//
// They read and write bytes (load / store_bytes / copy_memory), and they are the place where typed
// access starts: bind_memory<T> associates a region with T, initialize_memory<T> binds and constructs.
// Arithmetic is in bytes.
//
// Neither handle owns anything. allocate / deallocate are static factories over pc::memory_resource,
// matching them is the caller's job (or use pc::allocation<T>).
//
// raw_ptr is the read-only flavour, mut_raw_ptr converts to it implicitly.
// The other direction requires the explicit pc::mutating tag.
//
// Usage:
//   auto p = pc::mut_raw_ptr::allocate(16, alignof(int));
//   p.store_bytes<u32>(0xDEADBEEF);
//   auto v = p.load<u32>();                      // 0xDEADBEEF
//   auto ints = p.bind_memory<int>(4);           // typed_ptr<int>, still uninitialized
//   ints.initialize(0, 4);
//   ints.deinitialize(4).deallocate();

namespace pc::impl
{
template <class T>
[[nodiscard]] T load_bytes_as(void const* src)
{
    static_assert(std::is_trivially_copyable_v<T>, "raw loads require a trivially copyable T");
    pc::storage_for<T> result;
    pc::memcpy(&result.value, src, isize(sizeof(T)));
    return result.value;
}
} // namespace pc::impl

struct pc::raw_ptr
{
    // construction
public:
    /// Precondition: p != nullptr (use raw_ptr::from for nullable addresses)
    explicit raw_ptr(void const* p) : _ptr(static_cast<byte const*>(p)) { PC_ASSERT(p != nullptr, "raw_ptr must not be null"); }
    explicit raw_ptr(opaque_ptr p) : raw_ptr(p.get()) {}

    [[nodiscard]] static optional<raw_ptr> from(void const* p)
    {
        if (p == nullptr)
            return nullopt;
        return raw_ptr(p);
    }
    [[nodiscard]] static optional<raw_ptr> from(optional<opaque_ptr> p)
    {
        if (!p.has_value())
            return nullopt;
        return raw_ptr(p.value());
    }

    /// Zero yields an empty optional
    [[nodiscard]] static optional<raw_ptr> from_bit_pattern(uptr bits) { return from(reinterpret_cast<void const*>(bits)); }

    // access
public:
    [[nodiscard]] void const* get() const { return _ptr; }
    [[nodiscard]] uptr bit_pattern() const { return reinterpret_cast<uptr>(_ptr); }
    [[nodiscard]] opaque_ptr to_opaque() const { return opaque_ptr(const_cast<byte*>(_ptr)); }

    // loads
public:
    /// Reads a T from the bytes at byte_offset
    /// Preconditions:
    ///   - the address is aligned for T
    ///   - the bytes are initialized (any binding, raw bytes included)
    template <class T>
    [[nodiscard]] T load(isize byte_offset = 0) const
    {
        auto const* src = _ptr + byte_offset;
        PC_ASSERT(pc::is_aligned(src, alignof(T)), "load: address is not aligned for T");
        memory_state::on_load(src, sizeof(T));
        return impl::load_bytes_as<T>(src);
    }

    /// Same as load, without the alignment requirement
    template <class T>
    [[nodiscard]] T load_unaligned(isize byte_offset = 0) const
    {
        auto const* src = _ptr + byte_offset;
        memory_state::on_load(src, sizeof(T));
        return impl::load_bytes_as<T>(src);
    }

    // binding
public:
    /// Binds capacity elements of T starting here, initialization is unchanged
    /// Rebinding initialized memory to an unrelated type is a precondition violation.
    template <class T>
    typed_ptr<T const> bind_memory(isize capacity) const
    {
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");
        PC_ASSERT(pc::is_aligned(_ptr, alignof(T)), "bind_memory: address is not aligned for T");
        memory_state::on_bind(_ptr, type_of<T>(), capacity);
        return typed_ptr<T const>(reinterpret_cast<T const*>(_ptr));
    }

    /// Reinterprets the address as T without touching the binding
    /// Precondition: the memory is already bound to T
    template <class T>
    [[nodiscard]] typed_ptr<T const> assuming_memory_bound() const
    {
        return typed_ptr<T const>(reinterpret_cast<T const*>(_ptr));
    }

    /// Binds capacity elements of T for the duration of body(typed_ptr<T const>)
    /// The previous binding is restored on every exit path, including exceptions.
    /// Returns whatever body returns.
    template <class T, class F>
    decltype(auto) with_memory_rebound(isize capacity, F&& body) const
    {
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");
        PC_ASSERT(pc::is_aligned(_ptr, alignof(T)), "with_memory_rebound: address is not aligned for T");

        auto const bytes = capacity * isize(sizeof(T));
        memory_state::begin_rebind(_ptr, bytes, type_of<T>());
        PC_DEFER { memory_state::end_rebind(_ptr, bytes); };
        return std::invoke(pc::forward<F>(body), typed_ptr<T const>(reinterpret_cast<T const*>(_ptr)));
    }

    // arithmetic (in bytes)
public:
    [[nodiscard]] raw_ptr advanced(isize bytes) const { return raw_ptr(_ptr + bytes); }

    /// Signed byte distance, other - *this
    [[nodiscard]] isize distance_to(raw_ptr other) const { return other._ptr - _ptr; }

    [[nodiscard]] friend raw_ptr operator+(raw_ptr p, isize bytes) { return p.advanced(bytes); }
    [[nodiscard]] friend raw_ptr operator+(isize bytes, raw_ptr p) { return p.advanced(bytes); }
    [[nodiscard]] friend raw_ptr operator-(raw_ptr p, isize bytes) { return p.advanced(-bytes); }
    [[nodiscard]] friend isize operator-(raw_ptr lhs, raw_ptr rhs) { return lhs._ptr - rhs._ptr; }

    raw_ptr& operator+=(isize bytes)
    {
        _ptr += bytes;
        return *this;
    }
    raw_ptr& operator-=(isize bytes)
    {
        _ptr -= bytes;
        return *this;
    }

    [[nodiscard]] friend bool operator==(raw_ptr lhs, raw_ptr rhs) { return lhs._ptr == rhs._ptr; }
    [[nodiscard]] friend std::strong_ordering operator<=>(raw_ptr lhs, raw_ptr rhs)
    {
        return std::compare_three_way{}(lhs._ptr, rhs._ptr);
    }

    // alignment
public:
    [[nodiscard]] raw_ptr aligned_up(isize alignment) const { return raw_ptr(pc::align_up(_ptr, alignment)); }
    [[nodiscard]] raw_ptr aligned_down(isize alignment) const { return raw_ptr(pc::align_down(_ptr, alignment)); }
    template <class T>
    [[nodiscard]] raw_ptr aligned_up() const
    {
        return aligned_up(alignof(T));
    }
    template <class T>
    [[nodiscard]] raw_ptr aligned_down() const
    {
        return aligned_down(alignof(T));
    }
    [[nodiscard]] bool is_aligned(isize alignment) const { return pc::is_aligned(_ptr, alignment); }

private:
    byte const* _ptr;
};

struct pc::mut_raw_ptr
{
    // construction
public:
    /// Precondition: p != nullptr (use mut_raw_ptr::from for nullable addresses)
    explicit mut_raw_ptr(void* p) : _ptr(static_cast<byte*>(p)) { PC_ASSERT(p != nullptr, "mut_raw_ptr must not be null"); }
    explicit mut_raw_ptr(opaque_ptr p) : mut_raw_ptr(p.get()) {}

    /// Explicit const removal
    mut_raw_ptr(mutating_t, raw_ptr p) : mut_raw_ptr(const_cast<void*>(p.get())) {}

    [[nodiscard]] static optional<mut_raw_ptr> from(void* p)
    {
        if (p == nullptr)
            return nullopt;
        return mut_raw_ptr(p);
    }
    [[nodiscard]] static optional<mut_raw_ptr> from(optional<opaque_ptr> p)
    {
        if (!p.has_value())
            return nullopt;
        return mut_raw_ptr(p.value());
    }
    [[nodiscard]] static optional<mut_raw_ptr> from_bit_pattern(uptr bits) { return from(reinterpret_cast<void*>(bits)); }

    operator raw_ptr() const { return raw_ptr(_ptr); }

    // access
public:
    [[nodiscard]] void* get() const { return _ptr; }
    [[nodiscard]] uptr bit_pattern() const { return reinterpret_cast<uptr>(_ptr); }
    [[nodiscard]] opaque_ptr to_opaque() const { return opaque_ptr(_ptr); }

    // loads and stores
public:
    template <class T>
    [[nodiscard]] T load(isize byte_offset = 0) const
    {
        return raw_ptr(_ptr).load<T>(byte_offset);
    }
    template <class T>
    [[nodiscard]] T load_unaligned(isize byte_offset = 0) const
    {
        return raw_ptr(_ptr).load_unaligned<T>(byte_offset);
    }

    /// Writes the bytes of value at byte_offset, no alignment required
    /// The binding is not changed. Must not overwrite a live object of a non-trivial type.
    template <class T>
    void store_bytes(T const& value, isize byte_offset = 0) const
    {
        static_assert(std::is_trivially_copyable_v<T>, "store_bytes requires a trivially copyable T");
        auto* dest = _ptr + byte_offset;
        memory_state::on_store_bytes(dest, sizeof(T));
        pc::memcpy(dest, &value, isize(sizeof(T)));
    }

    /// Copies byte_count bytes from source, ranges may overlap (memmove)
    void copy_memory(raw_ptr source, isize byte_count) const
    {
        PC_ASSERT(byte_count >= 0, "byte count must be non-negative");
        memory_state::on_copy_bytes(_ptr, source.get(), byte_count);
        pc::memmove(_ptr, source.get(), byte_count);
    }

    // binding
public:
    template <class T>
    typed_ptr<T> bind_memory(isize capacity) const
    {
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");
        PC_ASSERT(pc::is_aligned(_ptr, alignof(T)), "bind_memory: address is not aligned for T");
        memory_state::on_bind(_ptr, type_of<T>(), capacity);
        return typed_ptr<T>(reinterpret_cast<T*>(_ptr));
    }

    template <class T>
    [[nodiscard]] typed_ptr<T> assuming_memory_bound() const
    {
        return typed_ptr<T>(reinterpret_cast<T*>(_ptr));
    }

    template <class T, class F>
    decltype(auto) with_memory_rebound(isize capacity, F&& body) const
    {
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");
        PC_ASSERT(pc::is_aligned(_ptr, alignof(T)), "with_memory_rebound: address is not aligned for T");

        auto const bytes = capacity * isize(sizeof(T));
        memory_state::begin_rebind(_ptr, bytes, type_of<T>());
        PC_DEFER { memory_state::end_rebind(_ptr, bytes); };
        return std::invoke(pc::forward<F>(body), typed_ptr<T>(reinterpret_cast<T*>(_ptr)));
    }

    // initialization
public:
    /// Binds one T and copy-constructs it from value
    template <class T>
    typed_ptr<T> initialize_memory(T const& value) const
    {
        return initialize_memory<T>(value, 1);
    }

    /// Binds count elements of T and copy-constructs each from value
    template <class T>
    typed_ptr<T> initialize_memory(T const& value, isize count) const
    {
        auto typed = bind_memory<T>(count);
        typed.initialize(value, count);
        return typed;
    }

    /// Binds count elements of T and copy-constructs them from [source, source + count)
    /// Precondition: the ranges do not overlap
    template <class T>
    typed_ptr<T> initialize_memory(T const* source, isize count) const
    {
        auto typed = bind_memory<T>(count);
        if (count > 0)
            typed.initialize(typed_ptr<T const>(source), count);
        return typed;
    }

    /// Binds count elements of T and moves them from source, leaving the source uninitialized
    /// The ranges may overlap.
    template <class T>
    typed_ptr<T> move_initialize_memory(typed_ptr<T> source, isize count) const
    {
        auto typed = bind_memory<T>(count);
        typed.move_initialize(source, count);
        return typed;
    }

    // allocation
public:
    /// Allocates byte_count bytes from the system resource
    /// The result is untyped and uninitialized. byte_count == 0 still yields a unique address.
    [[nodiscard]] static mut_raw_ptr allocate(isize byte_count, isize alignment)
    {
        return mut_raw_ptr(pc::allocate_bytes(byte_count, alignment));
    }

    [[nodiscard]] static mut_raw_ptr allocate(isize byte_count, isize alignment, memory_resource const& resource)
    {
        return mut_raw_ptr(pc::allocate_bytes(byte_count, alignment, &resource));
    }

    /// Releases memory obtained from allocate(byte_count, alignment)
    void deallocate() const { pc::deallocate_bytes(_ptr, -1, -1); }

    /// Releases memory obtained from allocate(byte_count, alignment, resource) with the same arguments
    void deallocate(isize byte_count, isize alignment, memory_resource const& resource) const
    {
        pc::deallocate_bytes(_ptr, byte_count, alignment, &resource);
    }

    // arithmetic (in bytes)
public:
    [[nodiscard]] mut_raw_ptr advanced(isize bytes) const { return mut_raw_ptr(_ptr + bytes); }
    [[nodiscard]] isize distance_to(raw_ptr other) const { return raw_ptr(_ptr).distance_to(other); }

    [[nodiscard]] friend mut_raw_ptr operator+(mut_raw_ptr p, isize bytes) { return p.advanced(bytes); }
    [[nodiscard]] friend mut_raw_ptr operator+(isize bytes, mut_raw_ptr p) { return p.advanced(bytes); }
    [[nodiscard]] friend mut_raw_ptr operator-(mut_raw_ptr p, isize bytes) { return p.advanced(-bytes); }
    [[nodiscard]] friend isize operator-(mut_raw_ptr lhs, mut_raw_ptr rhs) { return lhs._ptr - rhs._ptr; }

    mut_raw_ptr& operator+=(isize bytes)
    {
        _ptr += bytes;
        return *this;
    }
    mut_raw_ptr& operator-=(isize bytes)
    {
        _ptr -= bytes;
        return *this;
    }

    [[nodiscard]] friend bool operator==(mut_raw_ptr lhs, mut_raw_ptr rhs) { return lhs._ptr == rhs._ptr; }
    [[nodiscard]] friend std::strong_ordering operator<=>(mut_raw_ptr lhs, mut_raw_ptr rhs)
    {
        return std::compare_three_way{}(lhs._ptr, rhs._ptr);
    }

    // alignment
public:
    [[nodiscard]] mut_raw_ptr aligned_up(isize alignment) const { return mut_raw_ptr(pc::align_up(_ptr, alignment)); }
    [[nodiscard]] mut_raw_ptr aligned_down(isize alignment) const
    {
        return mut_raw_ptr(pc::align_down(_ptr, alignment));
    }
    template <class T>
    [[nodiscard]] mut_raw_ptr aligned_up() const
    {
        return aligned_up(alignof(T));
    }
    template <class T>
    [[nodiscard]] mut_raw_ptr aligned_down() const
    {
        return aligned_down(alignof(T));
    }
    [[nodiscard]] bool is_aligned(isize alignment) const { return pc::is_aligned(_ptr, alignment); }

private:
    byte* _ptr;
};

// typed_ptr converts to raw_ptr / mut_raw_ptr, so it needs both complete
#include <pointer-core/typed_ptr.hh>
