#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/buffer_slice.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/memory_resource.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/optional.hh>
#include <pointer-core/raw_ptr.hh>
#include <pointer-core/tags.hh>
#include <pointer-core/utility.hh>

#include <functional>
#include <iterator>
#include <type_traits>

// raw_buffer and mut_raw_buffer are untyped byte views { base, count }.
//
// Indices are byte offsets in 0..<count, every access is bounds-checked in debug builds.
// The base address is null only for an empty, default-constructed view.
//
// Typed access starts the same way as for raw pointers: bind_memory<T> / initialize_memory<T>
// produce a typed_buffer<T> covering count / sizeof(T) elements.
//
// Usage:
//   auto bytes = pc::mut_raw_buffer::allocate(64, 16);
//   bytes.store_bytes<u32>(7, 8);
//   auto ints = bytes.initialize_memory<int>(0);     // 16 ints, all 0
//   ints.deinitialize().deallocate();

namespace pc
{
/// Result of a partial initialization from an iterator range:
/// the elements that were written and the first source element that did not fit
template <class T, class It>
struct initialize_result
{
    typed_buffer<T> initialized;
    It remainder;
};
} // namespace pc

struct pc::raw_buffer
{
    using element_type = u8 const;

    // construction
public:
    raw_buffer() = default;

    raw_buffer(raw_ptr start, isize count) : _data(static_cast<u8 const*>(start.get())), _count(count)
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
    }

    /// Precondition: start != nullptr unless count == 0
    raw_buffer(void const* start, isize count) : _data(static_cast<u8 const*>(start)), _count(count)
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        PC_ASSERT(start != nullptr || count == 0, "only empty buffers may have a null base");
    }

    /// Zero-based view over the memory of a slice
    raw_buffer(rebasing_t, buffer_slice<raw_buffer> slice) : raw_buffer(slice.begin(), slice.count()) {}
    raw_buffer(rebasing_t, buffer_slice<mut_raw_buffer> slice);

    /// Bytes of a typed buffer
    template <class T>
    explicit raw_buffer(typed_buffer<T> buffer) : raw_buffer(static_cast<void const*>(buffer.data()), buffer.count() * isize(sizeof(T)))
    {
    }

    // queries
public:
    [[nodiscard]] isize count() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }
    [[nodiscard]] optional<raw_ptr> base_address() const { return raw_ptr::from(_data); }
    [[nodiscard]] u8 const* data() const { return _data; }
    [[nodiscard]] u8 const* begin() const { return _data; }
    [[nodiscard]] u8 const* end() const { return _data + _count; }

    // access
public:
    /// Reads byte i
    /// Preconditions: 0 <= i < count(), the byte is initialized
    [[nodiscard]] u8 operator[](isize i) const
    {
        PC_ASSERT(0 <= i && i < _count, "raw_buffer index out of bounds");
        memory_state::on_load(_data + i, 1);
        return _data[i];
    }

    /// Sub-range [first, last) keeping this buffer's indices
    [[nodiscard]] buffer_slice<raw_buffer> slice(isize first, isize last) const
    {
        return buffer_slice<raw_buffer>(*this, first, last);
    }

    /// Precondition: [byte_offset, byte_offset + sizeof(T)) lies within the buffer
    template <class T>
    [[nodiscard]] T load(isize byte_offset = 0) const
    {
        check_range(byte_offset, sizeof(T));
        return raw_ptr(_data).load<T>(byte_offset);
    }

    template <class T>
    [[nodiscard]] T load_unaligned(isize byte_offset = 0) const
    {
        check_range(byte_offset, sizeof(T));
        return raw_ptr(_data).load_unaligned<T>(byte_offset);
    }

    // binding
public:
    /// Binds count() / sizeof(T) elements of T, initialization is unchanged
    template <class T>
    typed_buffer<T const> bind_memory() const
    {
        auto const capacity = _count / isize(sizeof(T));
        if (_data == nullptr)
            return {};
        return typed_buffer<T const>(raw_ptr(_data).bind_memory<T>(capacity), capacity);
    }

    /// Precondition: the memory is already bound to T
    template <class T>
    [[nodiscard]] typed_buffer<T const> assuming_memory_bound() const
    {
        PC_ASSERT(pc::is_aligned(_data, alignof(T)), "assuming_memory_bound: base is not aligned for T");
        return typed_buffer<T const>(reinterpret_cast<T const*>(_data), _count / isize(sizeof(T)));
    }

    /// Binds the bytes to T for the duration of body(typed_buffer<T const>)
    /// Precondition: count() is a multiple of sizeof(T), base aligned for T
    template <class T, class F>
    decltype(auto) with_memory_rebound(F&& body) const
    {
        PC_ASSERT(_count % isize(sizeof(T)) == 0, "with_memory_rebound: byte count must be a multiple of sizeof(T)");
        PC_ASSERT(pc::is_aligned(_data, alignof(T)), "with_memory_rebound: base is not aligned for T");

        memory_state::begin_rebind(_data, _count, type_of<T>());
        PC_DEFER { memory_state::end_rebind(_data, _count); };
        return std::invoke(pc::forward<F>(body),
                           typed_buffer<T const>(reinterpret_cast<T const*>(_data), _count / isize(sizeof(T))));
    }

private:
    void check_range(isize byte_offset, isize bytes) const
    {
        PC_ASSERT(byte_offset >= 0 && byte_offset + bytes <= _count, "access out of buffer bounds");
    }

    u8 const* _data = nullptr;
    isize _count = 0;
};

struct pc::mut_raw_buffer
{
    using element_type = u8;

    // construction
public:
    mut_raw_buffer() = default;

    mut_raw_buffer(mut_raw_ptr start, isize count) : _data(static_cast<u8*>(start.get())), _count(count)
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
    }

    /// Precondition: start != nullptr unless count == 0
    mut_raw_buffer(void* start, isize count) : _data(static_cast<u8*>(start)), _count(count)
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        PC_ASSERT(start != nullptr || count == 0, "only empty buffers may have a null base");
    }

    /// Explicit const removal
    mut_raw_buffer(mutating_t, raw_buffer buffer) : mut_raw_buffer(const_cast<u8*>(buffer.data()), buffer.count()) {}

    mut_raw_buffer(rebasing_t, buffer_slice<mut_raw_buffer> slice) : mut_raw_buffer(slice.begin(), slice.count()) {}

    template <class T>
        requires(!std::is_const_v<T>)
    explicit mut_raw_buffer(typed_buffer<T> buffer)
      : mut_raw_buffer(static_cast<void*>(buffer.data()), buffer.count() * isize(sizeof(T)))
    {
    }

    operator raw_buffer() const { return raw_buffer(static_cast<void const*>(_data), _count); }

    // queries
public:
    [[nodiscard]] isize count() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }
    [[nodiscard]] optional<mut_raw_ptr> base_address() const { return mut_raw_ptr::from(_data); }
    [[nodiscard]] u8* data() const { return _data; }
    [[nodiscard]] u8* begin() const { return _data; }
    [[nodiscard]] u8* end() const { return _data + _count; }

    // access
public:
    /// Reference to byte i, treated as a byte store: the byte counts as initialized afterwards
    /// Preconditions: 0 <= i < count(), the byte is not part of a live non-trivial object
    [[nodiscard]] u8& operator[](isize i) const
    {
        PC_ASSERT(0 <= i && i < _count, "mut_raw_buffer index out of bounds");
        memory_state::on_store_bytes(_data + i, 1);
        return _data[i];
    }

    [[nodiscard]] buffer_slice<mut_raw_buffer> slice(isize first, isize last) const
    {
        return buffer_slice<mut_raw_buffer>(*this, first, last);
    }

    template <class T>
    [[nodiscard]] T load(isize byte_offset = 0) const
    {
        return raw_buffer(*this).load<T>(byte_offset);
    }

    template <class T>
    [[nodiscard]] T load_unaligned(isize byte_offset = 0) const
    {
        return raw_buffer(*this).load_unaligned<T>(byte_offset);
    }

    /// Writes the bytes of value at byte_offset, no alignment required
    /// Precondition: [byte_offset, byte_offset + sizeof(T)) lies within the buffer
    template <class T>
    void store_bytes(T const& value, isize byte_offset = 0) const
    {
        check_range(byte_offset, sizeof(T));
        mut_raw_ptr(_data).store_bytes(value, byte_offset);
    }

    /// Copies all bytes of source to the front of this buffer (memmove semantics)
    /// Precondition: count() >= source.count()
    void copy_memory(raw_buffer source) const
    {
        PC_ASSERT(source.count() <= _count, "copy_memory: source does not fit");
        if (source.empty())
            return;
        mut_raw_ptr(_data).copy_memory(raw_ptr(source.data()), source.count());
    }

    /// Copies a contiguous range of byte-sized elements (std::span<u8>, std::vector<char>, std::array, ...)
    /// Precondition: the range fits
    template <class Range>
    void copy_bytes(Range const& source) const
    {
        static_assert(sizeof(*std::data(source)) == 1, "copy_bytes requires a range of byte-sized elements");
        auto const bytes = isize(std::size(source));
        PC_ASSERT(bytes <= _count, "copy_bytes: source does not fit");
        if (bytes == 0)
            return;
        mut_raw_ptr(_data).copy_memory(raw_ptr(std::data(source)), bytes);
    }

    // binding
public:
    template <class T>
    typed_buffer<T> bind_memory() const
    {
        auto const capacity = _count / isize(sizeof(T));
        if (_data == nullptr)
            return {};
        return typed_buffer<T>(mut_raw_ptr(_data).bind_memory<T>(capacity), capacity);
    }

    template <class T>
    [[nodiscard]] typed_buffer<T> assuming_memory_bound() const
    {
        PC_ASSERT(pc::is_aligned(_data, alignof(T)), "assuming_memory_bound: base is not aligned for T");
        return typed_buffer<T>(reinterpret_cast<T*>(_data), _count / isize(sizeof(T)));
    }

    template <class T, class F>
    decltype(auto) with_memory_rebound(F&& body) const
    {
        PC_ASSERT(_count % isize(sizeof(T)) == 0, "with_memory_rebound: byte count must be a multiple of sizeof(T)");
        PC_ASSERT(pc::is_aligned(_data, alignof(T)), "with_memory_rebound: base is not aligned for T");

        memory_state::begin_rebind(_data, _count, type_of<T>());
        PC_DEFER { memory_state::end_rebind(_data, _count); };
        return std::invoke(pc::forward<F>(body), typed_buffer<T>(reinterpret_cast<T*>(_data), _count / isize(sizeof(T))));
    }

    // initialization
public:
    /// Binds count() / sizeof(T) elements and copy-constructs each from value
    template <class T>
    typed_buffer<T> initialize_memory(T const& value) const
    {
        auto typed = bind_memory<T>();
        typed.initialize(value);
        return typed;
    }

    /// Constructs elements from [first, last) until the range or the buffer is exhausted
    /// Returns the initialized prefix and the first element that was not consumed.
    template <class T, class It, class Sentinel>
    initialize_result<T, It> initialize_memory(It first, Sentinel last) const
    {
        auto typed = bind_memory<T>();
        isize n = 0;
        while (n < typed.count() && first != last)
        {
            typed.initialize_element(n, *first);
            ++n;
            ++first;
        }

        if (n == 0)
            return {typed_buffer<T>(), pc::move(first)};
        return {typed_buffer<T>(typed.data(), n), pc::move(first)};
    }

    /// Binds and copy-constructs the elements of source at the front of this buffer
    /// Precondition: source fits
    template <class T>
    typed_buffer<T> initialize_memory(typed_buffer<T const> source) const
    {
        PC_ASSERT(source.count() * isize(sizeof(T)) <= _count, "initialize_memory: source does not fit");
        if (source.empty())
            return {};
        auto typed = mut_raw_ptr(_data).initialize_memory<T>(source.data(), source.count());
        return typed_buffer<T>(typed, source.count());
    }

    /// Binds and relocates the elements of source to the front of this buffer, source is left uninitialized
    /// Precondition: source fits
    template <class T>
    typed_buffer<T> move_initialize_memory(typed_buffer<T> source) const
    {
        PC_ASSERT(source.count() * isize(sizeof(T)) <= _count, "move_initialize_memory: source does not fit");
        if (source.empty())
            return {};
        auto typed = mut_raw_ptr(_data).move_initialize_memory<T>(typed_ptr<T>(source.data()), source.count());
        return typed_buffer<T>(typed, source.count());
    }

    // allocation
public:
    /// Allocates byte_count bytes from the system resource
    [[nodiscard]] static mut_raw_buffer allocate(isize byte_count, isize alignment)
    {
        return mut_raw_buffer(mut_raw_ptr::allocate(byte_count, alignment), byte_count);
    }

    [[nodiscard]] static mut_raw_buffer allocate(isize byte_count, isize alignment, memory_resource const& resource)
    {
        return mut_raw_buffer(mut_raw_ptr::allocate(byte_count, alignment, resource), byte_count);
    }

    /// Releases memory obtained from allocate(count(), alignment)
    void deallocate() const
    {
        PC_ASSERT(_data != nullptr, "cannot deallocate a buffer without base address");
        mut_raw_ptr(_data).deallocate();
    }

    /// Releases memory obtained from allocate(count(), alignment, resource)
    void deallocate(isize alignment, memory_resource const& resource) const
    {
        PC_ASSERT(_data != nullptr, "cannot deallocate a buffer without base address");
        mut_raw_ptr(_data).deallocate(_count, alignment, resource);
    }

private:
    void check_range(isize byte_offset, isize bytes) const
    {
        PC_ASSERT(byte_offset >= 0 && byte_offset + bytes <= _count, "access out of buffer bounds");
    }

    u8* _data = nullptr;
    isize _count = 0;
};

inline pc::raw_buffer::raw_buffer(rebasing_t, buffer_slice<mut_raw_buffer> slice)
  : raw_buffer(static_cast<void const*>(slice.begin()), slice.count())
{
}

// typed_buffer converts to raw buffers, so it needs both complete
#include <pointer-core/typed_buffer.hh>
