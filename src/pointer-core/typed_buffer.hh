#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/buffer_slice.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/impl/object_lifetime_util.hh>
#include <pointer-core/memory_resource.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/optional.hh>
#include <pointer-core/raw_buffer.hh>
#include <pointer-core/tags.hh>
#include <pointer-core/typed_ptr.hh>
#include <pointer-core/utility.hh>

#include <functional>
#include <type_traits>

namespace pc
{
/// Result of typed_buffer::initialize(first, last):
/// the first source element that did not fit, and one past the last written index
template <class It>
struct initialize_range_result
{
    It remainder;
    isize index = 0;
};
} // namespace pc

/// Non-owning view of count elements of T { base, count }
///
/// Same state model as typed_ptr<T>, with bounds: indices are 0..<count and every indexed access
/// is checked in debug builds. typed_buffer<T const> is the read-only variant.
/// The base is null only for an empty, default-constructed view.
///
/// Whole-buffer operations (initialize, update, deinitialize, ...) act on all count elements.
/// The *_element operations act on a single index.
///
/// Usage:
///   auto buf = pc::typed_buffer<int>::allocate(4);
///   buf.initialize(0);
///   buf[2] = 7;
///   auto sum = 0;
///   for (int v : buf)
///       sum += v;
///   buf.deinitialize().deallocate();
template <class T>
struct pc::typed_buffer
{
    using element_type = T;
    using value_type = std::remove_cv_t<T>;

    static constexpr bool is_mutable = !std::is_const_v<T>;

    // construction
public:
    typed_buffer() = default;

    typed_buffer(typed_ptr<T> start, isize count) : _data(start.get()), _count(count)
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
    }

    /// Precondition: start != nullptr unless count == 0
    typed_buffer(T* start, isize count) : _data(start), _count(count)
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        PC_ASSERT(start != nullptr || count == 0, "only empty buffers may have a null base");
        PC_ASSERT(pc::is_aligned(start, alignof(T)), "typed_buffer base is not aligned for T");
    }

    /// Zero-based view over the elements of a slice
    typed_buffer(rebasing_t, buffer_slice<typed_buffer> slice) : typed_buffer(slice.begin(), slice.count()) {}

    /// typed_buffer<T> -> typed_buffer<T const>
    template <class U>
        requires(std::is_same_v<U const, T> && !std::is_same_v<U, T>)
    typed_buffer(typed_buffer<U> buffer) : _data(buffer.data()), _count(buffer.count())
    {
    }

    /// Explicit const removal
    typed_buffer(mutating_t, typed_buffer<value_type const> buffer)
        requires is_mutable
      : _data(const_cast<T*>(buffer.data())), _count(buffer.count())
    {
    }

    // queries
public:
    [[nodiscard]] isize count() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }
    [[nodiscard]] optional<typed_ptr<T>> base_address() const { return typed_ptr<T>::from(_data); }
    [[nodiscard]] T* data() const { return _data; }
    [[nodiscard]] T* begin() const { return _data; }
    [[nodiscard]] T* end() const { return _data + _count; }

    // access
public:
    /// Preconditions: 0 <= i < count(), element i is initialized
    [[nodiscard]] T& operator[](isize i) const
    {
        PC_ASSERT(0 <= i && i < _count, "typed_buffer index out of bounds");
        memory_state::on_read(_data + i, type_of<T>(), 1);
        return _data[i];
    }

    /// Sub-range [first, last) keeping this buffer's indices
    [[nodiscard]] buffer_slice<typed_buffer> slice(isize first, isize last) const
    {
        return buffer_slice<typed_buffer>(*this, first, last);
    }

    // whole-buffer initialization
public:
    /// Copy-constructs every element from value
    void initialize(value_type const& value) const
        requires is_mutable
    {
        if (_count > 0)
            head().initialize(value, _count);
    }

    /// Constructs elements from [first, last) until the range or the buffer is exhausted
    /// Returns the first unconsumed source element and one past the last written index.
    template <class It, class Sentinel>
    initialize_range_result<It> initialize(It first, Sentinel last) const
        requires is_mutable
    {
        isize n = 0;
        while (n < _count && first != last)
        {
            initialize_element(n, *first);
            ++n;
            ++first;
        }
        return {pc::move(first), n};
    }

    /// Copy-constructs the elements of source at the front, returns one past the last written index
    /// Preconditions: source.count() <= count(), the ranges do not overlap
    isize initialize(typed_buffer<value_type const> source) const
        requires is_mutable
    {
        PC_ASSERT(source.count() <= _count, "initialize: source does not fit");
        if (!source.empty())
            head().initialize(typed_ptr<value_type const>(source.data()), source.count());
        return source.count();
    }

    /// Relocates the elements of source to the front, source is left uninitialized
    /// The ranges may overlap. Returns one past the last written index.
    isize move_initialize(typed_buffer source) const
        requires is_mutable
    {
        PC_ASSERT(source.count() <= _count, "move_initialize: source does not fit");
        if (!source.empty())
            head().move_initialize(typed_ptr<T>(source.data()), source.count());
        return source.count();
    }

    // whole-buffer assignment
public:
    /// Assigns value to every (initialized) element
    void update(value_type const& value) const
        requires is_mutable
    {
        if (_count > 0)
            head().update(value, _count);
    }

    /// Assigns the elements of source to the front, returns one past the last written index
    /// The ranges may overlap.
    isize update(typed_buffer<value_type const> source) const
        requires is_mutable
    {
        PC_ASSERT(source.count() <= _count, "update: source does not fit");
        if (!source.empty())
            head().update(typed_ptr<value_type const>(source.data()), source.count());
        return source.count();
    }

    /// Move-assigns the elements of source to the front, source is left uninitialized
    /// Precondition: the ranges do not overlap
    isize move_update(typed_buffer source) const
        requires is_mutable
    {
        PC_ASSERT(source.count() <= _count, "move_update: source does not fit");
        if (!source.empty())
            head().move_update(typed_ptr<T>(source.data()), source.count());
        return source.count();
    }

    /// Destroys every element in reverse order and returns the raw bytes, binding is kept
    auto deinitialize() const
    {
        if constexpr (is_mutable)
        {
            if (_count > 0)
                head().deinitialize(_count);
            return mut_raw_buffer(static_cast<void*>(_data), _count * isize(sizeof(T)));
        }
        else
        {
            if (_count > 0)
                head().deinitialize(_count);
            return raw_buffer(static_cast<void const*>(_data), _count * isize(sizeof(T)));
        }
    }

    // single elements
public:
    /// Precondition: element i is uninitialized
    void initialize_element(isize i, value_type const& value) const
        requires is_mutable
    {
        PC_ASSERT(0 <= i && i < _count, "typed_buffer index out of bounds");
        typed_ptr<T>(_data + i).initialize(value);
    }

    /// Moves element i out, leaving it uninitialized
    [[nodiscard]] value_type move_element(isize i) const
        requires is_mutable
    {
        PC_ASSERT(0 <= i && i < _count, "typed_buffer index out of bounds");
        return typed_ptr<T>(_data + i).move();
    }

    /// Destroys element i
    void deinitialize_element(isize i) const
        requires is_mutable
    {
        PC_ASSERT(0 <= i && i < _count, "typed_buffer index out of bounds");
        typed_ptr<T>(_data + i).deinitialize(1);
    }

    // rebinding
public:
    /// Binds the elements to U for the duration of body(typed_buffer<U>)
    /// The rebound view has count() * sizeof(T) / sizeof(U) elements.
    /// Preconditions: the byte count is a multiple of sizeof(U), the base is aligned for U
    template <class U, class F>
    decltype(auto) with_memory_rebound(F&& body) const
    {
        using target_t = std::conditional_t<is_mutable, U, U const>;

        auto const bytes = _count * isize(sizeof(T));
        PC_ASSERT(bytes % isize(sizeof(U)) == 0, "with_memory_rebound: byte count must be a multiple of sizeof(U)");
        PC_ASSERT(pc::is_aligned(_data, alignof(U)), "with_memory_rebound: base is not aligned for U");

        memory_state::begin_rebind(_data, bytes, type_of<U>());
        PC_DEFER { memory_state::end_rebind(_data, bytes); };
        return std::invoke(pc::forward<F>(body),
                           typed_buffer<target_t>(reinterpret_cast<target_t*>(_data), bytes / isize(sizeof(U))));
    }

    // allocation
public:
    /// Allocates capacity elements from the system resource, bound to T and uninitialized
    [[nodiscard]] static typed_buffer allocate(isize capacity)
        requires is_mutable
    {
        return typed_buffer(typed_ptr<T>::allocate(capacity), capacity);
    }

    [[nodiscard]] static typed_buffer allocate(isize capacity, memory_resource const& resource)
        requires is_mutable
    {
        return typed_buffer(typed_ptr<T>::allocate(capacity, resource), capacity);
    }

    /// Releases memory obtained from allocate(count())
    /// Precondition: no element holds a live object of a non-trivial type
    void deallocate() const { head().deallocate(); }

    /// Releases memory obtained from allocate(count(), resource)
    void deallocate(memory_resource const& resource) const { head().deallocate(_count, resource); }

private:
    [[nodiscard]] typed_ptr<T> head() const
    {
        PC_ASSERT(_data != nullptr, "buffer has no base address");
        return typed_ptr<T>(_data);
    }

    T* _data = nullptr;
    isize _count = 0;
};
