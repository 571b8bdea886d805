#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/impl/object_lifetime_util.hh>
#include <pointer-core/memory_resource.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/opaque_ptr.hh>
#include <pointer-core/optional.hh>
#include <pointer-core/raw_ptr.hh>
#include <pointer-core/tags.hh>
#include <pointer-core/type_descriptor.hh>
#include <pointer-core/utility.hh>

#include <compare>
#include <functional>
#include <type_traits>

/// Non-null pointer to memory bound to T
///
/// typed_ptr<T const> is the read-only variant, typed_ptr<T> converts to it implicitly.
/// The handle does not know whether the pointee is initialized: every operation documents
/// whether it expects initialized or uninitialized cells, and the shadow tracker checks it.
///
///   initialize / emplace      uninitialized -> initialized (copy / in-place construction)
///   store / update            initialized -> initialized (assignment)
///   move                      initialized -> uninitialized, returns the value
///   move_initialize           relocates from another range, source becomes uninitialized
///   move_update               move-assigns from another range, source becomes uninitialized
///   deinitialize              initialized -> uninitialized, returns the raw memory
///
/// Arithmetic is in elements (strides of sizeof(T)).
///
/// Reference access (pointee, *, ->, []) requires initialized cells, even when assigning through
/// the reference. Use store or initialize to give uninitialized cells a value.
template <class T>
struct pc::typed_ptr
{
    static_assert(!std::is_reference_v<T>, "typed_ptr<T&> is not supported");
    static_assert(!std::is_void_v<std::remove_cv_t<T>>, "use raw_ptr / mut_raw_ptr for untyped memory");

    using element_type = T;
    using value_type = std::remove_cv_t<T>;

    static constexpr bool is_mutable = !std::is_const_v<T>;

    // construction
public:
    /// Preconditions: p != nullptr and aligned for T
    explicit typed_ptr(T* p) : _ptr(p)
    {
        PC_ASSERT(p != nullptr, "typed_ptr must not be null");
        PC_ASSERT(pc::is_aligned(p, alignof(T)), "typed_ptr address is not aligned for T");
    }
    explicit typed_ptr(opaque_ptr p) : typed_ptr(static_cast<T*>(p.get())) {}

    /// typed_ptr<T> -> typed_ptr<T const>
    template <class U>
        requires(std::is_same_v<U const, T> && !std::is_same_v<U, T>)
    typed_ptr(typed_ptr<U> p) : _ptr(p.get())
    {
    }

    /// Explicit const removal
    typed_ptr(mutating_t, typed_ptr<value_type const> p)
        requires is_mutable
      : _ptr(const_cast<T*>(p.get()))
    {
    }

    [[nodiscard]] static optional<typed_ptr> from(T* p)
    {
        if (p == nullptr)
            return nullopt;
        return typed_ptr(p);
    }

    /// Zero yields an empty optional, a misaligned pattern is a precondition violation
    [[nodiscard]] static optional<typed_ptr> from_bit_pattern(uptr bits) { return from(reinterpret_cast<T*>(bits)); }

    operator raw_ptr() const { return raw_ptr(_ptr); }
    operator mut_raw_ptr() const
        requires is_mutable
    {
        return mut_raw_ptr(_ptr);
    }

    // access
public:
    [[nodiscard]] T* get() const { return _ptr; }
    [[nodiscard]] uptr bit_pattern() const { return reinterpret_cast<uptr>(_ptr); }
    [[nodiscard]] opaque_ptr to_opaque() const { return opaque_ptr(const_cast<value_type*>(_ptr)); }

    /// Precondition: the pointee is initialized
    [[nodiscard]] T& pointee() const
    {
        memory_state::on_read(_ptr, type_of<T>(), 1);
        return *_ptr;
    }
    [[nodiscard]] T& operator*() const { return pointee(); }
    [[nodiscard]] T* operator->() const
    {
        memory_state::on_read(_ptr, type_of<T>(), 1);
        return _ptr;
    }

    /// Precondition: element i is initialized (no bounds, a pointer has no count)
    [[nodiscard]] T& operator[](isize i) const
    {
        memory_state::on_read(_ptr + i, type_of<T>(), 1);
        return _ptr[i];
    }

    /// Copy of the pointee
    [[nodiscard]] value_type load() const
    {
        memory_state::on_read(_ptr, type_of<T>(), 1);
        return *_ptr;
    }

    /// Pointer to a stored member of the pointee
    /// The member becomes a known sub-object: typed access through the result is checked against it.
    template <class M, class C = value_type>
        requires std::is_base_of_v<C, value_type>
    [[nodiscard]] auto member(M C::* m) const
    {
        using member_t = std::conditional_t<is_mutable, M, M const>;
        auto* const field = &(_ptr->*m);
        memory_state::on_member(_ptr, type_of<T>(), field, type_of<M>());
        return typed_ptr<member_t>(field);
    }

    // assignment (initialized -> initialized)
public:
    /// Assigns value to the pointee
    /// Precondition: the pointee is initialized, or T is trivial
    void store(value_type const& value) const
        requires is_mutable
    {
        memory_state::on_write(_ptr, type_of<T>(), 1);
        *_ptr = value;
    }

    /// Assigns value to count initialized elements
    void update(value_type const& value, isize count) const
        requires is_mutable
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        memory_state::on_write(_ptr, type_of<T>(), count);
        auto end = _ptr;
        impl::fill_assign_objects_to(end, count, value);
    }

    /// Assigns count elements from source, ranges may overlap
    void update(typed_ptr<value_type const> source, isize count) const
        requires is_mutable
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        memory_state::on_read(source.get(), type_of<T>(), count);
        memory_state::on_write(_ptr, type_of<T>(), count);
        impl::copy_assign_objects(_ptr, source.get(), count);
    }

    /// Move-assigns count elements from source, source is left uninitialized
    /// Precondition: the ranges do not overlap
    void move_update(typed_ptr source, isize count) const
        requires is_mutable
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        PC_ASSERT(!impl::ranges_overlap(_ptr, count, source._ptr, count), "move_update ranges must not overlap");
        memory_state::on_move_update(_ptr, source._ptr, type_of<T>(), count);
        impl::move_assign_objects(_ptr, source._ptr, count);
    }

    // initialization (uninitialized -> initialized)
public:
    void initialize(value_type const& value) const
        requires is_mutable
    {
        initialize(value, 1);
    }

    /// Constructs the pointee in place and returns a reference to it
    template <class... Args>
    T& emplace(Args&&... args) const
        requires is_mutable
    {
        T* result = nullptr;
        construct_tracked(1, [&](T*& end) {
            result = new (pc::placement_new, end) T(pc::forward<Args>(args)...);
            ++end;
        });
        return *result;
    }

    /// Copy-constructs count elements from value
    void initialize(value_type const& value, isize count) const
        requires is_mutable
    {
        construct_tracked(count, [&](T*& end) { impl::fill_create_objects_to(end, count, value); });
    }

    /// Copy-constructs count elements from source
    /// Precondition: the ranges do not overlap
    void initialize(typed_ptr<value_type const> source, isize count) const
        requires is_mutable
    {
        PC_ASSERT(!impl::ranges_overlap<value_type>(_ptr, count, source.get(), count),
                  "initialize source must not overlap the destination");
        memory_state::on_read(source.get(), type_of<T>(), count);
        construct_tracked(count, [&](T*& end) { impl::copy_create_objects_to(end, source.get(), count); });
    }

    /// Relocates count elements from source, ranges may overlap
    /// Afterwards [*this, *this + count) is initialized and the rest of the source is uninitialized.
    void move_initialize(typed_ptr source, isize count) const
        requires is_mutable
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        memory_state::on_move_initialize(_ptr, source._ptr, type_of<T>(), count);
        impl::relocate_objects(_ptr, source._ptr, count);
    }

    /// Moves the pointee out, leaving the cell uninitialized
    [[nodiscard]] value_type move() const
        requires is_mutable
    {
        memory_state::on_read(_ptr, type_of<T>(), 1);
        value_type result = pc::move(*_ptr);
        impl::destroy_objects_in_reverse(_ptr, _ptr + 1);
        memory_state::on_deinitialize(_ptr, type_of<T>(), 1);
        return result;
    }

    /// Destroys count elements in reverse order and returns the raw memory
    /// The binding is kept.
    auto deinitialize(isize count) const
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        auto* p = const_cast<value_type*>(_ptr);
        memory_state::on_read(p, type_of<T>(), count);
        impl::destroy_objects_in_reverse(p, p + count);
        memory_state::on_deinitialize(p, type_of<T>(), count);

        if constexpr (is_mutable)
            return mut_raw_ptr(p);
        else
            return raw_ptr(p);
    }

    // rebinding
public:
    /// Binds capacity elements to U for the duration of body(typed_ptr<U>)
    /// U must have the same size and alignment as T. The binding is restored on every exit path.
    template <class U, class F>
    decltype(auto) with_memory_rebound(isize capacity, F&& body) const
    {
        static_assert(sizeof(U) == sizeof(T), "temporary rebinding requires types of equal size");
        static_assert(alignof(U) == alignof(T), "temporary rebinding requires types of equal alignment");
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");

        using target_t = std::conditional_t<is_mutable, U, U const>;
        auto const bytes = capacity * isize(sizeof(T));
        memory_state::begin_rebind(_ptr, bytes, type_of<U>());
        PC_DEFER { memory_state::end_rebind(_ptr, bytes); };
        return std::invoke(pc::forward<F>(body), typed_ptr<target_t>(reinterpret_cast<target_t*>(_ptr)));
    }

    // arithmetic (in elements)
public:
    [[nodiscard]] typed_ptr advanced(isize n) const { return typed_ptr(_ptr + n); }
    [[nodiscard]] typed_ptr successor() const { return typed_ptr(_ptr + 1); }
    [[nodiscard]] typed_ptr predecessor() const { return typed_ptr(_ptr - 1); }

    /// Signed element distance, other - *this
    [[nodiscard]] isize distance_to(typed_ptr<value_type const> other) const { return other.get() - _ptr; }

    [[nodiscard]] friend typed_ptr operator+(typed_ptr p, isize n) { return p.advanced(n); }
    [[nodiscard]] friend typed_ptr operator+(isize n, typed_ptr p) { return p.advanced(n); }
    [[nodiscard]] friend typed_ptr operator-(typed_ptr p, isize n) { return p.advanced(-n); }
    [[nodiscard]] friend isize operator-(typed_ptr lhs, typed_ptr rhs) { return lhs._ptr - rhs._ptr; }

    typed_ptr& operator+=(isize n)
    {
        _ptr += n;
        return *this;
    }
    typed_ptr& operator-=(isize n)
    {
        _ptr -= n;
        return *this;
    }
    typed_ptr& operator++()
    {
        ++_ptr;
        return *this;
    }
    typed_ptr& operator--()
    {
        --_ptr;
        return *this;
    }
    typed_ptr operator++(int)
    {
        auto const prev = *this;
        ++_ptr;
        return prev;
    }
    typed_ptr operator--(int)
    {
        auto const prev = *this;
        --_ptr;
        return prev;
    }

    [[nodiscard]] friend bool operator==(typed_ptr lhs, typed_ptr rhs) { return lhs._ptr == rhs._ptr; }
    [[nodiscard]] friend std::strong_ordering operator<=>(typed_ptr lhs, typed_ptr rhs)
    {
        return std::compare_three_way{}(lhs._ptr, rhs._ptr);
    }

    // allocation
public:
    /// Allocates capacity elements from the system resource, bound to T and uninitialized
    /// capacity == 0 still yields a unique address.
    [[nodiscard]] static typed_ptr allocate(isize capacity)
        requires is_mutable
    {
        return allocate_from(capacity, nullptr);
    }

    [[nodiscard]] static typed_ptr allocate(isize capacity, memory_resource const& resource)
        requires is_mutable
    {
        return allocate_from(capacity, &resource);
    }

    /// Releases memory obtained from allocate(capacity)
    /// Precondition: no element holds a live object of a non-trivial type
    void deallocate() const { pc::deallocate_bytes(byte_address(), -1, -1); }

    /// Releases memory obtained from allocate(capacity, resource) with the same arguments
    void deallocate(isize capacity, memory_resource const& resource) const
    {
        pc::deallocate_bytes(byte_address(), capacity * isize(sizeof(T)), alignof(T), &resource);
    }

private:
    [[nodiscard]] static typed_ptr allocate_from(isize capacity, memory_resource const* resource)
    {
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");
        auto* p = pc::allocate_bytes(capacity * isize(sizeof(T)), alignof(T), resource);
        memory_state::on_bind(p, type_of<T>(), capacity);
        return typed_ptr(reinterpret_cast<T*>(p));
    }

    [[nodiscard]] byte* byte_address() const { return reinterpret_cast<byte*>(const_cast<value_type*>(_ptr)); }

    // marks [_ptr, _ptr + count) initialized, then constructs
    // all or nothing: if a constructor throws, the finished prefix is destroyed and the range is uninitialized again
    template <class F>
    void construct_tracked(isize count, F&& construct) const
    {
        PC_ASSERT(count >= 0, "count must be non-negative");
        memory_state::on_initialize(_ptr, type_of<T>(), count);

        T* end = _ptr;
        PC_DEFER
        {
            if (end != _ptr + count)
            {
                impl::destroy_objects_in_reverse(_ptr, end);
                memory_state::on_deinitialize(_ptr, type_of<T>(), count);
            }
        };
        construct(end);
    }

    T* _ptr;
};
