#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/memory_resource.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/typed_buffer.hh>
#include <pointer-core/typed_ptr.hh>
#include <pointer-core/utility.hh>

#include <type_traits>

// pc::allocation<T> is the opt-in owning handle on top of the non-owning pointer and buffer views.
//
// It models two things explicitly:
// 1) which bytes are owned (a block from a pc::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// Everything else in pointer-core leaves lifetime to the caller. allocation<T> is for the common case
// where "destroy what is alive, then release the block" should happen at scope exit.
//
// The resource pointer is stored in the allocation. A null resource means pc::default_memory_resource.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - obj_start and obj_end are aligned to alignof(T), even when empty.
// - the whole capacity is bound to T, cells outside the live window are uninitialized.
// - a default-constructed or moved-from allocation owns nothing.
//
// Usage:
//   auto a = pc::allocation<std::string>::create_empty(4);
//   a.emplace_back("hello");
//   a.emplace_back(3, 'x');
//   for (auto const& s : a.obj_buffer())
//       ...;
//   // destructor: "xxx" and "hello" are destroyed (in that order), then the block is released
template <class T>
struct pc::allocation
{
    static_assert(!std::is_const_v<T> && !std::is_reference_v<T>, "allocation<T> requires a mutable object type");

    /// Pointer to the first live object
    T* obj_start = nullptr;

    /// Pointer one past the last live object
    T* obj_end = nullptr;

    /// Base pointer returned by the memory resource, passed back on deallocation
    byte* alloc_start = nullptr;

    /// One past the last allocated byte
    byte* alloc_end = nullptr;

    /// Alignment the block was requested with
    isize alignment = 0;

    /// Owning resource, or nullptr for the global default
    memory_resource const* custom_resource = nullptr;

    // queries
public:
    /// Returns the effective resource
    [[nodiscard]] memory_resource const& resource() const { return resolve_resource(custom_resource); }

    /// True iff this allocation owns a block
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Number of live objects
    [[nodiscard]] isize size() const { return obj_end - obj_start; }

    /// Number of elements that fit from obj_start to the end of the block
    [[nodiscard]] isize capacity() const
    {
        if (alloc_start == nullptr)
            return 0;
        return (alloc_end - reinterpret_cast<byte*>(obj_start)) / isize(sizeof(T));
    }

    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// View of the live objects
    [[nodiscard]] typed_buffer<T> obj_buffer() const { return typed_buffer<T>(obj_start, size()); }

    /// View of the full capacity starting at obj_start
    /// Only [0, size()) is initialized.
    [[nodiscard]] typed_buffer<T> capacity_buffer() const { return typed_buffer<T>(obj_start, capacity()); }

    // live window
public:
    /// Constructs a new object at the end of the live window
    /// Precondition: size() < capacity()
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        PC_ASSERT(size() < capacity(), "emplace_back: allocation is full");
        auto& obj = typed_ptr<T>(obj_end).emplace(pc::forward<Args>(args)...);
        ++obj_end;
        return obj;
    }

    /// Destroys the last live object
    /// Precondition: size() > 0
    void pop_back()
    {
        PC_ASSERT(size() > 0, "pop_back: no live objects");
        --obj_end;
        (void)typed_ptr<T>(obj_end).deinitialize(1);
    }

    /// Destroys all live objects in reverse order, keeps the block
    void clear()
    {
        if (obj_start != obj_end)
            (void)obj_buffer().deinitialize();
        obj_end = obj_start;
    }

    /// Gives up ownership and returns the live objects
    /// The block starts at the returned base and has capacity() elements. The caller becomes responsible
    /// for deinitializing the objects and releasing the block through the same resource.
    /// Precondition: obj_start == alloc_start (the block can be recovered from the returned view)
    [[nodiscard]] typed_buffer<T> release()
    {
        PC_ASSERT(reinterpret_cast<byte*>(obj_start) == alloc_start, "release: live window must start at the block");
        auto const result = obj_buffer();
        obj_start = nullptr;
        obj_end = nullptr;
        alloc_start = nullptr;
        alloc_end = nullptr;
        alignment = 0;
        return result;
    }

    // factories
public:
    /// Allocates room for capacity objects without constructing any
    /// The whole capacity is bound to T. capacity == 0 still allocates a (minimal) block.
    [[nodiscard]] static allocation create_empty(isize capacity, memory_resource const* resource = nullptr)
    {
        PC_ASSERT(capacity >= 0, "capacity must be non-negative");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignof(T);

        auto const bytes = capacity * isize(sizeof(T));
        result.alloc_start = pc::allocate_bytes(bytes, result.alignment, resource);
        result.alloc_end = result.alloc_start + bytes;
        memory_state::on_bind(result.alloc_start, type_of<T>(), capacity);

        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;
        return result;
    }

    /// Allocates count objects, each copy-constructed from value
    [[nodiscard]] static allocation create_filled(isize count, T const& value, memory_resource const* resource = nullptr)
    {
        auto result = allocation::create_empty(count, resource);
        if (count > 0)
        {
            typed_ptr<T>(result.obj_start).initialize(value, count);
            result.obj_end = result.obj_start + count;
        }
        return result;
    }

    /// Allocates a copy of the objects in source
    [[nodiscard]] static allocation create_copy_of(typed_buffer<T const> source, memory_resource const* resource = nullptr)
    {
        auto result = allocation::create_empty(source.count(), resource);
        result.obj_end += result.capacity_buffer().initialize(source);
        return result;
    }

    /// Copies the live objects of rhs, using rhs's resource
    [[nodiscard]] static allocation create_copy_of(allocation const& rhs)
    {
        return allocation::create_copy_of(rhs.obj_buffer(), rhs.custom_resource);
    }

    // lifecycle
public:
    allocation() = default;

    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(pc::exchange(rhs.obj_start, nullptr)),
        obj_end(pc::exchange(rhs.obj_end, nullptr)),
        alloc_start(pc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(pc::exchange(rhs.alloc_end, nullptr)),
        alignment(pc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Safe even if rhs lives inside one of the objects destroyed here:
    /// rhs is emptied into a temporary before anything is destroyed.
    allocation& operator=(allocation&& rhs)
    {
        if (this != &rhs)
        {
            auto rhs_tmp = pc::move(rhs);

            destroy_and_deallocate();

            obj_start = pc::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = pc::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = pc::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = pc::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = pc::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }

        return *this;
    }

    ~allocation() { destroy_and_deallocate(); }

private:
    void destroy_and_deallocate()
    {
        if (alloc_start == nullptr)
            return;

        clear();
        pc::deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, custom_resource);
        alloc_start = nullptr;
        alloc_end = nullptr;
        obj_start = nullptr;
        obj_end = nullptr;
    }
};
