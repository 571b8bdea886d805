#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>

#include <cstring>
#include <new>
#include <type_traits>

// Small helpers used throughout pointer-core
//
//   move, forward, exchange      without pulling in <utility>
//   max                          returns b on ties
//   align_up, align_down         for integers and pointers, alignment is a power of two
//   is_aligned, is_power_of_two
//   memcpy, memmove, memset      signed byte counts, empty copies may use null pointers
//   placement_new, storage_for   raw object storage
//   PC_DEFER { ... };            runs at scope exit, also during unwinding

namespace pc
{
template <class T>
[[nodiscard]] PC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T>
[[nodiscard]] PC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] PC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// stores replacement in target and returns what was there before
/// Usage:
///   auto* block = pc::exchange(alloc_start, nullptr);
template <class T, class U = T>
[[nodiscard]] PC_FORCE_INLINE constexpr T exchange(T& target, U&& replacement) // NOLINT
{
    T previous = static_cast<T&&>(target);
    target = static_cast<U&&>(replacement);
    return previous;
}

template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// precondition: value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    PC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// rounds value (integer or pointer) up to the next multiple of alignment
/// e.g. align_up(isize(300), 16) == 304
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    PC_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of two");
    return (T)(((isize)value + (alignment - 1)) & -alignment);
}

template <class T>
[[nodiscard]] constexpr T align_down(T value, isize alignment)
{
    PC_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_down: alignment must be a power of two");
    return (T)((isize)value & -alignment);
}

template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    PC_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of two");
    return ((isize)value & (alignment - 1)) == 0;
}

/// ranges must not overlap
inline void memcpy(void* dest, void const* src, isize bytes)
{
    PC_ASSERT(bytes >= 0, "memcpy: negative byte count");
    if (bytes != 0)
        std::memcpy(dest, src, size_t(bytes));
}

inline void memmove(void* dest, void const* src, isize bytes)
{
    PC_ASSERT(bytes >= 0, "memmove: negative byte count");
    if (bytes != 0)
        std::memmove(dest, src, size_t(bytes));
}

inline void memset(void* dest, u8 value, isize bytes)
{
    PC_ASSERT(bytes >= 0, "memset: negative byte count");
    if (bytes != 0)
        std::memset(dest, value, size_t(bytes));
}

struct placement_new_t
{
};

/// `new (pc::placement_new, p) T(...)` never resolves to a user-provided operator new(size_t, void*)
inline constexpr placement_new_t placement_new = {};

/// uninitialized storage for one T, trivially destructible whenever T is
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for() {}
};

/// elements that may be copied bytewise and dropped without running a destructor
template <class T>
constexpr bool is_trivial_element = std::is_trivially_copyable_v<T> && std::is_trivially_destructible_v<T>;

namespace impl
{
template <class Signature>
struct function_ptr_t; // only function signatures

template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// pc::function_ptr<byte*(isize, isize, void*)> is byte* (*)(isize, isize, void*)
template <class Signature>
using function_ptr = typename impl::function_ptr_t<Signature>::type;

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(pc::forward<F>(f));
}
} // namespace impl

/// Usage:
///   memory_state::begin_rebind(p, bytes, type);
///   PC_DEFER { memory_state::end_rebind(p, bytes); };
#define PC_DEFER auto const PC_MACRO_JOIN(_pc_deferred_, __COUNTER__) = ::pc::impl::deferred_tag{} + [&]
} // namespace pc

[[nodiscard]] inline void* operator new(std::size_t, pc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
// only called when a constructor throws
inline void operator delete(void*, pc::placement_new_t, void*) noexcept {}
