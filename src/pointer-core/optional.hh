#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as pc::nullopt to explicitly assign or compare against empty optionals.
struct pc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace pc
{
/// The canonical instance of nullopt_t.
/// Usage: optional<raw_ptr> p = nullopt; or if (p == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace pc

/// Value or nothing, used for the nullable handle results:
/// raw_ptr::from(nullptr), typed_ptr<T>::from_bit_pattern(0), buffer base addresses of empty views.
///
/// Restricted to trivially copyable payloads (all pointer and view handles are),
/// which keeps optional<handle> itself trivially copyable and free of lifetime management.
/// No operator* or operator->: access goes through value() which asserts engagement.
template <class T>
struct pc::optional
{
    static_assert(std::is_trivially_copyable_v<T>, "pc::optional only holds trivially copyable handle types");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    constexpr optional() = default;

    /// Constructs an optional holding the given value.
    constexpr optional(T const& value) : _has_value(true) { new (pc::placement_new, &_storage.value) T(value); }

    /// Constructs an empty optional from pc::nullopt.
    constexpr optional(nullopt_t) {}

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    [[nodiscard]] constexpr explicit operator bool() const { return _has_value; }

    /// Returns the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T const& value() const
    {
        PC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T& value()
    {
        PC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }

    /// Returns the held value or the given fallback if empty.
    [[nodiscard]] constexpr T value_or(T const& fallback) const { return _has_value ? _storage.value : fallback; }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional equals a value if it holds an equal value.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    // members
private:
    pc::storage_for<T> _storage;
    bool _has_value = false;
};
