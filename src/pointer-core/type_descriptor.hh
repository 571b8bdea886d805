#pragma once

#include <pointer-core/fwd.hh>
#include <pointer-core/macros.hh>
#include <pointer-core/utility.hh>

#include <string_view>
#include <type_traits>

/// Runtime identity of an element type, used by the shadow memory-state tracker
/// to remember what a region is bound to.
/// There is exactly one descriptor per (cv-stripped) type, so descriptors compare by address.
struct pc::type_descriptor
{
    /// Human-readable type name, derived from the compiler's pretty function signature
    std::string_view name;

    /// sizeof(T), which is also the stride of T
    isize size = 0;

    /// alignof(T)
    isize alignment = 0;

    /// Trivially copyable and trivially destructible (see pc::is_trivial_element)
    bool is_trivial = false;
};

namespace pc
{
namespace impl
{
// extracts "int" from "... type_name_of() [with T = int; ...]" (gcc) or "... [T = int]" (clang)
// falls back to the full signature on other compilers
template <class T>
constexpr std::string_view type_name_of()
{
    std::string_view name = PC_PRETTY_FUNC;
    auto const start = name.find("T = ");
    if (start == std::string_view::npos)
        return name;
    name.remove_prefix(start + 4);
    return name.substr(0, name.find_first_of(";]"));
}

template <class T>
inline constexpr type_descriptor type_descriptor_for = {
    .name = type_name_of<T>(),
    .size = isize(sizeof(T)),
    .alignment = isize(alignof(T)),
    .is_trivial = is_trivial_element<T>,
};
} // namespace impl

/// Returns the unique descriptor of T
/// cv-qualifiers are ignored: type_of<int const>() == type_of<int>()
template <class T>
[[nodiscard]] constexpr type_descriptor const* type_of()
{
    return &impl::type_descriptor_for<std::remove_cv_t<T>>;
}
} // namespace pc
