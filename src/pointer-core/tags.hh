#pragma once

namespace pc
{
/// Tag for the explicit const-removing conversions
/// Usage:
///   pc::mut_raw_ptr m(pc::mutating, read_only);
///   pc::typed_ptr<int> t(pc::mutating, typed_ptr<int const>(...));
struct mutating_t
{
    explicit constexpr mutating_t() = default;
};
inline constexpr mutating_t mutating{};

/// Tag for turning a slice into a zero-based buffer over the same memory
/// Usage:
///   auto tail = pc::typed_buffer<int>(pc::rebasing, buffer.slice(2, buffer.count()));
///   tail[0]; // same element as buffer[2]
struct rebasing_t
{
    explicit constexpr rebasing_t() = default;
};
inline constexpr rebasing_t rebasing{};
} // namespace pc
