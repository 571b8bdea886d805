#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>

/// Sub-range of a buffer view that keeps the parent's indices
///
/// A slice of [first, last) is indexed with first..<last, not 0..<(last - first).
/// Slicing a slice keeps the original parent and its indices.
/// To get a zero-based view over the same memory, rebase: Buffer(pc::rebasing, slice).
///
/// Usage:
///   auto s = buffer.slice(2, 5);
///   s[2];                                          // same element as buffer[2]
///   s[0];                                          // precondition violation
///   auto b = pc::typed_buffer<int>(pc::rebasing, s);
///   b[0];                                          // same element as buffer[2]
template <class Buffer>
struct pc::buffer_slice
{
    using buffer_type = Buffer;

    // construction
public:
    /// Preconditions: 0 <= start <= end <= base.count()
    buffer_slice(Buffer base, isize start, isize end) : _base(base), _start(start), _end(end)
    {
        PC_ASSERT(0 <= start && start <= end && end <= base.count(), "slice bounds out of range");
    }

    // queries
public:
    /// The buffer this slice was taken from
    [[nodiscard]] Buffer base() const { return _base; }

    [[nodiscard]] isize start_index() const { return _start; }
    [[nodiscard]] isize end_index() const { return _end; }
    [[nodiscard]] isize count() const { return _end - _start; }
    [[nodiscard]] bool empty() const { return _start == _end; }

    // access
public:
    /// Precondition: start_index() <= i < end_index()
    [[nodiscard]] decltype(auto) operator[](isize i) const
    {
        PC_ASSERT(_start <= i && i < _end, "slice index out of bounds (slices use their parent's indices)");
        return _base[i];
    }

    /// Sub-slice in parent indices
    /// Preconditions: start_index() <= first <= last <= end_index()
    [[nodiscard]] buffer_slice slice(isize first, isize last) const
    {
        PC_ASSERT(_start <= first && first <= last && last <= _end, "slice bounds out of range");
        return buffer_slice(_base, first, last);
    }

    [[nodiscard]] auto begin() const { return _base.begin() + _start; }
    [[nodiscard]] auto end() const { return _base.begin() + _end; }

private:
    Buffer _base;
    isize _start;
    isize _end;
};
