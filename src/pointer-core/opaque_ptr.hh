#pragma once

#include <pointer-core/assert.hh>
#include <pointer-core/fwd.hh>
#include <pointer-core/optional.hh>

/// Type-erased, non-null address for C interop
/// Carries no element type and no mutability, it is only ever converted back.
/// Usage:
///   void* user_data = ...;                      // from a C callback
///   auto o = pc::opaque_ptr::from(user_data);   // optional, empty for null
///   auto p = pc::typed_ptr<widget>(o.value());  // back to a typed handle
struct pc::opaque_ptr
{
    // construction
public:
    /// Precondition: p != nullptr
    explicit opaque_ptr(void* p) : _ptr(p) { PC_ASSERT(p != nullptr, "opaque_ptr must not be null"); }

    [[nodiscard]] static optional<opaque_ptr> from(void* p)
    {
        if (p == nullptr)
            return nullopt;
        return opaque_ptr(p);
    }

    // access
public:
    [[nodiscard]] void* get() const { return _ptr; }
    [[nodiscard]] uptr bit_pattern() const { return reinterpret_cast<uptr>(_ptr); }

    [[nodiscard]] friend bool operator==(opaque_ptr lhs, opaque_ptr rhs) { return lhs._ptr == rhs._ptr; }

private:
    void* _ptr;
};
