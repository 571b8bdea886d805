#pragma once

#include <cstddef>
#include <cstdint>


namespace pc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Byte offsets, counts and indices are signed (isize) throughout.
// Address arithmetic frequently subtracts, and "distance between two pointers" is naturally signed.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type, used for all byte counts, element counts, and offsets
using isize = i64;

// integer wide enough to hold an address (bit patterns)
using uptr = uintptr_t;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
struct arena_resource;
struct type_descriptor;
template <class T>
struct allocation;

//
// Handles
//

struct opaque_ptr;
struct raw_ptr;
struct mut_raw_ptr;
template <class T>
struct typed_ptr;

//
// Views
//

struct raw_buffer;
struct mut_raw_buffer;
template <class T>
struct typed_buffer;
template <class Buffer>
struct buffer_slice;

//
// Utility
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct mutex;

} // namespace pc
