#pragma once

#include <cstddef>
#include <cstdint>


namespace oc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Use these wherever the range matters (element counts, indices, numeric payloads).
// Plain "int" is fine for small loop counters.

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

// signed size type
// Indices and lengths are signed on purpose:
// * negative indices are part of the collection API ("offset from the end")
// * index arithmetic like "length + start" or "end - start" must not wrap around
// * -1 is the "not found" result of find_index / index_of / last_index_of
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Utility
//

struct nullopt_t;
template <class T>
struct optional;

struct index_range;

//
// Values
//

struct value;

//
// Container
//

template <class T>
struct collection;

template <class T>
struct entry;

// the heterogeneous variant: a collection over "any value"
using dynamic_collection = collection<value>;

namespace impl
{
template <class T>
struct element_buffer;
} // namespace impl

} // namespace oc
