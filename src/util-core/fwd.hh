#pragma once

#include <cstddef>
#include <cstdint>


namespace uc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range is important for correctness or memory layout.
// Plain "int" is fine where the range doesn't matter much (loop counters, shift amounts).

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

// signed size type
// Sizes and indices are signed so that "size - 1", index differences and
// "row < rows" comparisons never silently wrap around.
// All containers and views in util-core report their sizes as isize.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, isize N>
struct fixed_array;

template <class T>
struct grid;

//
// Algorithms
//

struct search_result;

//
// Digests
//

struct sha256;
struct md5;

} // namespace uc
