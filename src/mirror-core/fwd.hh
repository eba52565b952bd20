#pragma once

#include <cstddef>
#include <cstdint>


namespace mc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We encourage using these types wherever the range is important for correctness or memory layout.
// However, we happily use "int" as a default integer if the range doesn't matter much
// (e.g. loop counters or small counts).

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

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, indices and the ring offsets (head, tail) are signed i64.
// The deque computes differences like "n - idx - 1" and shifts its window by -capacity,
// which is only pleasant to write with signed integers.
// We only target 64-bit platforms, so i64 provides plenty of range.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Mirrored memory
//

enum class mirror_error : u8;
struct mirror_backend;
struct allocation_cache;

template <class T>
struct mirrored_buffer;

//
// Vocabulary types
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class E>
struct result;

template <class T>
struct mutex;

//
// Container
//

template <class T>
struct ring_deque;

} // namespace mc
