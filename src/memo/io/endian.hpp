#ifndef MEMO_IO_ENDIAN_HPP
#define MEMO_IO_ENDIAN_HPP

#include <cstdint>

// Detect architecture endianness and set either MEMO_BIG_ENDIAN or
// MEMO_LITTLE_ENDIAN.
#ifdef _WIN32
#define MEMO_LITTLE_ENDIAN
#else
#include <endian.h>
#if __BYTE_ORDER == __BIG_ENDIAN
#define MEMO_BIG_ENDIAN
#elif __BYTE_ORDER == __LITTLE_ENDIAN
#define MEMO_LITTLE_ENDIAN
#else
#error "unknown architecture: endianness detection failed"
#endif
#endif

namespace memo {

// Swap the endian of a single 8-bit word.
// This is defined so that generic code doesn't break if it attempts to use it.
inline void
swap_endian(uint8_t*)
{
}

// Swap the endian of a single 16-bit word.
void
swap_endian(uint16_t* word);

// Swap the endian of a single 32-bit word.
void
swap_endian(uint32_t* word);

// Swap the endian of a single 64-bit word.
void
swap_endian(uint64_t* word);

// Swap the endian of a single 8-bit word if the machine is little endian.
// This is defined so that generic code doesn't break if it attempts to use it.
inline void
swap_on_little_endian(uint8_t*)
{
}

// Swap the endian of a single 16-bit word if the machine is little endian.
void
swap_on_little_endian(uint16_t* word);

// Swap the endian of a single 32-bit word if the machine is little endian.
void
swap_on_little_endian(uint32_t* word);

// Swap the endian of a single 64-bit word if the machine is little endian.
void
swap_on_little_endian(uint64_t* word);

// Swap the endian of a single 16-bit word.
uint16_t
swap_uint16_endian(uint16_t word);

// Swap the endian of a single 32-bit word.
uint32_t
swap_uint32_endian(uint32_t word);

// Swap the endian of a single 64-bit word.
uint64_t
swap_uint64_endian(uint64_t word);

} // namespace memo

#endif
