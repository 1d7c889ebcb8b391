#include <memo/io/endian.hpp>

namespace memo {

uint16_t
swap_uint16_endian(uint16_t word)
{
    return uint16_t((word >> 8) | (word << 8));
}

uint32_t
swap_uint32_endian(uint32_t word)
{
    return (word >> 24) | ((word >> 8) & 0x0000ff00)
           | ((word << 8) & 0x00ff0000) | (word << 24);
}

uint64_t
swap_uint64_endian(uint64_t word)
{
    return (uint64_t(swap_uint32_endian(uint32_t(word))) << 32)
           | swap_uint32_endian(uint32_t(word >> 32));
}

void
swap_endian(uint16_t* word)
{
    *word = swap_uint16_endian(*word);
}

void
swap_endian(uint32_t* word)
{
    *word = swap_uint32_endian(*word);
}

void
swap_endian(uint64_t* word)
{
    *word = swap_uint64_endian(*word);
}

#ifdef MEMO_LITTLE_ENDIAN

void
swap_on_little_endian(uint16_t* word)
{
    swap_endian(word);
}

void
swap_on_little_endian(uint32_t* word)
{
    swap_endian(word);
}

void
swap_on_little_endian(uint64_t* word)
{
    swap_endian(word);
}

#else

void
swap_on_little_endian(uint16_t*)
{
}

void
swap_on_little_endian(uint32_t*)
{
}

void
swap_on_little_endian(uint64_t*)
{
}

#endif

} // namespace memo
