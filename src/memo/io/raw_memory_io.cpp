#include <memo/io/raw_memory_io.hpp>

namespace memo {

void
raw_input_buffer::read(void* dst, size_t size)
{
    if (size > this->size_)
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "read past the end of the input buffer"));
    }
    if (size != 0)
        std::memcpy(dst, this->ptr_, size);
    this->advance(size);
}

} // namespace memo
