#ifndef MEMO_UTILITIES_ERRORS_HPP
#define MEMO_UTILITIES_ERRORS_HPP

#include <memo/core/exception.hpp>

namespace memo {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
MEMO_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace memo

#endif
