#ifndef MEMO_UTILITIES_TEXT_HPP
#define MEMO_UTILITIES_TEXT_HPP

#include <boost/lexical_cast.hpp>

#include <memo/core/exception.hpp>

namespace memo {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
MEMO_DEFINE_EXCEPTION(parsing_error)
MEMO_DEFINE_ERROR_INFO(string, expected_format)
MEMO_DEFINE_ERROR_INFO(string, parsed_text)

// Parse :text as a value of type T, throwing a parsing_error that describes
// :expected_format if it isn't one.
template<class T>
T
parse_as(string const& text, string const& expected_format)
{
    try
    {
        return lexical_cast<T>(text);
    }
    catch (boost::bad_lexical_cast&)
    {
        MEMO_THROW(
            parsing_error() << expected_format_info(expected_format)
                            << parsed_text_info(text));
    }
}

} // namespace memo

#endif
