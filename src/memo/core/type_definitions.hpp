#ifndef MEMO_CORE_TYPE_DEFINITIONS_HPP
#define MEMO_CORE_TYPE_DEFINITIONS_HPP

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>

namespace memo {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

} // namespace memo

#endif
