#ifndef MEMO_UTILITIES_ENVIRONMENT_HPP
#define MEMO_UTILITIES_ENVIRONMENT_HPP

#include <memo/core/exception.hpp>

namespace memo {

// Get the value of an environment variable.
string
get_environment_variable(string const& name);
// If the variable isn't set, the following exception is thrown.
MEMO_DEFINE_EXCEPTION(missing_environment_variable)
MEMO_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an optional environment variable.
// If the variable isn't set, this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// Get the value of an environment variable that holds a yes/no setting.
// "1", "true", "yes" and "on" mean true. "0", "false", "no" and "off" mean
// false. (Case doesn't matter.) If the variable isn't set, this returns none.
// Any other value throws a parsing_error.
optional<bool>
get_environment_flag(string const& name);

// Get the value of an environment variable that holds an integer.
// If the variable isn't set, this returns none. If it's set to something
// that isn't an integer, a parsing_error is thrown.
optional<integer>
get_environment_integer(string const& name);

// Set the value of an environment variable.
// Setting it to an empty string removes it.
void
set_environment_variable(string const& name, string const& value);

} // namespace memo

#endif
