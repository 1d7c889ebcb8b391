#include <memo/utilities/environment.hpp>

#include <cstdlib>

#include <boost/algorithm/string/case_conv.hpp>

#include <memo/utilities/text.hpp>

namespace memo {

string
get_environment_variable(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
    {
        MEMO_THROW(missing_environment_variable() << variable_name_info(name));
    }
    return *value;
}

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    return value && *value != '\0' ? some(string(value)) : none;
}

optional<bool>
get_environment_flag(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
        return none;
    auto flag = boost::to_lower_copy(*value);
    if (flag == "1" || flag == "true" || flag == "yes" || flag == "on")
        return true;
    if (flag == "0" || flag == "false" || flag == "no" || flag == "off")
        return false;
    MEMO_THROW(
        parsing_error() << expected_format_info("boolean flag")
                        << parsed_text_info(*value)
                        << variable_name_info(name));
}

optional<integer>
get_environment_integer(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
        return none;
    try
    {
        return parse_as<integer>(*value, "integer");
    }
    catch (parsing_error& e)
    {
        e << variable_name_info(name);
        throw;
    }
}

void
set_environment_variable(string const& name, string const& value)
{
#ifdef _WIN32
    auto assignment = name + "=" + value;
    _putenv(assignment.c_str());
#else
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
#endif
}

} // namespace memo
