#include <memo/core/exception.hpp>

#include <memo/core/testing.hpp>
#include <memo/utilities/text.hpp>

using namespace memo;

TEST_CASE("error info", "[core][exception]")
{
    parsing_error error;
    error << parsed_text_info("asdf");

    REQUIRE(get_required_error_info<parsed_text_info>(error) == "asdf");

    try
    {
        get_required_error_info<expected_format_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        get_required_error_info<wrapped_exception_diagnostics_info>(e);
    }
}

TEST_CASE("thrown exceptions carry stacktraces", "[core][exception]")
{
    try
    {
        MEMO_THROW(parsing_error() << parsed_text_info("xyz"));
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "xyz");
        get_required_error_info<stacktrace_info>(e);
        REQUIRE(string(e.what()).find("xyz") != string::npos);
    }
}

TEST_CASE("parse_as", "[core][utilities]")
{
    REQUIRE(parse_as<integer>("42", "integer") == 42);
    try
    {
        parse_as<integer>("forty-two", "integer");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "integer");
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "forty-two");
    }
}
