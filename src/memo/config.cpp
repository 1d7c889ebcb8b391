#include <memo/config.hpp>

#include <yaml-cpp/yaml.h>

#include <memo/fs/file_io.hpp>
#include <memo/utilities/environment.hpp>
#include <memo/utilities/text.hpp>

namespace memo {

static memo_placement
parse_placement(string const& name)
{
    if (name == "disabled")
        return memo_placement::DISABLED;
    if (name == "directory")
        return memo_placement::DIRECTORY;
    if (name == "in_place")
        return memo_placement::IN_PLACE;
    MEMO_THROW(
        invalid_memo_config() << internal_error_message_info(
            "unknown cache placement: " + name));
}

static std::chrono::milliseconds
parse_minimum_elapsed(string const& text)
{
    integer value = 0;
    try
    {
        value = parse_as<integer>(text, "integer");
    }
    catch (parsing_error&)
    {
        MEMO_THROW(
            invalid_memo_config() << internal_error_message_info(
                "invalid minimum elapsed time: " + text));
    }
    return std::chrono::milliseconds(value);
}

static void
read_cache_section(memo_config& config, YAML::Node const& cache)
{
    if (!cache.IsMap())
    {
        MEMO_THROW(
            invalid_memo_config() << internal_error_message_info(
                "'cache' must be a map"));
    }
    if (cache["directory"])
    {
        config.directory = cache["directory"].as<string>();
        config.placement = memo_placement::DIRECTORY;
    }
    if (cache["placement"])
        config.placement = parse_placement(cache["placement"].as<string>());
    if (cache["minimum_elapsed_ms"])
    {
        config.minimum_elapsed = parse_minimum_elapsed(
            cache["minimum_elapsed_ms"].as<string>());
    }
}

tool_config
parse_tool_config(string const& yaml)
{
    tool_config config;
    try
    {
        auto root = YAML::Load(yaml);
        if (root.IsMap())
        {
            if (root["cache"])
                read_cache_section(config.memo, root["cache"]);
            if (root["logging"] && root["logging"]["level"])
                config.log_level = root["logging"]["level"].as<string>();
        }
        else if (!root.IsNull())
        {
            MEMO_THROW(
                invalid_memo_config() << internal_error_message_info(
                    "config must be a map"));
        }
    }
    catch (YAML::Exception& e)
    {
        MEMO_THROW(
            invalid_memo_config() << internal_error_message_info(e.what()));
    }
    validate_memo_config(config.memo);
    return config;
}

tool_config
read_tool_config_file(file_path const& path)
{
    return parse_tool_config(read_file_contents(path));
}

void
apply_environment_overrides(tool_config& config)
{
    try
    {
        auto cache_dir = get_optional_environment_variable("MEMO_CACHE_DIR");
        if (cache_dir)
        {
            config.memo.placement = memo_placement::DIRECTORY;
            config.memo.directory = *cache_dir;
        }

        auto in_place = get_environment_flag("MEMO_IN_PLACE");
        if (in_place && *in_place)
            config.memo.placement = memo_placement::IN_PLACE;

        auto minimum_elapsed
            = get_environment_integer("MEMO_MINIMUM_ELAPSED_MS");
        if (minimum_elapsed)
        {
            config.memo.minimum_elapsed
                = std::chrono::milliseconds(*minimum_elapsed);
        }
    }
    catch (parsing_error& e)
    {
        MEMO_THROW(
            invalid_memo_config()
            << internal_error_message_info(
                   "invalid environment setting: "
                   + get_required_error_info<variable_name_info>(e)));
    }

    auto log_level = get_optional_environment_variable("MEMO_LOG_LEVEL");
    if (log_level)
        config.log_level = *log_level;

    validate_memo_config(config.memo);
}

} // namespace memo
