#include <memo/caching/config.hpp>

namespace memo {

char const* const memo_file_extension = "bfmemo";

char const*
to_string(memo_placement placement)
{
    switch (placement)
    {
        case memo_placement::DISABLED:
        default:
            return "disabled";
        case memo_placement::DIRECTORY:
            return "directory";
        case memo_placement::IN_PLACE:
            return "in_place";
    }
}

memo_config
memo_config_for_directory(
    file_path const& directory, std::chrono::milliseconds minimum_elapsed)
{
    memo_config config;
    config.placement = memo_placement::DIRECTORY;
    config.directory = directory;
    config.minimum_elapsed = minimum_elapsed;
    return config;
}

memo_config
in_place_memo_config(std::chrono::milliseconds minimum_elapsed)
{
    memo_config config;
    config.placement = memo_placement::IN_PLACE;
    config.minimum_elapsed = minimum_elapsed;
    return config;
}

void
validate_memo_config(memo_config const& config)
{
    if (config.minimum_elapsed.count() < 0)
    {
        MEMO_THROW(
            invalid_memo_config() << internal_error_message_info(
                "minimum elapsed time must not be negative"));
    }
    if (config.placement == memo_placement::DIRECTORY
        && config.directory.empty())
    {
        MEMO_THROW(
            invalid_memo_config() << internal_error_message_info(
                "directory placement requires a directory"));
    }
}

} // namespace memo
