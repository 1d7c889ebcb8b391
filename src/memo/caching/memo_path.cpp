#include <memo/caching/memo_path.hpp>

#include <system_error>

#include <memo/fs/utilities.hpp>

namespace memo {

file_path
get_memo_file_name(file_path const& source)
{
    return "." + source.filename().string() + "." + memo_file_extension;
}

optional<file_path>
get_canonical_source_path(file_path const& source)
{
    if (source.empty())
        return none;
    std::error_code error;
    auto absolute_path = std::filesystem::absolute(source, error);
    if (error)
        return none;
    auto canonical = absolute_path.lexically_normal();
    if (!canonical.has_filename())
        return none;
    return canonical;
}

optional<file_path>
resolve_memo_path(file_path const& source, memo_config const& config)
{
    if (config.placement == memo_placement::DISABLED)
        return none;

    auto canonical_source = get_canonical_source_path(source);
    if (!canonical_source)
        return none;

    auto memo_file_name = get_memo_file_name(*canonical_source);
    auto source_dir = canonical_source->parent_path();

    switch (config.placement)
    {
        case memo_placement::IN_PLACE:
            return source_dir / memo_file_name;

        case memo_placement::DIRECTORY: {
            if (config.directory.empty()
                || !is_existing_directory(config.directory))
            {
                return none;
            }
            // relative_path() strips both the root name (e.g., a Windows
            // drive) and the root directory.
            return config.directory / source_dir.relative_path()
                   / memo_file_name;
        }

        case memo_placement::DISABLED:
        default:
            return none;
    }
}

} // namespace memo
