#include <memo/caching/fingerprint.hpp>

#include <chrono>
#include <system_error>

namespace memo {

optional<source_fingerprint>
get_source_fingerprint(file_path const& source)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(source, error) || error)
        return none;

    auto size = std::filesystem::file_size(source, error);
    if (error)
        return none;

    auto modified = std::filesystem::last_write_time(source, error);
    if (error)
        return none;

    source_fingerprint fingerprint;
    fingerprint.size = size;
    fingerprint.modification_time = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            modified.time_since_epoch())
            .count());
    return fingerprint;
}

std::vector<companion_fingerprint>
get_companion_fingerprints(std::vector<file_path> const& files)
{
    std::vector<companion_fingerprint> companions;
    companions.reserve(files.size());
    for (auto const& file : files)
    {
        companion_fingerprint companion;
        companion.path = file;
        companion.fingerprint = get_source_fingerprint(file);
        companions.push_back(std::move(companion));
    }
    return companions;
}

bool
companions_unchanged(std::vector<companion_fingerprint> const& companions)
{
    for (auto const& companion : companions)
    {
        if (get_source_fingerprint(companion.path) != companion.fingerprint)
            return false;
    }
    return true;
}

} // namespace memo
