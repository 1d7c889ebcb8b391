#ifndef MEMO_CACHING_CONFIG_HPP
#define MEMO_CACHING_CONFIG_HPP

#include <chrono>

#include <memo/fs/types.hpp>
#include <memo/utilities/errors.hpp>

namespace memo {

// the extension given to memo files (after the source's own file name)
extern char const* const memo_file_extension;

// the default value of memo_config::minimum_elapsed
constexpr std::chrono::milliseconds default_minimum_elapsed{100};

// where memo files are placed
enum class memo_placement
{
    // No memo files are read or written.
    DISABLED,
    // Memo files live under an explicit cache root, in a subdirectory that
    // mirrors the source's own directory.
    DIRECTORY,
    // Memo files live beside their sources.
    IN_PLACE
};

char const*
to_string(memo_placement placement);

struct memo_config
{
    // A default-constructed config disables memoization.
    memo_placement placement = memo_placement::DISABLED;

    // the cache root - This is only used when placement is DIRECTORY.
    file_path directory;

    // Initializations that take less time than this aren't worth the cost of
    // writing a memo file, so they're never memoized. A threshold of zero
    // memoizes everything.
    std::chrono::milliseconds minimum_elapsed = default_minimum_elapsed;
};

// Get a config that places memo files under :directory.
memo_config
memo_config_for_directory(
    file_path const& directory,
    std::chrono::milliseconds minimum_elapsed = default_minimum_elapsed);

// Get a config that places memo files beside their sources.
memo_config
in_place_memo_config(
    std::chrono::milliseconds minimum_elapsed = default_minimum_elapsed);

// This exception indicates a config that can't be used.
MEMO_DEFINE_EXCEPTION(invalid_memo_config)

// Check that :config is usable, throwing invalid_memo_config if it isn't.
// Note that a DIRECTORY config naming a directory that doesn't exist is
// valid. Such a config simply never yields a memo path.
void
validate_memo_config(memo_config const& config);

} // namespace memo

#endif
