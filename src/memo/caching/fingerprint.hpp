#ifndef MEMO_CACHING_FINGERPRINT_HPP
#define MEMO_CACHING_FINGERPRINT_HPP

#include <cstdint>
#include <vector>

#include <memo/fs/types.hpp>

namespace memo {

// A source fingerprint is a cheap signature of a source file's contents.
// If the file is modified, its fingerprint changes (assuming the change
// affects either its size or its modification time).
struct source_fingerprint
{
    // the size of the file (in bytes)
    uint64_t size = 0;
    // the file's last modification time, in nanoseconds since the
    // filesystem clock's epoch
    uint64_t modification_time = 0;
};

inline bool
operator==(source_fingerprint const& a, source_fingerprint const& b)
{
    return a.size == b.size && a.modification_time == b.modification_time;
}
inline bool
operator!=(source_fingerprint const& a, source_fingerprint const& b)
{
    return !(a == b);
}

// Get the fingerprint of the file at :source.
// If :source isn't an existing regular file (or can't be inspected), this
// returns none.
optional<source_fingerprint>
get_source_fingerprint(file_path const& source);

// the recorded state of a file that a reader's state depends on
struct companion_fingerprint
{
    file_path path;
    // none if the file didn't exist
    optional<source_fingerprint> fingerprint;
};

inline bool
operator==(companion_fingerprint const& a, companion_fingerprint const& b)
{
    return a.path == b.path && a.fingerprint == b.fingerprint;
}
inline bool
operator!=(companion_fingerprint const& a, companion_fingerprint const& b)
{
    return !(a == b);
}

// Get the current fingerprints of :files.
std::vector<companion_fingerprint>
get_companion_fingerprints(std::vector<file_path> const& files);

// Are all of :companions still as they were recorded?
bool
companions_unchanged(std::vector<companion_fingerprint> const& companions);

} // namespace memo

#endif
