#ifndef MEMO_FS_UTILITIES_HPP
#define MEMO_FS_UTILITIES_HPP

#include <memo/fs/types.hpp>

namespace memo {

// Remove :dir (if it exists) and recreate it empty.
void
reset_directory(file_path const& dir);

// Is :path an existing directory?
// Any error while checking (e.g., permissions) counts as "no".
bool
is_existing_directory(file_path const& path);

// Remove the file at :path if it's there.
// Returns true iff a file was actually removed. Errors are reported as false.
bool
remove_file_quietly(file_path const& path);

} // namespace memo

#endif
