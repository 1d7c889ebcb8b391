#ifndef MEMO_CACHING_MEMO_PATH_HPP
#define MEMO_CACHING_MEMO_PATH_HPP

#include <memo/caching/config.hpp>

namespace memo {

// Get the file name of the memo file for :source.
// This is the source's own file name, hidden and suffixed with
// memo_file_extension, e.g., ".image.tif.bfmemo".
file_path
get_memo_file_name(file_path const& source);

// Get the canonical form of :source that's used to place its memo file.
// This is its absolute, lexically normalized path.
// (Symbolic links are NOT resolved, so a source opened through two different
// links gets two different memo files.)
optional<file_path>
get_canonical_source_path(file_path const& source);

// Determine where the memo file for :source should live under :config.
//
// The result is none if memoization is disabled, if :config names a cache
// root that isn't an existing directory, or if :source doesn't name a file.
//
// Under DIRECTORY placement, the memo file is placed at
//
//   <cache root>/<source directory minus its root>/<memo file name>
//
// so that sources with the same file name in different directories never
// share a memo file. (When the cache root is the filesystem root itself, this
// is the same as IN_PLACE placement.)
//
// This never creates anything. The only filesystem access is checking that
// the cache root exists.
//
optional<file_path>
resolve_memo_path(file_path const& source, memo_config const& config);

} // namespace memo

#endif
