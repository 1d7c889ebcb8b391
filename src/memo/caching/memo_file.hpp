#ifndef MEMO_CACHING_MEMO_FILE_HPP
#define MEMO_CACHING_MEMO_FILE_HPP

#include <memo/caching/fingerprint.hpp>
#include <memo/utilities/errors.hpp>

// This file defines the on-disk format of memo files and the checks that
// decide whether a memo file can be trusted.
//
// A memo file is laid out as follows. (All integers are big-endian.)
//
//   format_version    uint32  - memo_format_version
//   state_version     uint32  - the wrapped reader's state version
//   source size       uint64  \ the fingerprint of the source at the time
//   source mtime      uint64  / the state was captured
//   body_length       uint64
//   body_crc32        uint32
//   body              body_length bytes, as follows:
//     companion_count   uint32
//     companions        companion_count times:
//       path              uint32 length + UTF-8 bytes
//       present           uint8 (0 if the file didn't exist)
//       size              uint64 \ (zero when not present)
//       mtime             uint64 /
//     payload           the rest of the body (the reader's state)
//
// The version fields come first so that future formats can change everything
// after them.

namespace memo {

// the version of the layout described above
extern uint32_t const memo_format_version;

// the size of everything before the payload
extern size_t const memo_header_size;

struct memo_header
{
    uint32_t format_version = 0;
    uint32_t state_version = 0;
    source_fingerprint fingerprint;
    uint64_t body_length = 0;
    uint32_t body_crc32 = 0;
};

// the verdict on a memo file
enum class memo_validity
{
    // The memo file can be trusted.
    VALID,
    // There's no memo file.
    ABSENT,
    // The memo file exists but couldn't be read.
    UNREADABLE,
    // The memo file was written by a different memo format or a different
    // version of the reader.
    INCOMPATIBLE,
    // The source has changed since the memo file was written.
    STALE,
    // The memo file is truncated or damaged.
    CORRUPT
};

char const*
to_string(memo_validity validity);

// Encode a complete memo file.
// :companions are the other files that the reader's state was built from.
string
encode_memo_file(
    source_fingerprint const& fingerprint,
    uint32_t state_version,
    string const& payload,
    std::vector<companion_fingerprint> const& companions
    = std::vector<companion_fingerprint>());

// Decode the header at the start of :contents.
// This throws corrupt_data if :contents is too short to hold a header.
memo_header
decode_memo_header(string const& contents);

struct memo_file_contents
{
    memo_validity validity = memo_validity::ABSENT;
    // the reader state stored in the file (only present when VALID)
    optional<string> payload;
};

// Read the memo file at :memo_path and check it against the current
// fingerprint of its source and the version of the reader that wants to use
// it. The payload is returned only if the file is VALID.
//
// If any companion file recorded in the memo file has changed (or appeared
// or disappeared) since, the memo file is STALE.
//
// Everything is checked on a single read of the file, so a concurrent
// replacement of the memo file can't pair one file's header with another's
// payload. Nothing here throws: any failure is reported as a validity.
//
memo_file_contents
read_memo_file(
    file_path const& memo_path,
    source_fingerprint const& fingerprint,
    uint32_t state_version);

// Check the memo file at :memo_path against the source at :source.
// (If the source's fingerprint can't be determined, the memo is STALE.)
memo_validity
check_memo_file(
    file_path const& memo_path,
    file_path const& source,
    uint32_t state_version);

// Same as above, but only answers whether the memo file can be trusted.
bool
is_valid_memo_file(
    file_path const& memo_path,
    file_path const& source,
    uint32_t state_version);

// Atomically write a memo file to :memo_path, creating its parent directory
// if necessary. Readers of :memo_path will see either the previous file (if
// any) or the complete new one.
//
// This throws if the write fails. No partial file is left behind.
//
void
write_memo_file(
    file_path const& memo_path,
    source_fingerprint const& fingerprint,
    uint32_t state_version,
    string const& payload,
    std::vector<companion_fingerprint> const& companions
    = std::vector<companion_fingerprint>());

} // namespace memo

#endif
