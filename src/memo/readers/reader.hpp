#ifndef MEMO_READERS_READER_HPP
#define MEMO_READERS_READER_HPP

#include <cstdint>
#include <vector>

#include <memo/fs/types.hpp>
#include <memo/utilities/errors.hpp>

namespace memo {

// This exception indicates an attempt to access the state of a reader that
// isn't initialized.
MEMO_DEFINE_EXCEPTION(reader_uninitialized)

// reader_interface is what the memoizer needs from a reader: a way to do the
// expensive initialization, a way to release what it produced, and a way to
// capture and restore the resulting state.
//
// The memoizer treats the captured state as an opaque string of bytes. It
// never looks inside.
//
struct reader_interface
{
    virtual ~reader_interface()
    {
    }

    // Do the full (expensive) initialization of the reader for :source.
    // Any exception thrown here propagates out of memoizer::open().
    virtual void
    initialize(file_path const& source)
        = 0;

    // Release the reader's state and any resources it holds.
    // This must be safe to call at any time, including repeatedly and after a
    // failed initialization.
    virtual void
    close()
        = 0;

    // Does the reader currently hold initialized state?
    virtual bool
    is_initialized() const = 0;

    // Get the version of the reader's state format.
    // Memo files written with a different version are never used, so this
    // must change whenever serialize_state() starts producing something that
    // an older deserialize_state() wouldn't understand (or vice versa).
    virtual uint32_t
    state_version() const = 0;

    // Get the files (other than the source itself) that the reader's state
    // was built from. A memo file is only valid while all of these are
    // unchanged. A listed file that doesn't exist is recorded as absent, so
    // creating it later also invalidates the memo file.
    // This is only called when is_initialized() is true.
    virtual std::vector<file_path>
    used_files() const = 0;

    // Capture the reader's initialized state.
    // This is only called when is_initialized() is true.
    virtual string
    serialize_state() const = 0;

    // Restore state previously captured by serialize_state().
    // If :state can't be decoded, this should throw corrupt_data and leave the
    // reader uninitialized.
    virtual void
    deserialize_state(string const& state)
        = 0;
};

} // namespace memo

#endif
