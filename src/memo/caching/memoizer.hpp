#ifndef MEMO_CACHING_MEMOIZER_HPP
#define MEMO_CACHING_MEMOIZER_HPP

#include <chrono>
#include <memory>

#include <memo/caching/config.hpp>
#include <memo/caching/memo_file.hpp>
#include <memo/readers/reader.hpp>

// A memoizer wraps a reader whose initialization is expensive. When a source
// is opened, the memoizer first looks for a memo file holding a previously
// captured copy of the reader's state for that source. If it finds a valid
// one, the reader's state is restored from it and the expensive
// initialization is skipped entirely. Otherwise, the reader is initialized
// normally and, if that took long enough to be worth it, its state is captured
// in a memo file for next time.
//
// Memoization is purely an optimization. Callers see the same reader state
// whether or not a memo file was involved, and no failure related to memo
// files ever escapes from the memoizer. (Those failures are logged and
// reported in the memo_report.) The only errors that open() throws are those
// thrown by the reader's own initialization.
//
// A memoizer is NOT internally synchronized. However, any number of
// memoizers (in this process or others) can safely share memo files, since
// memo files are replaced atomically and any memo file that can't be read is
// simply treated as missing.

namespace memo {

// what the memoizer found when it looked for a memo file
enum class memo_lookup
{
    // Memoization is disabled (or there's nowhere to put the memo file).
    DISABLED,
    // The source doesn't exist (or can't be inspected), so it can't be
    // fingerprinted.
    NO_FINGERPRINT,
    // There's no memo file.
    ABSENT,
    // The memo file exists but couldn't be read.
    UNREADABLE,
    // The memo file was written by an incompatible memo format or reader.
    INCOMPATIBLE,
    // The source has changed since the memo file was written.
    STALE,
    // The memo file (or the reader state inside it) is damaged.
    CORRUPT,
    // The reader's state was restored from the memo file.
    HIT
};

char const*
to_string(memo_lookup lookup);

// what the memoizer did about writing a memo file
enum class memo_write
{
    // No write was considered (because of a hit or because memoization isn't
    // possible for the source).
    NOT_ATTEMPTED,
    // Initialization was faster than the configured minimum, so it wasn't
    // worth writing a memo file.
    BELOW_THRESHOLD,
    // A memo file was written.
    WRITTEN,
    // Writing the memo file failed. (The failure was logged.)
    FAILED
};

char const*
to_string(memo_write write);

struct memo_report
{
    memo_lookup lookup = memo_lookup::DISABLED;
    memo_write write = memo_write::NOT_ATTEMPTED;
    // where the memo file for the source lives (if anywhere)
    optional<file_path> memo_path;
    // how long the reader's initialization took (zero on a hit)
    std::chrono::nanoseconds initialization_time{0};
};

// This exception indicates that a memoizer was created without a reader.
MEMO_DEFINE_EXCEPTION(missing_reader)

struct memoizer : boost::noncopyable
{
    // Create a memoizer that never memoizes. (It simply forwards to
    // :reader.)
    explicit memoizer(std::unique_ptr<reader_interface> reader);

    // Create a memoizer with the given config.
    // This throws invalid_memo_config if :config isn't usable.
    memoizer(
        std::unique_ptr<reader_interface> reader, memo_config const& config);

    // Closes the current source (if any).
    ~memoizer();

    memo_config const&
    config() const
    {
        return config_;
    }

    // Get the path of the memo file that would be used for :source, or none
    // if memoization isn't possible for it. This has no side effects.
    optional<file_path>
    get_memo_path(file_path const& source) const;

    // Open :source, restoring the reader's state from a memo file if
    // possible and initializing the reader (and possibly writing a memo file)
    // otherwise.
    //
    // If another source is open, it's closed first.
    //
    // If the reader's initialization throws, the reader is closed, no memo
    // file is written, and the exception propagates.
    //
    memo_report
    open(file_path const& source);

    // Close the current source, releasing the reader's state.
    // Calling this when nothing is open does nothing.
    void
    close();

    // Is a source currently open?
    bool
    is_open() const
    {
        return state_ == memoizer_state::OPENED;
    }

    // Get the wrapped reader. Its state is only meaningful while is_open().
    reader_interface&
    reader()
    {
        return *reader_;
    }
    reader_interface const&
    reader() const
    {
        return *reader_;
    }

    // the source that's currently open (if any)
    optional<file_path> const&
    current_source() const
    {
        return current_source_;
    }

    // the report from the most recent successful open()
    memo_report const&
    last_report() const
    {
        return last_report_;
    }

    // Was the current source's state restored from a memo file?
    bool
    loaded_from_memo() const;

    // Was a memo file written when the current source was opened?
    bool
    saved_to_memo() const;

 private:
    enum class memoizer_state
    {
        UNINITIALIZED,
        OPENED,
        CLOSED
    };

    memo_lookup
    load_from_memo(
        file_path const& memo_path, source_fingerprint const& fingerprint);

    memo_write
    save_to_memo(
        file_path const& memo_path,
        source_fingerprint const& fingerprint,
        std::chrono::nanoseconds initialization_time);

    std::unique_ptr<reader_interface> reader_;
    memo_config config_;
    memoizer_state state_ = memoizer_state::UNINITIALIZED;
    optional<file_path> current_source_;
    memo_report last_report_;
};

} // namespace memo

#endif
