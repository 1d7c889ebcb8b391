#include <memo/caching/memoizer.hpp>

#include <memo/caching/memo_path.hpp>
#include <memo/core/logging.hpp>
#include <memo/fs/utilities.hpp>

namespace memo {

char const*
to_string(memo_lookup lookup)
{
    switch (lookup)
    {
        case memo_lookup::DISABLED:
        default:
            return "disabled";
        case memo_lookup::NO_FINGERPRINT:
            return "no_fingerprint";
        case memo_lookup::ABSENT:
            return "absent";
        case memo_lookup::UNREADABLE:
            return "unreadable";
        case memo_lookup::INCOMPATIBLE:
            return "incompatible";
        case memo_lookup::STALE:
            return "stale";
        case memo_lookup::CORRUPT:
            return "corrupt";
        case memo_lookup::HIT:
            return "hit";
    }
}

char const*
to_string(memo_write write)
{
    switch (write)
    {
        case memo_write::NOT_ATTEMPTED:
        default:
            return "not_attempted";
        case memo_write::BELOW_THRESHOLD:
            return "below_threshold";
        case memo_write::WRITTEN:
            return "written";
        case memo_write::FAILED:
            return "failed";
    }
}

static memo_lookup
to_lookup(memo_validity validity)
{
    switch (validity)
    {
        case memo_validity::VALID:
            return memo_lookup::HIT;
        case memo_validity::ABSENT:
        default:
            return memo_lookup::ABSENT;
        case memo_validity::UNREADABLE:
            return memo_lookup::UNREADABLE;
        case memo_validity::INCOMPATIBLE:
            return memo_lookup::INCOMPATIBLE;
        case memo_validity::STALE:
            return memo_lookup::STALE;
        case memo_validity::CORRUPT:
            return memo_lookup::CORRUPT;
    }
}

// Is :lookup the result of finding a memo file that will never be usable?
static bool
is_discardable(memo_lookup lookup)
{
    return lookup == memo_lookup::INCOMPATIBLE || lookup == memo_lookup::STALE
           || lookup == memo_lookup::CORRUPT;
}

memoizer::memoizer(std::unique_ptr<reader_interface> reader)
    : memoizer(std::move(reader), memo_config())
{
}

memoizer::memoizer(
    std::unique_ptr<reader_interface> reader, memo_config const& config)
    : reader_(std::move(reader)), config_(config)
{
    if (!reader_)
        MEMO_THROW(missing_reader());
    validate_memo_config(config_);
}

memoizer::~memoizer()
{
    close();
}

optional<file_path>
memoizer::get_memo_path(file_path const& source) const
{
    return resolve_memo_path(source, config_);
}

memo_lookup
memoizer::load_from_memo(
    file_path const& memo_path, source_fingerprint const& fingerprint)
{
    auto contents
        = read_memo_file(memo_path, fingerprint, reader_->state_version());
    if (contents.validity != memo_validity::VALID)
        return to_lookup(contents.validity);

    try
    {
        reader_->deserialize_state(*contents.payload);
        return memo_lookup::HIT;
    }
    catch (std::exception& e)
    {
        get_memo_logger()->warn(
            "unable to restore state from memo file {}: {}",
            memo_path.string(),
            e.what());
        reader_->close();
        return memo_lookup::CORRUPT;
    }
}

memo_write
memoizer::save_to_memo(
    file_path const& memo_path,
    source_fingerprint const& fingerprint,
    std::chrono::nanoseconds initialization_time)
{
    if (initialization_time < config_.minimum_elapsed)
        return memo_write::BELOW_THRESHOLD;

    try
    {
        write_memo_file(
            memo_path,
            fingerprint,
            reader_->state_version(),
            reader_->serialize_state(),
            get_companion_fingerprints(reader_->used_files()));
        return memo_write::WRITTEN;
    }
    catch (std::exception& e)
    {
        get_memo_logger()->warn(
            "unable to write memo file {}: {}", memo_path.string(), e.what());
        return memo_write::FAILED;
    }
}

memo_report
memoizer::open(file_path const& source)
{
    close();

    auto logger = get_memo_logger();

    memo_report report;
    report.memo_path = get_memo_path(source);

    // The fingerprint is taken before initialization, so if the source
    // changes while the reader is working, the memo file will be stale
    // rather than wrong.
    optional<source_fingerprint> fingerprint;
    if (report.memo_path)
    {
        fingerprint = get_source_fingerprint(source);
        report.lookup
            = fingerprint ? load_from_memo(*report.memo_path, *fingerprint)
                          : memo_lookup::NO_FINGERPRINT;
    }

    if (report.lookup == memo_lookup::HIT)
    {
        logger->info(
            "memo hit for {} ({})",
            source.string(),
            report.memo_path->string());
    }
    else
    {
        logger->debug(
            "memo miss for {} ({})", source.string(), to_string(report.lookup));

        if (is_discardable(report.lookup))
        {
            logger->info(
                "discarding {} memo file {}",
                to_string(report.lookup),
                report.memo_path->string());
            remove_file_quietly(*report.memo_path);
        }

        auto start_time = std::chrono::steady_clock::now();
        try
        {
            reader_->initialize(source);
        }
        catch (...)
        {
            // Release whatever the reader managed to acquire and let the
            // caller see the original error.
            reader_->close();
            throw;
        }
        report.initialization_time
            = std::chrono::steady_clock::now() - start_time;

        if (report.memo_path && fingerprint)
        {
            report.write = save_to_memo(
                *report.memo_path, *fingerprint, report.initialization_time);
            logger->debug(
                "memo write for {}: {} (initialization took {} ms)",
                source.string(),
                to_string(report.write),
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    report.initialization_time)
                    .count());
        }
    }

    state_ = memoizer_state::OPENED;
    current_source_ = source;
    last_report_ = report;
    return report;
}

void
memoizer::close()
{
    if (state_ != memoizer_state::OPENED)
        return;
    reader_->close();
    current_source_ = none;
    state_ = memoizer_state::CLOSED;
}

bool
memoizer::loaded_from_memo() const
{
    return is_open() && last_report_.lookup == memo_lookup::HIT;
}

bool
memoizer::saved_to_memo() const
{
    return is_open() && last_report_.write == memo_write::WRITTEN;
}

} // namespace memo
