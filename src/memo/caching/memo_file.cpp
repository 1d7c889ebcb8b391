#include <memo/caching/memo_file.hpp>

#include <system_error>

#include <boost/crc.hpp>

#include <memo/core/logging.hpp>
#include <memo/fs/file_io.hpp>
#include <memo/io/raw_memory_io.hpp>

namespace memo {

uint32_t const memo_format_version = 2;

size_t const memo_header_size = 4 + 4 + 8 + 8 + 8 + 4;

char const*
to_string(memo_validity validity)
{
    switch (validity)
    {
        case memo_validity::VALID:
            return "valid";
        case memo_validity::ABSENT:
        default:
            return "absent";
        case memo_validity::UNREADABLE:
            return "unreadable";
        case memo_validity::INCOMPATIBLE:
            return "incompatible";
        case memo_validity::STALE:
            return "stale";
        case memo_validity::CORRUPT:
            return "corrupt";
    }
}

static uint32_t
compute_crc32(string const& data)
{
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

static string
encode_memo_body(
    std::vector<companion_fingerprint> const& companions,
    string const& payload)
{
    byte_vector bytes;
    byte_vector_buffer buffer(bytes);
    raw_memory_writer<byte_vector_buffer> writer(buffer);
    write_int<uint32_t>(
        writer, boost::numeric_cast<uint32_t>(companions.size()));
    for (auto const& companion : companions)
    {
        write_string<uint32_t>(writer, companion.path.string());
        write_int<uint8_t>(writer, companion.fingerprint ? 1 : 0);
        write_int<uint64_t>(
            writer, companion.fingerprint ? companion.fingerprint->size : 0);
        write_int<uint64_t>(
            writer,
            companion.fingerprint ? companion.fingerprint->modification_time
                                  : 0);
    }
    write_string_contents(writer, payload);
    return bytes_to_string(bytes);
}

string
encode_memo_file(
    source_fingerprint const& fingerprint,
    uint32_t state_version,
    string const& payload,
    std::vector<companion_fingerprint> const& companions)
{
    auto body = encode_memo_body(companions, payload);
    byte_vector bytes;
    bytes.reserve(memo_header_size + body.size());
    byte_vector_buffer buffer(bytes);
    raw_memory_writer<byte_vector_buffer> writer(buffer);
    write_int<uint32_t>(writer, memo_format_version);
    write_int<uint32_t>(writer, state_version);
    write_int<uint64_t>(writer, fingerprint.size);
    write_int<uint64_t>(writer, fingerprint.modification_time);
    write_int<uint64_t>(writer, body.size());
    write_int<uint32_t>(writer, compute_crc32(body));
    write_string_contents(writer, body);
    return bytes_to_string(bytes);
}

memo_header
decode_memo_header(string const& contents)
{
    auto buffer = make_input_buffer(contents);
    raw_memory_reader<raw_input_buffer> reader(buffer);
    memo_header header;
    header.format_version = read_int<uint32_t>(reader);
    header.state_version = read_int<uint32_t>(reader);
    header.fingerprint.size = read_int<uint64_t>(reader);
    header.fingerprint.modification_time = read_int<uint64_t>(reader);
    header.body_length = read_int<uint64_t>(reader);
    header.body_crc32 = read_int<uint32_t>(reader);
    return header;
}

struct memo_body
{
    std::vector<companion_fingerprint> companions;
    string payload;
};

// Decode the body of a memo file, throwing corrupt_data if it's malformed.
static memo_body
decode_memo_body(string const& body)
{
    auto buffer = make_input_buffer(body);
    raw_memory_reader<raw_input_buffer> reader(buffer);
    memo_body decoded;
    auto count = read_int<uint32_t>(reader);
    for (uint32_t i = 0; i != count; ++i)
    {
        companion_fingerprint companion;
        companion.path = read_string<uint32_t>(reader);
        auto present = read_int<uint8_t>(reader);
        source_fingerprint fingerprint;
        fingerprint.size = read_int<uint64_t>(reader);
        fingerprint.modification_time = read_int<uint64_t>(reader);
        if (present > 1)
        {
            MEMO_THROW(
                corrupt_data() << internal_error_message_info(
                    "invalid companion presence flag"));
        }
        if (present)
            companion.fingerprint = fingerprint;
        decoded.companions.push_back(std::move(companion));
    }
    decoded.payload = read_string(reader, buffer.size());
    return decoded;
}

// Read just the format version from the start of :contents, if it's there.
static optional<uint32_t>
peek_format_version(string const& contents)
{
    if (contents.size() < 4)
        return none;
    auto buffer = make_input_buffer(contents);
    raw_memory_reader<raw_input_buffer> reader(buffer);
    return read_int<uint32_t>(reader);
}

static memo_validity
check_memo_contents(
    string const& contents,
    source_fingerprint const& fingerprint,
    uint32_t state_version,
    optional<string>& payload)
{
    // Check the format version before anything else since the rest of the
    // layout depends on it.
    auto format_version = peek_format_version(contents);
    if (!format_version)
        return memo_validity::CORRUPT;
    if (*format_version != memo_format_version)
        return memo_validity::INCOMPATIBLE;

    if (contents.size() < memo_header_size)
        return memo_validity::CORRUPT;
    auto header = decode_memo_header(contents);

    if (header.state_version != state_version)
        return memo_validity::INCOMPATIBLE;

    if (header.fingerprint != fingerprint)
        return memo_validity::STALE;

    if (header.body_length != contents.size() - memo_header_size)
        return memo_validity::CORRUPT;

    // Only the body can be checked here, but a damaged header will almost
    // certainly have failed one of the checks above.
    auto body = contents.substr(memo_header_size);
    if (compute_crc32(body) != header.body_crc32)
        return memo_validity::CORRUPT;

    auto decoded = decode_memo_body(body);
    if (!companions_unchanged(decoded.companions))
        return memo_validity::STALE;

    payload = std::move(decoded.payload);
    return memo_validity::VALID;
}

memo_file_contents
read_memo_file(
    file_path const& memo_path,
    source_fingerprint const& fingerprint,
    uint32_t state_version)
{
    memo_file_contents result;

    std::error_code error;
    if (!std::filesystem::exists(memo_path, error) || error)
    {
        result.validity = memo_validity::ABSENT;
        return result;
    }

    if (!std::filesystem::is_regular_file(memo_path, error) || error)
    {
        result.validity = memo_validity::UNREADABLE;
        return result;
    }

    string contents;
    try
    {
        contents = read_file_contents(memo_path);
    }
    catch (std::exception& e)
    {
        // This also covers the file disappearing since the check above.
        get_memo_logger()->debug(
            "unable to read memo file {}: {}", memo_path.string(), e.what());
        result.validity = memo_validity::UNREADABLE;
        return result;
    }

    optional<string> payload;
    try
    {
        result.validity = check_memo_contents(
            contents, fingerprint, state_version, payload);
    }
    catch (corrupt_data&)
    {
        result.validity = memo_validity::CORRUPT;
    }

    if (result.validity == memo_validity::VALID)
        result.payload = std::move(payload);
    return result;
}

memo_validity
check_memo_file(
    file_path const& memo_path,
    file_path const& source,
    uint32_t state_version)
{
    auto fingerprint = get_source_fingerprint(source);
    if (!fingerprint)
    {
        std::error_code error;
        return std::filesystem::exists(memo_path, error) && !error
                   ? memo_validity::STALE
                   : memo_validity::ABSENT;
    }
    return read_memo_file(memo_path, *fingerprint, state_version).validity;
}

bool
is_valid_memo_file(
    file_path const& memo_path,
    file_path const& source,
    uint32_t state_version)
{
    return check_memo_file(memo_path, source, state_version)
           == memo_validity::VALID;
}

void
write_memo_file(
    file_path const& memo_path,
    source_fingerprint const& fingerprint,
    uint32_t state_version,
    string const& payload,
    std::vector<companion_fingerprint> const& companions)
{
    auto memo_dir = memo_path.parent_path();
    if (!memo_dir.empty())
        std::filesystem::create_directories(memo_dir);
    dump_string_to_file_atomically(
        memo_path,
        encode_memo_file(fingerprint, state_version, payload, companions));
}

} // namespace memo
