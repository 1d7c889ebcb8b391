#include <memo/caching/memo_file.hpp>

#include <boost/crc.hpp>

#include <memo/core/testing.hpp>
#include <memo/io/raw_memory_io.hpp>

using namespace memo;

namespace {

// A scratch directory holding a source file and a path for its memo file.
struct memo_file_fixture
{
    memo_file_fixture()
        : scratch(make_scratch_directory("memo_file")),
          source(scratch.path / "source.fake"),
          memo_path(scratch.path / ".source.fake.bfmemo")
    {
        dump_string_to_file(source, "original contents");
    }

    source_fingerprint
    fingerprint() const
    {
        return *get_source_fingerprint(source);
    }

    scoped_directory scratch;
    file_path source;
    file_path memo_path;
};

} // namespace

TEST_CASE("memo header encoding", "[caching][memo_file]")
{
    source_fingerprint fingerprint;
    fingerprint.size = 1234;
    fingerprint.modification_time = 0x0102030405060708;

    auto encoded = encode_memo_file(fingerprint, 7, "payload");
    // The body is an empty companion table followed by the payload.
    REQUIRE(encoded.size() == memo_header_size + 4 + 7);
    REQUIRE(encoded.substr(memo_header_size + 4) == "payload");

    // The format version comes first, big-endian.
    REQUIRE(encoded[0] == 0);
    REQUIRE(encoded[3] == char(memo_format_version));

    auto header = decode_memo_header(encoded);
    REQUIRE(header.format_version == memo_format_version);
    REQUIRE(header.state_version == 7);
    REQUIRE(header.fingerprint == fingerprint);
    REQUIRE(header.body_length == 11);

    REQUIRE_THROWS_AS(decode_memo_header(encoded.substr(0, 10)), corrupt_data);
}

TEST_CASE("source fingerprints", "[caching][memo_file]")
{
    memo_file_fixture f;

    auto fingerprint = get_source_fingerprint(f.source);
    REQUIRE(fingerprint.has_value());
    REQUIRE(fingerprint->size == string("original contents").size());
    REQUIRE(*get_source_fingerprint(f.source) == *fingerprint);

    REQUIRE(!get_source_fingerprint(f.scratch.path / "missing"));
    // Directories can't be fingerprinted.
    REQUIRE(!get_source_fingerprint(f.scratch.path));
}

TEST_CASE("valid memo files", "[caching][memo_file]")
{
    memo_file_fixture f;

    REQUIRE(check_memo_file(f.memo_path, f.source, 1) == memo_validity::ABSENT);
    REQUIRE(!is_valid_memo_file(f.memo_path, f.source, 1));

    write_memo_file(f.memo_path, f.fingerprint(), 1, "state");
    REQUIRE(check_memo_file(f.memo_path, f.source, 1) == memo_validity::VALID);
    REQUIRE(is_valid_memo_file(f.memo_path, f.source, 1));

    auto contents = read_memo_file(f.memo_path, f.fingerprint(), 1);
    REQUIRE(contents.validity == memo_validity::VALID);
    REQUIRE(contents.payload == some(string("state")));

    // An empty payload is still a payload.
    write_memo_file(f.memo_path, f.fingerprint(), 1, "");
    contents = read_memo_file(f.memo_path, f.fingerprint(), 1);
    REQUIRE(contents.validity == memo_validity::VALID);
    REQUIRE(contents.payload == some(string()));
}

TEST_CASE("memo file companions", "[caching][memo_file]")
{
    memo_file_fixture f;
    auto present = f.scratch.path / "source.fake.ini";
    dump_string_to_file(present, "sizeX=10\n");
    auto absent = f.scratch.path / "source.fake.extra";

    auto companions = get_companion_fingerprints({present, absent});
    REQUIRE(companions.size() == 2);
    REQUIRE(companions[0].fingerprint.has_value());
    REQUIRE(!companions[1].fingerprint.has_value());
    REQUIRE(companions_unchanged(companions));

    write_memo_file(f.memo_path, f.fingerprint(), 1, "state", companions);
    auto contents = read_memo_file(f.memo_path, f.fingerprint(), 1);
    REQUIRE(contents.validity == memo_validity::VALID);
    REQUIRE(contents.payload == some(string("state")));

    SECTION("companion modified")
    {
        auto modified = std::filesystem::last_write_time(present);
        std::filesystem::last_write_time(
            present, modified + std::chrono::seconds(5));
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1) == memo_validity::STALE);
        REQUIRE(!companions_unchanged(companions));
    }

    SECTION("absent companion created")
    {
        dump_string_to_file(absent, "");
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1) == memo_validity::STALE);
    }

    SECTION("companion removed")
    {
        std::filesystem::remove(present);
        auto stale = read_memo_file(f.memo_path, f.fingerprint(), 1);
        REQUIRE(stale.validity == memo_validity::STALE);
        REQUIRE(stale.payload == none);
    }
}

TEST_CASE("corrupt companion tables", "[caching][memo_file]")
{
    memo_file_fixture f;

    // a valid header and CRC around a body that claims a companion it
    // doesn't have
    byte_vector body;
    byte_vector_buffer body_buffer(body);
    raw_memory_writer<byte_vector_buffer> body_writer(body_buffer);
    write_int<uint32_t>(body_writer, 3);
    write_string_contents(body_writer, "xy");
    auto body_text = bytes_to_string(body);

    auto encoded = encode_memo_file(f.fingerprint(), 1, "");
    auto header = encoded.substr(0, memo_header_size - 12);
    byte_vector tail;
    byte_vector_buffer tail_buffer(tail);
    raw_memory_writer<byte_vector_buffer> tail_writer(tail_buffer);
    write_int<uint64_t>(tail_writer, body_text.size());
    boost::crc_32_type crc;
    crc.process_bytes(body_text.data(), body_text.size());
    write_int<uint32_t>(tail_writer, crc.checksum());

    dump_string_to_file(
        f.memo_path, header + bytes_to_string(tail) + body_text);
    REQUIRE(
        check_memo_file(f.memo_path, f.source, 1) == memo_validity::CORRUPT);
}

TEST_CASE("memo file directories are created", "[caching][memo_file]")
{
    memo_file_fixture f;
    auto nested = f.scratch.path / "a" / "b" / ".source.fake.bfmemo";
    write_memo_file(nested, f.fingerprint(), 1, "state");
    REQUIRE(is_valid_memo_file(nested, f.source, 1));
}

TEST_CASE("stale memo files", "[caching][memo_file]")
{
    memo_file_fixture f;
    write_memo_file(f.memo_path, f.fingerprint(), 1, "state");

    SECTION("source resized")
    {
        dump_string_to_file(f.source, "new contents of a different size");
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1) == memo_validity::STALE);
    }

    SECTION("source touched")
    {
        auto modified = std::filesystem::last_write_time(f.source);
        std::filesystem::last_write_time(
            f.source, modified + std::chrono::seconds(5));
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1) == memo_validity::STALE);
        auto contents = read_memo_file(f.memo_path, f.fingerprint(), 1);
        REQUIRE(contents.validity == memo_validity::STALE);
        REQUIRE(contents.payload == none);
    }

    SECTION("source removed")
    {
        std::filesystem::remove(f.source);
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1) == memo_validity::STALE);
    }
}

TEST_CASE("incompatible memo files", "[caching][memo_file]")
{
    memo_file_fixture f;

    SECTION("different reader state version")
    {
        write_memo_file(f.memo_path, f.fingerprint(), 1, "state");
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 2)
            == memo_validity::INCOMPATIBLE);
    }

    SECTION("different format version")
    {
        auto encoded = encode_memo_file(f.fingerprint(), 1, "state");
        encoded[3] = char(memo_format_version + 1);
        dump_string_to_file(f.memo_path, encoded);
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1)
            == memo_validity::INCOMPATIBLE);
    }
}

TEST_CASE("corrupt memo files", "[caching][memo_file]")
{
    memo_file_fixture f;
    auto encoded = encode_memo_file(f.fingerprint(), 1, "some reader state");

    SECTION("truncated payload")
    {
        dump_string_to_file(
            f.memo_path, encoded.substr(0, encoded.size() - 3));
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1)
            == memo_validity::CORRUPT);
    }

    SECTION("truncated header")
    {
        dump_string_to_file(f.memo_path, encoded.substr(0, 12));
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1)
            == memo_validity::CORRUPT);
    }

    SECTION("flipped payload byte")
    {
        encoded[encoded.size() - 1] ^= 0x01;
        dump_string_to_file(f.memo_path, encoded);
        auto contents = read_memo_file(f.memo_path, f.fingerprint(), 1);
        REQUIRE(contents.validity == memo_validity::CORRUPT);
        REQUIRE(contents.payload == none);
    }

    SECTION("extra bytes")
    {
        dump_string_to_file(f.memo_path, encoded + "xyz");
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1)
            == memo_validity::CORRUPT);
    }

    SECTION("empty file")
    {
        dump_string_to_file(f.memo_path, "");
        REQUIRE(
            check_memo_file(f.memo_path, f.source, 1)
            == memo_validity::CORRUPT);
    }
}

TEST_CASE("unreadable memo files", "[caching][memo_file]")
{
    memo_file_fixture f;
    // A directory in place of the memo file can't be read as one.
    create_directory(f.memo_path);
    auto contents = read_memo_file(f.memo_path, f.fingerprint(), 1);
    REQUIRE(contents.validity == memo_validity::UNREADABLE);
}

TEST_CASE("memo validity names", "[caching][memo_file]")
{
    REQUIRE(string(to_string(memo_validity::VALID)) == "valid");
    REQUIRE(string(to_string(memo_validity::STALE)) == "stale");
    REQUIRE(string(to_string(memo_validity::CORRUPT)) == "corrupt");
}
