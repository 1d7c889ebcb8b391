#include <memo/readers/fake_reader.hpp>

#include <memo/core/testing.hpp>
#include <memo/io/raw_memory_io.hpp>

using namespace memo;

TEST_CASE("fake file name parsing", "[readers][fake]")
{
    auto description = parse_fake_file_name(
        "test&pixelType=int8&sizeX=20&sizeY=20&sizeC=1&sizeZ=1&sizeT=1.fake");
    REQUIRE(description.name == "test");
    REQUIRE(description.x_size == 20);
    REQUIRE(description.y_size == 20);
    REQUIRE(description.z_size == 1);
    REQUIRE(description.c_size == 1);
    REQUIRE(description.t_size == 1);
    REQUIRE(description.element_type == pixel_type::INT8);
    REQUIRE(description.dimension_order == "XYZCT");
    REQUIRE(description.metadata.size() == 6);
    REQUIRE(description.metadata.at("pixelType") == "int8");

    REQUIRE(get_image_count(description) == 1);
    REQUIRE(get_plane_size(description) == 400);
}

TEST_CASE("fake file name defaults", "[readers][fake]")
{
    auto description = parse_fake_file_name("plain.fake");
    REQUIRE(description.name == "plain");
    REQUIRE(description.x_size == 512);
    REQUIRE(description.y_size == 512);
    REQUIRE(description.element_type == pixel_type::UINT8);
    REQUIRE(description.metadata.empty());

    description = parse_fake_file_name(
        "multi&sizeZ=3&sizeC=2&sizeT=4&pixelType=double&dimOrder=xyctz.fake");
    REQUIRE(get_image_count(description) == 24);
    REQUIRE(get_plane_size(description) == 512 * 512 * 8);
    REQUIRE(description.dimension_order == "XYCTZ");

    // Unrecognized keys are kept as metadata.
    description = parse_fake_file_name("extra&series=2&sleepInitFile=0.fake");
    REQUIRE(description.metadata.at("series") == "2");
    REQUIRE(description.metadata.at("sleepInitFile") == "0");
}

TEST_CASE("fake file name errors", "[readers][fake]")
{
    REQUIRE_THROWS_AS(parse_fake_file_name("image.tif"), unsupported_source);
    REQUIRE_THROWS_AS(
        parse_fake_file_name("bad&sizeX=0.fake"), parsing_error);
    REQUIRE_THROWS_AS(
        parse_fake_file_name("bad&sizeX=abc.fake"), parsing_error);
    REQUIRE_THROWS_AS(
        parse_fake_file_name("bad&pixelType=int12.fake"), parsing_error);
    REQUIRE_THROWS_AS(
        parse_fake_file_name("bad&dimOrder=ZYXCT.fake"), parsing_error);
    REQUIRE_THROWS_AS(
        parse_fake_file_name("bad&sleepInitFile=-5.fake"), parsing_error);
    REQUIRE_THROWS_AS(parse_fake_file_name("bad&sizeX.fake"), parsing_error);

    try
    {
        parse_fake_file_name("bad&pixelType=int12.fake");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "int12");
    }
}

TEST_CASE("oversized fake images", "[readers][fake]")
{
    // The plane size would overflow.
    REQUIRE_THROWS_AS(
        parse_fake_file_name("big&sizeX=4294967296&sizeY=4294967296.fake"),
        parsing_error);
    REQUIRE_THROWS_AS(
        parse_fake_file_name(
            "big&sizeX=3037000500&sizeY=3037000500&pixelType=double.fake"),
        parsing_error);
    // So would the plane count.
    REQUIRE_THROWS_AS(
        parse_fake_file_name(
            "big&sizeZ=4294967296&sizeC=4294967296&sizeT=2.fake"),
        parsing_error);

    // The largest plane that fits is fine.
    auto description = parse_fake_file_name(
        "wide&sizeX=9223372036854775807&sizeY=1&pixelType=uint8.fake");
    REQUIRE(get_plane_size(description) == 9223372036854775807);

    // Properties files are held to the same limit.
    description = parse_fake_file_name("props.fake");
    REQUIRE_THROWS_AS(
        apply_fake_properties(
            description, "sizeX=4294967296\nsizeY=4294967296\n"),
        parsing_error);

    // Descriptions built directly aren't checked until they're used.
    image_description huge;
    huge.x_size = 4294967296;
    huge.y_size = 4294967296;
    REQUIRE(!is_image_size_representable(huge));
    REQUIRE_THROWS_AS(get_plane_size(huge), image_size_overflow);
    REQUIRE(get_image_count(huge) == 1);
    REQUIRE_THROWS_AS(
        decode_image_description(encode_image_description(huge)),
        corrupt_data);

    huge = image_description();
    huge.t_size = -1;
    REQUIRE_THROWS_AS(get_image_count(huge), image_size_overflow);
}

TEST_CASE("fake properties", "[readers][fake]")
{
    auto description = parse_fake_file_name("props&sizeX=20.fake");
    apply_fake_properties(
        description,
        "[GlobalMetadata]\n"
        "# a comment\n"
        "; another comment\n"
        "\n"
        "sizeX = 40\n"
        "pixelType=float\n"
        "instrument=scope\n");
    REQUIRE(description.x_size == 40);
    REQUIRE(description.element_type == pixel_type::FLOAT);
    REQUIRE(description.metadata.at("instrument") == "scope");
    REQUIRE(description.metadata.at("sizeX") == "40");
}

TEST_CASE("image description encoding", "[readers][fake]")
{
    auto description = parse_fake_file_name(
        "encoded&sizeX=7&sizeZ=3&pixelType=uint16&dimOrder=XYTCZ&note=hi.fake");
    auto encoded = encode_image_description(description);
    REQUIRE(decode_image_description(encoded) == description);

    // Anything short or padded is rejected.
    REQUIRE_THROWS_AS(
        decode_image_description(encoded.substr(0, encoded.size() - 1)),
        corrupt_data);
    REQUIRE_THROWS_AS(decode_image_description(encoded + "x"), corrupt_data);
    REQUIRE_THROWS_AS(decode_image_description(""), corrupt_data);
    REQUIRE_THROWS_AS(
        decode_image_description("not an image description"), corrupt_data);
}

TEST_CASE("fake reader lifecycle", "[readers][fake]")
{
    scoped_directory scratch(make_scratch_directory("fake_reader"));

    fake_reader reader;
    REQUIRE(!reader.is_initialized());
    REQUIRE_THROWS_AS(reader.description(), reader_uninitialized);
    REQUIRE_THROWS_AS(reader.serialize_state(), reader_uninitialized);
    REQUIRE_THROWS_AS(reader.used_files(), reader_uninitialized);

    auto source = scratch.path / "lifecycle&sizeX=20&sizeY=10.fake";
    reader.initialize(source);
    REQUIRE(reader.is_initialized());
    REQUIRE(reader.description().name == "lifecycle");
    REQUIRE(reader.description().y_size == 10);

    // The properties file counts as used even though it doesn't exist.
    auto used = reader.used_files();
    REQUIRE(used.size() == 1);
    REQUIRE(used[0].string() == get_fake_properties_path(source).string());
    REQUIRE(
        used[0].filename().string()
        == "lifecycle&sizeX=20&sizeY=10.fake.ini");

    // The state can be moved to another reader.
    fake_reader other;
    other.deserialize_state(reader.serialize_state());
    REQUIRE(other.is_initialized());
    REQUIRE(other.description() == reader.description());
    REQUIRE(
        other.used_files().at(0).string()
        == reader.used_files().at(0).string());

    reader.close();
    REQUIRE(!reader.is_initialized());
    reader.close();
    REQUIRE(!reader.is_initialized());

    // Bad state leaves the reader uninitialized.
    REQUIRE_THROWS_AS(other.deserialize_state("garbage"), corrupt_data);
    REQUIRE(!other.is_initialized());
}

TEST_CASE("fake reader companion files", "[readers][fake]")
{
    scoped_directory scratch(make_scratch_directory("fake_ini"));
    auto source = scratch.path / "companion&sizeX=20.fake";
    auto ini_path = source;
    ini_path += ".ini";
    dump_string_to_file(ini_path, "sizeX=64\nsizeC=3\n");

    fake_reader reader;
    reader.initialize(source);
    REQUIRE(reader.description().x_size == 64);
    REQUIRE(reader.description().c_size == 3);
}

TEST_CASE("slow fake reader initialization", "[readers][fake]")
{
    fake_reader reader;
    auto start = std::chrono::steady_clock::now();
    reader.initialize("/nonexistent/slow&sleepInitFile=50.fake");
    REQUIRE(
        std::chrono::steady_clock::now() - start
        >= std::chrono::milliseconds(50));
}
