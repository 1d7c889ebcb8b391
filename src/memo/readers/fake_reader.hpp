#ifndef MEMO_READERS_FAKE_READER_HPP
#define MEMO_READERS_FAKE_READER_HPP

#include <map>

#include <memo/readers/reader.hpp>
#include <memo/utilities/text.hpp>

// The fake reader synthesizes an image description entirely from the name of
// its source file. It's useful for exercising code that wraps readers without
// needing real image files.
//
// A fake source name looks like this:
//
//   test&pixelType=int8&sizeX=20&sizeY=20&sizeC=1&sizeZ=1&sizeT=1.fake
//
// The part before the first '&' is the image name and each '&'-separated
// key=value pair after it sets a property. Unspecified properties take their
// default values. If a file named <source>.ini exists beside the source, its
// key=value lines are applied afterwards, so they override the name.
//
// The source file itself only needs to exist if it's going to be memoized.
// Its contents are never read.
//
// Recognized keys:
//   sizeX, sizeY, sizeZ, sizeC, sizeT - dimensions (positive integers)
//   pixelType - int8, uint8, int16, uint16, int32, uint32, float or double
//   dimOrder - a permutation of XYZCT that starts with XY
//   sleepInitFile - milliseconds to sleep during initialization, which
//     simulates a slow reader
//
// All pairs (recognized or not) are also recorded as metadata.

namespace memo {

enum class pixel_type
{
    INT8,
    UINT8,
    INT16,
    UINT16,
    INT32,
    UINT32,
    FLOAT,
    DOUBLE
};

char const*
to_string(pixel_type type);

// Parse a pixel type name, throwing a parsing_error if it's not one.
pixel_type
parse_pixel_type(string const& name);

int
get_bytes_per_pixel(pixel_type type);

struct image_description
{
    string name;
    integer x_size = 512;
    integer y_size = 512;
    integer z_size = 1;
    integer c_size = 1;
    integer t_size = 1;
    pixel_type element_type = pixel_type::UINT8;
    string dimension_order = "XYZCT";
    std::map<string, string> metadata;
};

bool
operator==(image_description const& a, image_description const& b);
bool
operator!=(image_description const& a, image_description const& b);

// This exception indicates that an image's plane count or plane size doesn't
// fit in an integer.
MEMO_DEFINE_EXCEPTION(image_size_overflow)

// Do the plane count and plane size of :description fit in an integer?
bool
is_image_size_representable(image_description const& description);

// the number of planes in the image
// (This throws image_size_overflow if it's not representable.)
integer
get_image_count(image_description const& description);

// the size of a single plane (in bytes)
// (This throws image_size_overflow if it's not representable.)
integer
get_plane_size(image_description const& description);

// the extension that fake sources must have
extern char const* const fake_file_extension;

// This exception indicates that a source isn't something the fake reader
// understands.
MEMO_DEFINE_EXCEPTION(unsupported_source)
MEMO_DEFINE_ERROR_INFO(file_path, source_path)

// Parse the image description encoded in a fake source's file name.
// This throws unsupported_source if the name doesn't end in
// fake_file_extension and parsing_error if a property value is invalid or
// the resulting image is too large to describe.
image_description
parse_fake_file_name(string const& file_name);

// Apply the key=value lines in :text to :description. Blank lines, comment
// lines (starting with '#' or ';') and [section] headers are ignored.
// This throws parsing_error under the same conditions as above.
void
apply_fake_properties(image_description& description, string const& text);

// Encode/decode an image description for storage in a memo file.
string
encode_image_description(image_description const& description);
image_description
decode_image_description(string const& encoded);

// the companion file whose properties override those in :source's name
file_path
get_fake_properties_path(file_path const& source);

struct fake_reader : reader_interface
{
    fake_reader();
    ~fake_reader();

    void
    initialize(file_path const& source) override;

    void
    close() override;

    bool
    is_initialized() const override;

    uint32_t
    state_version() const override;

    // This is the properties file, whether or not it exists.
    std::vector<file_path>
    used_files() const override;

    string
    serialize_state() const override;

    void
    deserialize_state(string const& state) override;

    // The following should only be used when is_initialized() is true.

    image_description const&
    description() const;

 private:
    struct fake_reader_state
    {
        image_description description;
        file_path properties_path;
    };

    fake_reader_state const&
    state() const;

    optional<fake_reader_state> state_;
};

} // namespace memo

#endif
