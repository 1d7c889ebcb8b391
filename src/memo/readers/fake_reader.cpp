#include <memo/readers/fake_reader.hpp>

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <limits>
#include <system_error>
#include <thread>

#include <boost/algorithm/string.hpp>

#include <memo/core/logging.hpp>
#include <memo/fs/file_io.hpp>
#include <memo/io/raw_memory_io.hpp>

namespace memo {

char const* const fake_file_extension = ".fake";

static char const* const pixel_type_names[] = {
    "int8", "uint8", "int16", "uint16", "int32", "uint32", "float", "double"};

char const*
to_string(pixel_type type)
{
    return pixel_type_names[static_cast<int>(type)];
}

pixel_type
parse_pixel_type(string const& name)
{
    auto const* begin = std::begin(pixel_type_names);
    auto const* end = std::end(pixel_type_names);
    auto i = std::find_if(
        begin, end, [&](char const* candidate) { return name == candidate; });
    if (i == end)
    {
        MEMO_THROW(
            parsing_error() << expected_format_info("pixel type")
                            << parsed_text_info(name));
    }
    return static_cast<pixel_type>(i - begin);
}

int
get_bytes_per_pixel(pixel_type type)
{
    switch (type)
    {
        case pixel_type::INT8:
        case pixel_type::UINT8:
        default:
            return 1;
        case pixel_type::INT16:
        case pixel_type::UINT16:
            return 2;
        case pixel_type::INT32:
        case pixel_type::UINT32:
        case pixel_type::FLOAT:
            return 4;
        case pixel_type::DOUBLE:
            return 8;
    }
}

bool
operator==(image_description const& a, image_description const& b)
{
    return a.name == b.name && a.x_size == b.x_size && a.y_size == b.y_size
           && a.z_size == b.z_size && a.c_size == b.c_size
           && a.t_size == b.t_size && a.element_type == b.element_type
           && a.dimension_order == b.dimension_order
           && a.metadata == b.metadata;
}
bool
operator!=(image_description const& a, image_description const& b)
{
    return !(a == b);
}

// Multiply :factors, returning none if any is negative or the product
// overflows.
static optional<integer>
checked_product(std::initializer_list<integer> factors)
{
    integer product = 1;
    for (auto factor : factors)
    {
        if (factor < 0
            || (factor != 0
                && product > std::numeric_limits<integer>::max() / factor))
        {
            return none;
        }
        product *= factor;
    }
    return product;
}

static optional<integer>
checked_image_count(image_description const& description)
{
    return checked_product(
        {description.z_size, description.c_size, description.t_size});
}

static optional<integer>
checked_plane_size(image_description const& description)
{
    return checked_product(
        {description.x_size,
         description.y_size,
         get_bytes_per_pixel(description.element_type)});
}

bool
is_image_size_representable(image_description const& description)
{
    return checked_image_count(description) && checked_plane_size(description);
}

integer
get_image_count(image_description const& description)
{
    auto count = checked_image_count(description);
    if (!count)
    {
        MEMO_THROW(
            image_size_overflow() << internal_error_message_info(
                "image count overflows for " + description.name));
    }
    return *count;
}

integer
get_plane_size(image_description const& description)
{
    auto size = checked_plane_size(description);
    if (!size)
    {
        MEMO_THROW(
            image_size_overflow() << internal_error_message_info(
                "plane size overflows for " + description.name));
    }
    return *size;
}

// PARSING

static integer
parse_dimension(string const& text)
{
    auto value = parse_as<integer>(text, "positive integer");
    if (value <= 0)
    {
        MEMO_THROW(
            parsing_error() << expected_format_info("positive integer")
                            << parsed_text_info(text));
    }
    return value;
}

static bool
is_valid_dimension_order(string const& order)
{
    if (order.length() != 5 || order.compare(0, 2, "XY") != 0)
        return false;
    string sorted = order;
    std::sort(sorted.begin(), sorted.end());
    return sorted == "CTXYZ";
}

static integer
parse_sleep_time(string const& text)
{
    auto value = parse_as<integer>(text, "non-negative integer");
    if (value < 0)
    {
        MEMO_THROW(
            parsing_error() << expected_format_info("non-negative integer")
                            << parsed_text_info(text));
    }
    return value;
}

static void
apply_fake_property(
    image_description& description, string const& key, string const& value)
{
    if (key == "sizeX")
        description.x_size = parse_dimension(value);
    else if (key == "sizeY")
        description.y_size = parse_dimension(value);
    else if (key == "sizeZ")
        description.z_size = parse_dimension(value);
    else if (key == "sizeC")
        description.c_size = parse_dimension(value);
    else if (key == "sizeT")
        description.t_size = parse_dimension(value);
    else if (key == "pixelType")
        description.element_type = parse_pixel_type(value);
    else if (key == "dimOrder")
    {
        auto order = boost::to_upper_copy(value);
        if (!is_valid_dimension_order(order))
        {
            MEMO_THROW(
                parsing_error() << expected_format_info("dimension order")
                                << parsed_text_info(value));
        }
        description.dimension_order = order;
    }
    else if (key == "sleepInitFile")
        parse_sleep_time(value);

    description.metadata[key] = value;
}

// Split "key=value" and apply it.
static void
apply_fake_assignment(image_description& description, string const& text)
{
    auto equals = text.find('=');
    if (equals == string::npos || equals == 0)
    {
        MEMO_THROW(
            parsing_error() << expected_format_info("key=value")
                            << parsed_text_info(text));
    }
    apply_fake_property(
        description,
        boost::trim_copy(text.substr(0, equals)),
        boost::trim_copy(text.substr(equals + 1)));
}

static void
require_representable_size(
    image_description const& description, string const& text)
{
    if (!is_image_size_representable(description))
    {
        MEMO_THROW(
            parsing_error()
            << expected_format_info("image with a representable size")
            << parsed_text_info(text));
    }
}

image_description
parse_fake_file_name(string const& file_name)
{
    if (!boost::ends_with(file_name, fake_file_extension))
        MEMO_THROW(unsupported_source() << source_path_info(file_name));

    auto stem = file_name.substr(
        0, file_name.length() - string(fake_file_extension).length());

    std::vector<string> tokens;
    boost::split(tokens, stem, [](char c) { return c == '&'; });

    image_description description;
    description.name = tokens.front();
    for (size_t i = 1; i != tokens.size(); ++i)
    {
        if (!tokens[i].empty())
            apply_fake_assignment(description, tokens[i]);
    }
    require_representable_size(description, file_name);
    return description;
}

void
apply_fake_properties(image_description& description, string const& text)
{
    std::vector<string> lines;
    boost::split(lines, text, [](char c) { return c == '\n'; });
    for (auto const& raw_line : lines)
    {
        auto line = boost::trim_copy(raw_line);
        if (line.empty() || line[0] == '#' || line[0] == ';'
            || line[0] == '[')
        {
            continue;
        }
        apply_fake_assignment(description, line);
    }
    require_representable_size(description, text);
}

// ENCODING

string
encode_image_description(image_description const& description)
{
    byte_vector bytes;
    byte_vector_buffer buffer(bytes);
    raw_memory_writer<byte_vector_buffer> writer(buffer);
    write_string<uint32_t>(writer, description.name);
    write_int<uint64_t>(writer, description.x_size);
    write_int<uint64_t>(writer, description.y_size);
    write_int<uint64_t>(writer, description.z_size);
    write_int<uint64_t>(writer, description.c_size);
    write_int<uint64_t>(writer, description.t_size);
    write_int<uint8_t>(writer, static_cast<uint8_t>(description.element_type));
    write_string<uint8_t>(writer, description.dimension_order);
    write_int<uint32_t>(
        writer, boost::numeric_cast<uint32_t>(description.metadata.size()));
    for (auto const& [key, value] : description.metadata)
    {
        write_string<uint32_t>(writer, key);
        write_string<uint32_t>(writer, value);
    }
    return bytes_to_string(bytes);
}

static integer
read_dimension(raw_memory_reader<raw_input_buffer>& reader)
{
    auto value = read_int<uint64_t>(reader);
    if (value == 0 || value > uint64_t(std::numeric_limits<integer>::max()))
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "invalid image dimension"));
    }
    return static_cast<integer>(value);
}

image_description
decode_image_description(string const& encoded)
{
    auto buffer = make_input_buffer(encoded);
    raw_memory_reader<raw_input_buffer> reader(buffer);

    image_description description;
    description.name = read_string<uint32_t>(reader);
    description.x_size = read_dimension(reader);
    description.y_size = read_dimension(reader);
    description.z_size = read_dimension(reader);
    description.c_size = read_dimension(reader);
    description.t_size = read_dimension(reader);

    auto element_type = read_int<uint8_t>(reader);
    if (element_type > static_cast<uint8_t>(pixel_type::DOUBLE))
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "invalid pixel type"));
    }
    description.element_type = static_cast<pixel_type>(element_type);
    if (!is_image_size_representable(description))
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "image size overflows"));
    }

    description.dimension_order = read_string<uint8_t>(reader);
    if (!is_valid_dimension_order(description.dimension_order))
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "invalid dimension order"));
    }

    auto metadata_count = read_int<uint32_t>(reader);
    for (uint32_t i = 0; i != metadata_count; ++i)
    {
        auto key = read_string<uint32_t>(reader);
        description.metadata[key] = read_string<uint32_t>(reader);
    }

    if (buffer.size() != 0)
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "trailing bytes after image description"));
    }

    return description;
}

// READER

file_path
get_fake_properties_path(file_path const& source)
{
    auto properties_path = source;
    properties_path += ".ini";
    return properties_path;
}

fake_reader::fake_reader()
{
}

fake_reader::~fake_reader()
{
}

void
fake_reader::initialize(file_path const& source)
{
    close();

    fake_reader_state state;
    state.description = parse_fake_file_name(source.filename().string());

    state.properties_path = get_fake_properties_path(source);
    std::error_code error;
    if (std::filesystem::exists(state.properties_path, error) && !error)
    {
        apply_fake_properties(
            state.description, read_file_contents(state.properties_path));
    }

    auto& description = state.description;
    auto sleep_time = description.metadata.find("sleepInitFile");
    if (sleep_time != description.metadata.end())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(
            lexical_cast<integer>(sleep_time->second)));
    }

    get_memo_logger()->debug(
        "fake reader initialized {} ({}x{}, {} planes of {})",
        description.name,
        description.x_size,
        description.y_size,
        get_image_count(description),
        to_string(description.element_type));

    state_ = std::move(state);
}

void
fake_reader::close()
{
    state_ = none;
}

bool
fake_reader::is_initialized() const
{
    return state_ ? true : false;
}

uint32_t
fake_reader::state_version() const
{
    return 2;
}

std::vector<file_path>
fake_reader::used_files() const
{
    return {state().properties_path};
}

string
fake_reader::serialize_state() const
{
    auto const& state = this->state();
    byte_vector bytes;
    byte_vector_buffer buffer(bytes);
    raw_memory_writer<byte_vector_buffer> writer(buffer);
    write_string<uint32_t>(
        writer, encode_image_description(state.description));
    write_string<uint32_t>(writer, state.properties_path.string());
    return bytes_to_string(bytes);
}

void
fake_reader::deserialize_state(string const& encoded)
{
    close();

    auto buffer = make_input_buffer(encoded);
    raw_memory_reader<raw_input_buffer> reader(buffer);
    fake_reader_state state;
    state.description
        = decode_image_description(read_string<uint32_t>(reader));
    state.properties_path = read_string<uint32_t>(reader);
    if (buffer.size() != 0)
    {
        MEMO_THROW(
            corrupt_data() << internal_error_message_info(
                "trailing bytes after fake reader state"));
    }

    state_ = std::move(state);
}

fake_reader::fake_reader_state const&
fake_reader::state() const
{
    if (!state_)
    {
        MEMO_THROW(
            reader_uninitialized() << internal_error_message_info(
                "fake reader accessed before initialization"));
    }
    return *state_;
}

image_description const&
fake_reader::description() const
{
    return state().description;
}

} // namespace memo
