#include <memo/fs/file_io.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace memo {

void
open_file(std::fstream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        MEMO_THROW(
            open_file_error() << file_path_info(path) << open_mode_info(mode)
                              << internal_error_message_info(strerror(errno)));
    }
    file.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);
}
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        MEMO_THROW(
            open_file_error() << file_path_info(path) << open_mode_info(mode)
                              << internal_error_message_info(strerror(errno)));
    }
    file.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);
}
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        MEMO_THROW(
            open_file_error() << file_path_info(path) << open_mode_info(mode)
                              << internal_error_message_info(strerror(errno)));
    }
    file.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);
}

string
read_file_contents(file_path const& path)
{
    std::ifstream in;
    open_file(in, path, std::ios::in | std::ios::binary);
    string contents;
    in.seekg(0, std::ios::end);
    contents.resize(in.tellg());
    in.seekg(0, std::ios::beg);
    in.read(&contents[0], contents.size());
    in.close();
    return contents;
}

void
dump_string_to_file(file_path const& path, string const& contents)
{
    std::ofstream output;
    open_file(
        output, path, std::ios::out | std::ios::trunc | std::ios::binary);
    output << contents;
}

file_path
make_temporary_sibling_path(file_path const& path)
{
    boost::uuids::random_generator generate;
    auto name = path.filename().string() + "."
                + boost::uuids::to_string(generate()) + ".tmp";
    return path.parent_path() / name;
}

void
dump_string_to_file_atomically(file_path const& path, string const& contents)
{
    auto temporary_path = make_temporary_sibling_path(path);
    try
    {
        {
            std::ofstream output;
            open_file(
                output,
                temporary_path,
                std::ios::out | std::ios::trunc | std::ios::binary);
            output.write(contents.data(), contents.size());
            // Closing explicitly means flush failures surface here rather
            // than being lost in the destructor.
            output.close();
        }
        std::filesystem::rename(temporary_path, path);
    }
    catch (...)
    {
        std::error_code ignored;
        std::filesystem::remove(temporary_path, ignored);
        throw;
    }
}

} // namespace memo
