#include <memo/fs/utilities.hpp>

#include <system_error>

namespace memo {

void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directories(dir);
}

bool
is_existing_directory(file_path const& path)
{
    std::error_code error;
    return std::filesystem::is_directory(path, error) && !error;
}

bool
remove_file_quietly(file_path const& path)
{
    std::error_code error;
    return std::filesystem::remove(path, error) && !error;
}

} // namespace memo
