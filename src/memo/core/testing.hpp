#ifndef MEMO_CORE_TESTING_HPP
#define MEMO_CORE_TESTING_HPP

#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <memo/fs/file_io.hpp>
#include <memo/fs/utilities.hpp>

namespace memo {

// Create a fresh, empty directory under the system temp directory for a test
// to work in. :label is just there to make the directory recognizable.
inline file_path
make_scratch_directory(string const& label)
{
    boost::uuids::random_generator generate;
    auto dir = std::filesystem::temp_directory_path()
               / ("memo_" + label + "_" + boost::uuids::to_string(generate()));
    reset_directory(dir);
    return dir;
}

// Removes a directory tree when it goes out of scope.
struct scoped_directory : boost::noncopyable
{
    explicit scoped_directory(file_path path) : path(std::move(path))
    {
    }
    ~scoped_directory()
    {
        std::error_code ignored;
        std::filesystem::remove_all(path, ignored);
    }
    file_path path;
};

} // namespace memo

#endif
