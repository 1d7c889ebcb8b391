#ifndef MEMO_FS_FILE_IO_HPP
#define MEMO_FS_FILE_IO_HPP

#include <fstream>

#include <memo/fs/types.hpp>
#include <memo/utilities/errors.hpp>

namespace memo {

// Open a file into the given fstream. Throw an error if the open operation
// fails, and enable the exception bits on the fstream so that subsequent
// failures will throw exceptions.
void
open_file(std::fstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode);

// If the above fails, it throws the following exception.
MEMO_DEFINE_EXCEPTION(open_file_error)
MEMO_DEFINE_ERROR_INFO(file_path, file_path)
MEMO_DEFINE_ERROR_INFO(std::ios::openmode, open_mode)

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

// Write a string to a file (overwriting anything that might have been in it).
void
dump_string_to_file(file_path const& path, string const& contents);

// Write a string to a file such that other readers of :path only ever see
// either the old file or the complete new one.
//
// The contents are written to a uniquely named temporary file in the same
// directory and then renamed over :path. If anything fails, the temporary
// file is removed and the error is rethrown. Concurrent writers of the same
// path don't interfere with each other. The last rename wins.
//
void
dump_string_to_file_atomically(file_path const& path, string const& contents);

// Get the name of a fresh temporary file that lives beside :path.
file_path
make_temporary_sibling_path(file_path const& path);

} // namespace memo

#endif
