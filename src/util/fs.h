#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <util/expected.h>

namespace util {

// create a unique temporary directory, that is deleted when the application
// exits.
std::filesystem::path make_temp_dir();

// read the full contents of a file
util::expected<std::string, std::string>
read_file(const std::filesystem::path& path);

// write contents to path, replacing any existing file.
// the contents are written to a temporary file in the same directory that is
// renamed over path, so readers observe either the old or the new file.
util::expected<void, std::string>
write_file_atomic(const std::filesystem::path& path, std::string_view contents);

// for determining the level of access to a file or directory
// if there is an error, or the file does not exist `none` is
// returned.
enum class file_level { none = 0, readonly = 1, readwrite = 2 };
file_level file_access_level(const std::filesystem::path& path);

} // namespace util
