#pragma once

#include <string>

namespace bluos
{

// Writes content to <path>.tmp.<pid> with mode 0600, fsyncs it and renames
// it over path. The parent directory is created with mode 0700. On failure
// returns false with a description in error and leaves path untouched.
bool write_private_file(const std::string &path, const std::string &content, std::string &error);

} // namespace bluos
