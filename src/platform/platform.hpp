#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp directory if unset.
std::filesystem::path home_dir();

// Returns the user data directory: $XDG_DATA_HOME, else ~/.local/share.
std::filesystem::path data_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Replace `path` with `content` atomically: write a sibling temp file,
// fsync it, then rename over the target. On failure the target is untouched.
// Returns false and fills `error` on failure.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content,
                       std::string& error);

// Suffix used for the sibling temp file written by write_file_atomic.
constexpr const char* ATOMIC_TMP_SUFFIX = ".tmp";

} // namespace platform
