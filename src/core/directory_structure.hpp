#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Get the base ego path (<data_dir>/ego)
fs::path get_ego_root();

// Default directory holding the session record (<ego root>/state)
fs::path get_default_state_dir();

// Ensures the given state directory exists.
// Creates directories as needed but does not touch files.
void ensure_ego_directory_structure(const fs::path& state_dir);
