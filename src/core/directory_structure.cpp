#include "directory_structure.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>

fs::path get_ego_root() {
    return platform::data_dir() / "ego";
}

fs::path get_default_state_dir() {
    return get_ego_root() / STATE_DIR_NAME;
}

void ensure_ego_directory_structure(const fs::path& state_dir) {
    fs::create_directories(state_dir);
}
