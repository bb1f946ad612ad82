#include "platform.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg && fs::path(xdg).is_absolute()) {
        return fs::path(xdg);
    }
    return home_dir() / ".local" / "share";
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

bool write_file_atomic(const fs::path& path, const std::string& content,
                       std::string& error) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        error = fmt::format("cannot create {}: {}", path.parent_path().string(), ec.message());
        return false;
    }

    fs::path tmp = path;
    tmp += ATOMIC_TMP_SUFFIX;

    FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) {
        error = fmt::format("cannot open {}: {}", tmp.string(), std::strerror(errno));
        return false;
    }

    bool ok = std::fwrite(content.data(), 1, content.size(), f) == content.size();
    ok = ok && std::fflush(f) == 0;
    ok = ok && ::fsync(fileno(f)) == 0;
    int saved_errno = errno;
    if (std::fclose(f) != 0) ok = false;

    if (!ok) {
        fs::remove(tmp, ec);
        error = fmt::format("cannot write {}: {}", tmp.string(), std::strerror(saved_errno));
        return false;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        error = fmt::format("cannot replace {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace platform
