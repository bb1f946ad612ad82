#include "line_counter.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

// ── LineTally ──────────────────────────────────────────────

void LineTally::feed(const char* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        char c = data[i];
        if (c == '\0') binary_ = true;
        if (c == '\n') ++lines_;
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++chars_;
        hash_ ^= static_cast<unsigned char>(c);
        hash_ *= 1099511628211ULL;
    }
    if (len > 0) {
        last_ = data[len - 1];
        size_ += len;
    }
}

FileCount LineTally::finish() const {
    FileCount fc;
    fc.lines = lines_ + ((size_ > 0 && last_ != '\n') ? 1 : 0);
    fc.chars = chars_;
    fc.size = size_;
    fc.hash = hash_;
    return fc;
}

Result<FileCount> count_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<FileCount>::Err(fmt::format("cannot open: {}", std::strerror(errno)));
    }

    LineTally tally;
    std::vector<char> buf(READ_CHUNK_BYTES);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = in.gcount();
        if (got > 0) {
            tally.feed(buf.data(), static_cast<size_t>(got));
        }
        if (tally.binary()) {
            return Result<FileCount>::Err("binary content");
        }
    }
    if (in.bad()) {
        return Result<FileCount>::Err("read failed");
    }

    return Result<FileCount>::Ok(tally.finish());
}

// ── LineCounter ────────────────────────────────────────────

static void add_warning(ScanResult& result, const std::string& what) {
    ego_log("scan warning: " + what);
    result.warnings.push_back(what);
    result.files_skipped++;
}

LineCounter::LineCounter(ScanPolicy policy)
    : policy_(std::move(policy)), extensions_(policy_.extra_extensions) {
}

Result<ScanResult> LineCounter::count_lines(const fs::path& root) const {
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        return Result<ScanResult>::Err(ErrorCode::InvalidPath,
            fmt::format("Path does not exist: {}", root.string()));
    }

    ScanResult result;
    std::vector<Candidate> files;

    if (fs::is_regular_file(st)) {
        if (extensions_.matches(root)) {
            files.push_back({root, root.filename().generic_string()});
        }
    } else if (fs::is_directory(st)) {
        fs::directory_iterator probe(root, ec);
        if (ec) {
            return Result<ScanResult>::Err(ErrorCode::InvalidPath,
                fmt::format("Cannot read directory {}: {}", root.string(), ec.message()));
        }
        collect(root, files, result);
    } else {
        return Result<ScanResult>::Err(ErrorCode::InvalidPath,
            fmt::format("Not a regular file or directory: {}", root.string()));
    }

    // Sort for consistent ordering
    std::sort(files.begin(), files.end(),
              [](const Candidate& a, const Candidate& b) { return a.rel < b.rel; });

    tally(files, result);

    ego_logf("scanned {}: {} lines in {} files ({} skipped)",
             root.string(), result.total_lines, result.files_counted, result.files_skipped);
    return Result<ScanResult>::Ok(std::move(result));
}

void LineCounter::collect(const fs::path& root, std::vector<Candidate>& out,
                          ScanResult& result) const {
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            add_warning(result, fmt::format("{}: cannot list directory: {}",
                                            dir.lexically_relative(root).generic_string(),
                                            ec.message()));
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            const fs::path& path = it->path();
            std::string name = path.filename().string();

            if (!policy_.include_hidden && !name.empty() && name[0] == '.') {
                continue;
            }

            std::error_code st_ec;
            auto st = it->symlink_status(st_ec);
            if (st_ec) {
                add_warning(result, fmt::format("{}: {}",
                                                path.lexically_relative(root).generic_string(),
                                                st_ec.message()));
                continue;
            }

            // Links are never followed, to files or directories
            if (fs::is_symlink(st)) {
                continue;
            }

            if (fs::is_directory(st)) {
                pending.push_back(path);
            } else if (fs::is_regular_file(st) && extensions_.matches(path)) {
                out.push_back({path, path.lexically_relative(root).generic_string()});
            }
        }

        if (ec) {
            add_warning(result, fmt::format("{}: listing stopped early: {}",
                                            dir.lexically_relative(root).generic_string(),
                                            ec.message()));
        }
    }
}

int LineCounter::worker_count(size_t jobs) const {
    int n = policy_.threads;
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    n = std::min(n, MAX_SCAN_THREADS);
    if (static_cast<size_t>(n) > jobs) n = static_cast<int>(jobs);
    return std::max(n, 1);
}

void LineCounter::tally(std::vector<Candidate>& files, ScanResult& result) const {
    std::vector<Result<FileCount>> outcomes(files.size(),
                                            Result<FileCount>::Err("not counted"));
    std::atomic<size_t> next{0};

    auto work = [&]() {
        for (size_t i = next++; i < files.size(); i = next++) {
            outcomes[i] = count_file(files[i].abs);
        }
    };

    // The calling thread is always one of the workers, so every file is
    // counted even if no extra thread can be started.
    std::vector<std::thread> workers;
    int extra = worker_count(files.size()) - 1;
    for (int i = 0; i < extra; ++i) {
        try {
            workers.emplace_back(work);
        } catch (const std::system_error& e) {
            ego_log(std::string("scan: could not start worker thread: ") + e.what());
            break;
        }
    }
    work();
    for (auto& t : workers) {
        t.join();
    }

    // Reduce in path order; the sums are order-independent, the warning list is sorted
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& outcome = outcomes[i];
        if (outcome.is_err()) {
            add_warning(result, files[i].rel + ": " + outcome.error);
            continue;
        }
        result.total_lines += outcome.value.lines;
        result.total_chars += outcome.value.chars;
        result.files_counted++;
        result.files.push_back({files[i].rel, outcome.value.size, outcome.value.hash});
    }
}
