#include "session_manager.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <map>
#include <set>

namespace fs = std::filesystem;

FileChanges diff_fingerprints(const std::vector<FileFingerprint>& before,
                              const std::vector<FileFingerprint>& after) {
    FileChanges changes;

    std::map<std::string, std::pair<uint64_t, uint64_t>> prev_map;
    for (const auto& f : before) {
        prev_map[f.path] = {f.size, f.hash};
    }

    std::set<std::string> current_set;
    for (const auto& f : after) {
        current_set.insert(f.path);
        auto it = prev_map.find(f.path);
        if (it == prev_map.end()) {
            changes.created.push_back(f.path);
        } else if (it->second.first != f.size || it->second.second != f.hash) {
            changes.modified.push_back(f.path);
        }
    }

    for (const auto& [path, _] : prev_map) {
        if (current_set.find(path) == current_set.end()) {
            changes.deleted.push_back(path);
        }
    }

    std::sort(changes.created.begin(), changes.created.end());
    std::sort(changes.modified.begin(), changes.modified.end());
    return changes;
}

SessionManager::SessionManager(SessionStore& store, const LineCounter& counter, Clock clock)
    : store_(store), counter_(counter), clock_(std::move(clock)) {
}

TimePoint SessionManager::now_seconds() const {
    return std::chrono::time_point_cast<std::chrono::seconds>(clock_());
}

Result<SessionRecord> SessionManager::begin_session(const std::string& project_dir) {
    if (store_.exists()) {
        auto active = store_.load();
        std::string where = active.is_ok() ? " for " + active.value.project_path : "";
        return Result<SessionRecord>::Err(ErrorCode::SessionAlreadyActive,
            fmt::format("A session is already active{}.", where));
    }

    if (project_dir.empty()) {
        return Result<SessionRecord>::Err(ErrorCode::InvalidPath, "No project directory given.");
    }

    std::error_code ec;
    fs::path resolved = fs::canonical(fs::path(project_dir), ec);
    if (ec) {
        return Result<SessionRecord>::Err(ErrorCode::InvalidPath,
            fmt::format("Project directory not found: {} ({})", project_dir, ec.message()));
    }
    if (!fs::is_directory(resolved, ec)) {
        return Result<SessionRecord>::Err(ErrorCode::InvalidPath,
            fmt::format("Not a directory: {}", resolved.string()));
    }

    auto scan = counter_.count_lines(resolved);
    if (scan.is_err()) {
        return Result<SessionRecord>::Err(scan.code, scan.error);
    }

    SessionRecord record;
    record.project_path = resolved.string();
    record.start_time = now_seconds();
    record.initial_line_count = scan.value.total_lines;
    record.initial_char_count = scan.value.total_chars;
    record.initial_files = std::move(scan.value.files);

    auto saved = store_.save(record);
    if (saved.is_err()) {
        return Result<SessionRecord>::Err(saved.code, saved.error);
    }

    ego_logf("session started: {} at {} ({} lines)",
             record.project_path, to_iso_utc(record.start_time), record.initial_line_count);
    return Result<SessionRecord>::Ok(std::move(record));
}

Result<SessionSummary> SessionManager::end_session() {
    auto loaded = store_.load();
    if (loaded.is_err()) {
        return Result<SessionSummary>::Err(loaded.code, loaded.error);
    }
    const SessionRecord& record = loaded.value;

    std::error_code ec;
    if (!fs::is_directory(record.project_path, ec)) {
        return Result<SessionSummary>::Err(ErrorCode::ProjectPathUnavailable,
            fmt::format("Project directory {} is no longer available.", record.project_path));
    }

    auto scan = counter_.count_lines(record.project_path);
    if (scan.is_err()) {
        return Result<SessionSummary>::Err(ErrorCode::ProjectPathUnavailable,
            fmt::format("Cannot re-scan {}: {}", record.project_path, scan.error));
    }

    SessionSummary summary;
    summary.project_path = record.project_path;
    summary.start_time = record.start_time;
    summary.end_time = now_seconds();
    summary.duration = elapsed_between(summary.start_time, summary.end_time);

    summary.initial_line_count = record.initial_line_count;
    summary.final_line_count = scan.value.total_lines;
    summary.lines_delta = static_cast<int64_t>(summary.final_line_count)
                        - static_cast<int64_t>(summary.initial_line_count);

    summary.initial_char_count = record.initial_char_count;
    summary.final_char_count = scan.value.total_chars;
    summary.chars_delta = static_cast<int64_t>(summary.final_char_count)
                        - static_cast<int64_t>(summary.initial_char_count);

    auto changes = diff_fingerprints(record.initial_files, scan.value.files);
    summary.files_created = changes.created.size();
    summary.files_modified = changes.modified.size();
    summary.files_deleted = changes.deleted.size();

    summary.files_skipped = scan.value.files_skipped;
    summary.warnings = std::move(scan.value.warnings);

    // Only now that the summary is complete does the record go away
    auto removed = store_.remove();
    if (removed.is_err() && removed.code != ErrorCode::NoActiveSession) {
        return Result<SessionSummary>::Err(removed.code, removed.error);
    }

    ego_logf("session ended: {} after {} ({:+} lines)",
             summary.project_path, format_duration(summary.duration), summary.lines_delta);
    return Result<SessionSummary>::Ok(std::move(summary));
}

Result<SessionStatus> SessionManager::status() const {
    auto loaded = store_.load();
    if (loaded.is_err()) {
        return Result<SessionStatus>::Err(loaded.code, loaded.error);
    }

    SessionStatus st;
    st.record = std::move(loaded.value);
    st.elapsed = elapsed_between(st.record.start_time, now_seconds());
    return Result<SessionStatus>::Ok(std::move(st));
}

Result<void> SessionManager::discard_session() {
    auto removed = store_.remove();
    if (removed.is_ok()) {
        ego_log("session discarded");
    }
    return removed;
}
