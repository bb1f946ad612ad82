#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <cstdint>

// Failure categories surfaced to the CLI
enum class ErrorCode {
    None,
    InvalidPath,              // supplied path missing, unreadable or not a directory
    SessionAlreadyActive,     // begin while a record exists
    NoActiveSession,          // end/status/discard without a record
    ProjectPathUnavailable,   // stored project path cannot be re-scanned at end
    CorruptRecord,            // record file exists but cannot be parsed
    IoError,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    ErrorCode code;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ErrorCode::None, ""};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, code, err};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, ErrorCode::IoError, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    ErrorCode code;
    std::string error;

    static Result<void> Ok() {
        return {true, ErrorCode::None, ""};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, code, err};
    }

    static Result<void> Err(const std::string& err) {
        return {false, ErrorCode::IoError, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using TimePoint = std::chrono::system_clock::time_point;

// Wall clock source; replaced in tests
using Clock = std::function<TimePoint()>;

// Fingerprint of one qualifying file, path relative to the scan root
struct FileFingerprint {
    std::string path;
    uint64_t size = 0;
    uint64_t hash = 0;
};

// Traversal and counting options for the line counter
struct ScanPolicy {
    bool include_hidden = true;
    std::vector<std::string> extra_extensions;   // lowercase, without leading dot
    int threads = 0;                             // 0 = hardware concurrency
};

// Totals from one full scan
struct ScanResult {
    uint64_t total_lines = 0;
    uint64_t total_chars = 0;                    // UTF-8 code points
    uint64_t files_counted = 0;
    uint64_t files_skipped = 0;
    std::vector<std::string> warnings;           // one per skipped file or directory
    std::vector<FileFingerprint> files;          // sorted by path
};

// Persisted between `start` and `end`
struct SessionRecord {
    std::string project_path;
    TimePoint start_time;
    uint64_t initial_line_count = 0;
    uint64_t initial_char_count = 0;
    std::vector<FileFingerprint> initial_files;
};

// Returned by end_session, never persisted
struct SessionSummary {
    std::string project_path;
    TimePoint start_time;
    TimePoint end_time;
    std::chrono::seconds duration{0};

    uint64_t initial_line_count = 0;
    uint64_t final_line_count = 0;
    int64_t lines_delta = 0;

    uint64_t initial_char_count = 0;
    uint64_t final_char_count = 0;
    int64_t chars_delta = 0;

    size_t files_created = 0;
    size_t files_modified = 0;
    size_t files_deleted = 0;

    uint64_t files_skipped = 0;
    std::vector<std::string> warnings;
};

// Read-only view of the active session
struct SessionStatus {
    SessionRecord record;
    std::chrono::seconds elapsed{0};
};
