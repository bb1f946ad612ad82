#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "line_counter.hpp"
#include "session_store.hpp"

// File-level differences between two scans of the same tree
struct FileChanges {
    std::vector<std::string> created;
    std::vector<std::string> modified;
    std::vector<std::string> deleted;
};

// Compare fingerprint lists (each sorted or not) by relative path.
FileChanges diff_fingerprints(const std::vector<FileFingerprint>& before,
                              const std::vector<FileFingerprint>& after);

// Session lifecycle: NoSession → begin → Active → end | discard → NoSession.
// Transitions that don't exist are rejected with an error, never ignored.
class SessionManager {
public:
    SessionManager(SessionStore& store, const LineCounter& counter,
                   Clock clock = [] { return std::chrono::system_clock::now(); });

    // Scan `project_dir` and persist a new record. The directory is resolved
    // to an absolute canonical path. Nothing is written if the scan fails.
    Result<SessionRecord> begin_session(const std::string& project_dir);

    // Re-scan the recorded project, build the summary, then clear the record.
    // If the project can't be scanned the record is kept so `end` can be retried.
    Result<SessionSummary> end_session();

    // Active record and elapsed time, without changing anything.
    Result<SessionStatus> status() const;

    // Drop the active record (even an unreadable one) without a summary.
    Result<void> discard_session();

private:
    TimePoint now_seconds() const;

    SessionStore& store_;
    const LineCounter& counter_;
    Clock clock_;
};
