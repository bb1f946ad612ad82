#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Single-slot store for the active session record: <state_dir>/session.yaml.
//
// The slot is either absent or holds one record. Writes go through a sibling
// temp file that is renamed into place, so an interrupted save leaves either
// the old state or the new one, never a partial record. A leftover temp file
// does not count as a record.
class SessionStore {
public:
    explicit SessionStore(const fs::path& state_dir);

    // True if the slot holds a record file (parseable or not).
    bool exists() const;

    // Fails with NoActiveSession if absent, CorruptRecord if unparseable.
    Result<SessionRecord> load() const;

    // Replace the slot's contents.
    Result<void> save(const SessionRecord& record);

    // Empty the slot. NoActiveSession if it was already empty.
    Result<void> remove();

    const fs::path& path() const { return record_path_; }

private:
    fs::path record_path_;
};
