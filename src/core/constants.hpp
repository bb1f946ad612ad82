#pragma once

#include <cstddef>

constexpr const char* EGO_VERSION = "0.2.0";

// ── Persisted layout ────────────────────────────────────────
// All relative to the ego root (<data_dir>/ego).
constexpr const char* CONFIG_FILE_NAME  = "config.yaml";
constexpr const char* SESSION_FILE_NAME = "session.yaml";
constexpr const char* STATE_DIR_NAME    = "state";
constexpr const char* DEBUG_LOG_NAME    = "ego_debug.log";

// Bumped when the session record layout changes incompatibly
constexpr int SESSION_RECORD_VERSION = 1;

// ── Scanning ────────────────────────────────────────────────
constexpr std::size_t READ_CHUNK_BYTES = 64 * 1024;
constexpr int MAX_SCAN_THREADS         = 32;
constexpr std::size_t MAX_WARNINGS_SHOWN = 5;   // report lists at most this many
