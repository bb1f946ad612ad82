#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include "extensions.hpp"

namespace fs = std::filesystem;

// Counts for one file's content
struct FileCount {
    uint64_t lines = 0;
    uint64_t chars = 0;
    uint64_t size = 0;
    uint64_t hash = 0;      // FNV-1a over the raw bytes
};

// Incremental line/char tally over a byte stream.
//
// Lines are '\n'-delimited segments; a non-empty unterminated final segment
// counts as one more line, so "a\nb" and "a\nb\n" are both 2 lines. "\r\n"
// counts once. Chars are UTF-8 code points (continuation bytes skipped).
// Any NUL byte marks the content as binary.
class LineTally {
public:
    void feed(const char* data, size_t len);
    FileCount finish() const;
    bool binary() const { return binary_; }

private:
    uint64_t lines_ = 0;
    uint64_t chars_ = 0;
    uint64_t size_ = 0;
    uint64_t hash_ = 14695981039346656037ULL;
    char last_ = '\n';
    bool binary_ = false;
};

// Count a single file. Fails (with a message, never throws) when the file
// cannot be opened or read, or holds binary content.
Result<FileCount> count_file(const fs::path& path);

class LineCounter {
public:
    explicit LineCounter(ScanPolicy policy = ScanPolicy{});

    // Walk `root` and total every qualifying file.
    //
    // A regular-file root is scanned as a one-file tree. A missing root, or a
    // directory root that cannot be listed, fails with InvalidPath. Failures
    // below the root are per-entry warnings in the result, never errors.
    Result<ScanResult> count_lines(const fs::path& root) const;

    const ScanPolicy& policy() const { return policy_; }
    const ExtensionSet& extensions() const { return extensions_; }

private:
    struct Candidate {
        fs::path abs;
        std::string rel;
    };

    void collect(const fs::path& root, std::vector<Candidate>& out, ScanResult& result) const;
    void tally(std::vector<Candidate>& files, ScanResult& result) const;
    int worker_count(size_t jobs) const;

    ScanPolicy policy_;
    ExtensionSet extensions_;
};
