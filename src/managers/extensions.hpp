#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// File extensions (lowercase, no dot) whose files are line-counted.
// Sorted so lookups can binary search.
const std::vector<std::string>& recognized_extensions();

// Extension set used by one scan: the built-in list plus optional extras.
class ExtensionSet {
public:
    ExtensionSet();
    explicit ExtensionSet(const std::vector<std::string>& extra);

    // Case-insensitive match on the final extension of `path`.
    // Files without an extension ("Makefile") never match.
    bool matches(const fs::path& path) const;
    bool contains(const std::string& ext) const;

    size_t size() const { return exts_.size(); }

private:
    std::vector<std::string> exts_;   // sorted, unique
};
