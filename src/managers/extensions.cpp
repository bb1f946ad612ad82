#include "extensions.hpp"
#include <core/utils.hpp>
#include <algorithm>

static std::vector<std::string> build_builtin() {
    std::vector<std::string> exts = {
        // Systems languages
        "c", "h", "cc", "cpp", "cxx", "hh", "hpp", "hxx", "inl", "rs", "go", "zig",
        // JVM / .NET
        "java", "kt", "kts", "scala", "groovy", "cs", "fs",
        // Scripting
        "py", "pyi", "rb", "pl", "pm", "php", "lua", "r", "jl",
        "sh", "bash", "zsh", "fish", "ps1",
        // Web
        "js", "jsx", "mjs", "cjs", "ts", "tsx", "vue", "svelte",
        "html", "htm", "css", "scss", "sass", "less",
        // Mobile / functional
        "swift", "m", "mm", "dart", "hs", "ml", "mli", "ex", "exs", "erl", "clj", "elm",
        // Data, config and docs
        "sql", "proto", "graphql", "json", "yaml", "yml", "toml", "ini", "cfg", "xml",
        "md", "rst", "txt", "tex", "cmake", "gradle",
    };
    std::sort(exts.begin(), exts.end());
    exts.erase(std::unique(exts.begin(), exts.end()), exts.end());
    return exts;
}

const std::vector<std::string>& recognized_extensions() {
    static const std::vector<std::string> builtin = build_builtin();
    return builtin;
}

ExtensionSet::ExtensionSet() : exts_(recognized_extensions()) {}

ExtensionSet::ExtensionSet(const std::vector<std::string>& extra)
    : exts_(recognized_extensions()) {
    for (const auto& e : extra) {
        auto lower = to_lower(e);
        if (!lower.empty() && lower[0] == '.') lower.erase(0, 1);
        if (!lower.empty()) exts_.push_back(lower);
    }
    std::sort(exts_.begin(), exts_.end());
    exts_.erase(std::unique(exts_.begin(), exts_.end()), exts_.end());
}

bool ExtensionSet::contains(const std::string& ext) const {
    return std::binary_search(exts_.begin(), exts_.end(), to_lower(ext));
}

bool ExtensionSet::matches(const fs::path& path) const {
    auto ext = path.extension().string();
    if (ext.size() < 2) {
        return false;
    }
    return contains(ext.substr(1));
}
