#include "report.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace report {

std::string session_started(const SessionRecord& record) {
    std::string out = theme::section("Session started");
    out += theme::kv("Project", theme::yellow(record.project_path));
    out += theme::kv("Started", format_local(record.start_time));
    out += theme::kv("Lines", fmt::format("{}", record.initial_line_count));
    out += theme::kv("Characters", fmt::format("{}", record.initial_char_count));
    out += theme::kv("Files", fmt::format("{}", record.initial_files.size()));
    out += "\n";
    out += theme::dim("    Run 'ego end' when you are done.") + "\n";
    return out;
}

std::string session_summary(const SessionSummary& s) {
    std::string out = theme::section("Session stats");
    out += theme::kv("Project", theme::yellow(s.project_path));
    out += theme::kv("Duration", theme::blue(format_clock(s.duration)));
    out += theme::divider();

    out += theme::kv("Lines before", fmt::format("{}", s.initial_line_count));
    out += theme::kv("Lines after", fmt::format("{}", s.final_line_count));
    out += theme::kv("Lines written", theme::signed_count(s.lines_delta));
    out += theme::kv("Chars written", theme::signed_count(s.chars_delta));

    out += theme::section("File changes");
    out += theme::kv("Created", theme::green(fmt::format("{}", s.files_created)));
    out += theme::kv("Modified", theme::yellow(fmt::format("{}", s.files_modified)));
    out += theme::kv("Deleted", theme::red(fmt::format("{}", s.files_deleted)));

    if (s.files_skipped > 0) {
        out += "\n";
        out += theme::warn(fmt::format("{} file(s) could not be counted", s.files_skipped));
        size_t shown = 0;
        for (const auto& w : s.warnings) {
            if (shown++ == MAX_WARNINGS_SHOWN) {
                out += theme::dim(fmt::format("      ... and {} more", s.warnings.size() - MAX_WARNINGS_SHOWN)) + "\n";
                break;
            }
            out += theme::dim("      " + w) + "\n";
        }
    }
    out += "\n";
    return out;
}

std::string session_status(const SessionStatus& st) {
    std::string out = theme::section("Active session");
    out += theme::kv("Project", theme::yellow(st.record.project_path));
    out += theme::kv("Started", format_local(st.record.start_time));
    out += theme::kv("Elapsed", theme::blue(format_duration(st.elapsed)));
    out += theme::kv("Lines at start", fmt::format("{}", st.record.initial_line_count));
    out += "\n";
    return out;
}

} // namespace report
