#pragma once

#include <string>
#include <core/types.hpp>

// Text panels printed by the CLI. Pure functions so they can be tested
// without a terminal.
namespace report {

// After `ego start`
std::string session_started(const SessionRecord& record);

// After `ego end`
std::string session_summary(const SessionSummary& summary);

// `ego status`
std::string session_status(const SessionStatus& status);

} // namespace report
