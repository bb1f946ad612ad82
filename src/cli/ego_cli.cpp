#include "ego_cli.hpp"
#include "report.hpp"
#include "theme.hpp"
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <managers/line_counter.hpp>
#include <managers/session_manager.hpp>
#include <managers/session_store.hpp>
#include <fmt/format.h>

EgoCLI::EgoCLI(std::ostream& out) : out_(out) {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config_ = config_result.value;
    } else {
        config_error_ = config_result.error;
        ego_log("config: " + config_error_);
    }
    register_all_commands();
}

EgoCLI::EgoCLI(Config config, std::ostream& out) : config_(std::move(config)), out_(out) {
    register_all_commands();
}

void EgoCLI::add_command(const std::string& name, CommandHandler handler,
                         const std::string& help) {
    if (!commands_.count(name)) command_order_.push_back(name);
    commands_[name] = {handler, help};
}

void EgoCLI::register_all_commands() {
    add_command("start", [](EgoCLI& cli, const std::vector<std::string>& args) {
        if (args.size() != 1) {
            cli.out_ << theme::fail("Expected exactly one project directory.");
            cli.out_ << theme::step("Usage: ego start <PROJECT_DIRECTORY>");
            return 1;
        }
        return cli.run_start(args[0]);
    }, "Start a session in a project directory");

    add_command("end", [](EgoCLI& cli, const std::vector<std::string>&) {
        return cli.run_end();
    }, "End the session and show stats");

    add_command("status", [](EgoCLI& cli, const std::vector<std::string>&) {
        return cli.run_status();
    }, "Show the active session");

    add_command("discard", [](EgoCLI& cli, const std::vector<std::string>&) {
        return cli.run_discard();
    }, "Drop the active session without stats");
}

bool EgoCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

bool EgoCLI::require_config() {
    if (!config_.has_value()) {
        out_ << theme::fail(config_error_);
        out_ << theme::step("Fix or remove " + get_global_config_path().string());
        return false;
    }
    return true;
}

int EgoCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        out_ << theme::fail("Unknown command: " + command);
        out_ << theme::step("Run 'ego --help' for available commands.");
        return 1;
    }

    try {
        return it->second.first(*this, args);
    } catch (const std::exception& e) {
        ego_log(fmt::format("{} failed: {}", command, e.what()));
        out_ << theme::fail(std::string(e.what()));
        return 1;
    }
}

void EgoCLI::print_help() const {
    out_ << theme::section("Commands");
    for (const auto& name : command_order_) {
        auto it = commands_.find(name);
        out_ << theme::color::CYAN
             << fmt::format("    {:<10}", name)
             << theme::color::RESET
             << theme::color::DIM
             << it->second.second
             << theme::color::RESET << "\n";
    }
    out_ << "\n";
}

int EgoCLI::report_error(ErrorCode code, const std::string& message) {
    ego_logf("{}: {}", error_code_name(code), message);
    out_ << theme::fail(message);
    switch (code) {
        case ErrorCode::SessionAlreadyActive:
            out_ << theme::step("Run 'ego end' to finish it, or 'ego discard' to drop it.");
            break;
        case ErrorCode::NoActiveSession:
            out_ << theme::step("Start one with 'ego start <PROJECT_DIRECTORY>'.");
            break;
        case ErrorCode::ProjectPathUnavailable:
            out_ << theme::step("Restore the directory and run 'ego end' again, or 'ego discard'.");
            break;
        case ErrorCode::CorruptRecord:
            out_ << theme::step("Run 'ego discard' to clear it.");
            break;
        default:
            break;
    }
    return 1;
}

int EgoCLI::run_start(const std::string& project_dir) {
    if (!require_config()) return 1;

    ensure_ego_directory_structure(config_->state_dir());
    SessionStore store(config_->state_dir());
    LineCounter counter(config_->scan_policy());
    SessionManager manager(store, counter);

    auto result = manager.begin_session(project_dir);
    if (result.is_err()) {
        return report_error(result.code, result.error);
    }
    out_ << report::session_started(result.value);
    return 0;
}

int EgoCLI::run_end() {
    if (!require_config()) return 1;

    SessionStore store(config_->state_dir());
    LineCounter counter(config_->scan_policy());
    SessionManager manager(store, counter);

    auto result = manager.end_session();
    if (result.is_err()) {
        return report_error(result.code, result.error);
    }
    out_ << report::session_summary(result.value);
    return 0;
}

int EgoCLI::run_status() {
    if (!require_config()) return 1;

    SessionStore store(config_->state_dir());
    LineCounter counter(config_->scan_policy());
    SessionManager manager(store, counter);

    auto result = manager.status();
    if (result.is_err()) {
        return report_error(result.code, result.error);
    }
    out_ << report::session_status(result.value);
    return 0;
}

int EgoCLI::run_discard() {
    if (!require_config()) return 1;

    SessionStore store(config_->state_dir());
    LineCounter counter(config_->scan_policy());
    SessionManager manager(store, counter);

    auto result = manager.discard_session();
    if (result.is_err()) {
        return report_error(result.code, result.error);
    }
    out_ << theme::ok("Session discarded.");
    return 0;
}
