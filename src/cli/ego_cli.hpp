#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <iostream>
#include <core/config.hpp>

class EgoCLI {
public:
    // Loads the global config; a broken config is reported when a command needs it.
    explicit EgoCLI(std::ostream& out = std::cout);
    EgoCLI(Config config, std::ostream& out);

    using CommandHandler = std::function<int(EgoCLI&, const std::vector<std::string>&)>;

    // Runs one command, returns the process exit code.
    int execute_command(const std::string& command, const std::vector<std::string>& args = {});
    bool has_command(const std::string& command) const;
    void print_help() const;

    int run_start(const std::string& project_dir);
    int run_end();
    int run_status();
    int run_discard();

private:
    void add_command(const std::string& name, CommandHandler handler, const std::string& help);
    void register_all_commands();
    bool require_config();
    int report_error(ErrorCode code, const std::string& message);

    std::optional<Config> config_;
    std::string config_error_;
    std::ostream& out_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::vector<std::string> command_order_;
};
