#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Options shared by podtun subcommands. Unset fields fall back to config.
struct CommandArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> pod_name;
    std::optional<std::string> pod_namespace;
    std::optional<int> timeout_secs;
    std::vector<std::string> forwards;          // -L, raw ADDRESS:LOCAL:REMOTE
    std::optional<std::string> ssh_user;
    std::optional<std::string> identity_file;
    std::vector<std::string> command;           // exec, shell: remote argv
    std::vector<std::string> paths;             // get, put: SOURCE DESTINATION
    bool help = false;
};

// Which options a subcommand accepts beyond -c/-n/-p/-t/-h.
struct ArgSpec {
    bool forwards = false;          // -L / --forward
    bool ssh = false;               // -u / --user, -i / --identity
    bool trailing_command = false;  // first positional starts the command
    std::size_t paths = 0;          // exact number of positional paths
};

// Accepts "-n ns", "--namespace ns" and "--namespace=ns". "--" ends options.
Result<CommandArgs> parse_command_args(const std::vector<std::string>& argv, const ArgSpec& spec);
