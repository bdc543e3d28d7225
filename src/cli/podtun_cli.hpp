#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <core/config.hpp>
#include <tunnel/remote_stream_provider.hpp>
#include "args.hpp"

// Resolved target of one podtun invocation: flags over config over defaults.
struct PodTarget {
    std::string pod_name;
    std::string pod_namespace;
    int timeout_secs;
};

class PodtunCLI {
public:
    using CommandHandler = std::function<int(PodtunCLI&, const CommandArgs&)>;

    PodtunCLI();

    void add_command(const std::string& name, CommandHandler handler, ArgSpec spec,
                     const std::string& usage, const std::string& help);

    // Dispatches argv[1]; returns the process exit code.
    int run(int argc, char** argv);

    void print_help() const;
    void print_version() const;

    // Loads the config named by -c (or the global one) and initialises logging.
    Result<Config> load_config(const CommandArgs& args) const;

    PodTarget resolve_target(const Config& config, const CommandArgs& args) const;

    std::shared_ptr<RemoteStreamProvider> make_provider(boost::asio::io_context& io,
                                                        const Config& config,
                                                        int timeout_secs) const;

private:
    struct Command {
        CommandHandler handler;
        ArgSpec spec;
        std::string usage;
        std::string help;
    };

    std::map<std::string, Command> commands_;
};

void register_port_forward_commands(PodtunCLI& cli);
void register_exec_commands(PodtunCLI& cli);
void register_shell_commands(PodtunCLI& cli);
void register_transfer_commands(PodtunCLI& cli);
void register_setup_commands(PodtunCLI& cli);
