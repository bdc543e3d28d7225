#include "ssh_helpers.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <ssh/remote_command.hpp>
#include <cstdio>
#include <iostream>

static int do_exec(PodtunCLI& cli, const CommandArgs& args) {
    if (args.command.empty()) {
        std::cerr << theme::fail("exec: no command given");
        return 1;
    }

    auto plan = plan_ssh_tunnel(cli, args);
    if (plan.is_err()) {
        std::cerr << theme::fail(plan.error);
        return 1;
    }

    boost::asio::io_context io;
    auto command = std::make_shared<RemoteCommand>(io, plan.value.ssh, shell_join(args.command),
        [](const char* data, std::size_t n) {
            std::fwrite(data, 1, n, stdout);
            std::fflush(stdout);
        },
        [](const char* data, std::size_t n) {
            std::fwrite(data, 1, n, stderr);
            std::fflush(stderr);
        });

    TaskOutcome outcome = run_over_ssh_tunnel(cli, plan.value, io, command);
    return exit_code_for("exec", outcome, command->exit_status());
}

void register_exec_commands(PodtunCLI& cli) {
    ArgSpec spec;
    spec.ssh = true;
    spec.trailing_command = true;
    cli.add_command("exec", do_exec, spec,
                    "[-c cfg] [-n ns] [-p pod] [-t secs] [-u user] [-i keyfile] [--] command...",
                    "Run a command in a pod over SSH through a tunnel");
}
