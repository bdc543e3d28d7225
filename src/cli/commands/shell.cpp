#include "ssh_helpers.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <ssh/interactive_shell.hpp>
#include <iostream>

static int do_shell(PodtunCLI& cli, const CommandArgs& args) {
    auto plan = plan_ssh_tunnel(cli, args);
    if (plan.is_err()) {
        std::cerr << theme::fail(plan.error);
        return 1;
    }

    // No command: the user's login shell.
    boost::asio::io_context io;
    auto shell = std::make_shared<InteractiveShell>(io, plan.value.ssh, shell_join(args.command));
    TaskOutcome outcome = run_over_ssh_tunnel(cli, plan.value, io, shell);
    return exit_code_for("shell", outcome, shell->exit_status());
}

void register_shell_commands(PodtunCLI& cli) {
    ArgSpec spec;
    spec.ssh = true;
    spec.trailing_command = true;
    cli.add_command("shell", do_shell, spec,
                    "[-c cfg] [-n ns] [-p pod] [-t secs] [-u user] [-i keyfile] [--] [command...]",
                    "Open an interactive shell in a pod over SSH through a tunnel");
}
