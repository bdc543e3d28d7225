#include "ssh_helpers.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <ssh/sftp_transfer.hpp>
#include <iostream>
#include <fmt/format.h>

static int run_transfer(PodtunCLI& cli, const CommandArgs& args, TransferDirection direction) {
    const char* name = direction == TransferDirection::Upload ? "put" : "get";
    auto plan = plan_ssh_tunnel(cli, args);
    if (plan.is_err()) {
        std::cerr << theme::fail(plan.error);
        return 1;
    }

    // get REMOTE LOCAL, put LOCAL REMOTE
    const std::string& source = args.paths[0];
    const std::string& destination = args.paths[1];
    std::string local = direction == TransferDirection::Upload ? expand_home(source) : expand_home(destination);
    std::string remote = direction == TransferDirection::Upload ? destination : source;

    boost::asio::io_context io;
    auto transfer = std::make_shared<SftpTransfer>(io, plan.value.ssh, direction, local, remote);
    TaskOutcome outcome = run_over_ssh_tunnel(cli, plan.value, io, transfer);
    if (outcome.is_err()) return exit_code_for(name, outcome, 1);
    if (!transfer->completed()) {
        std::cerr << theme::fail(fmt::format("{}: transfer cancelled", name));
        return 1;
    }

    std::cout << theme::ok(fmt::format("{} {} -> {} ({} bytes)",
                                       direction == TransferDirection::Upload ? "Uploaded" : "Downloaded",
                                       source, destination, transfer->bytes_transferred()));
    return 0;
}

static int do_get(PodtunCLI& cli, const CommandArgs& args) {
    return run_transfer(cli, args, TransferDirection::Download);
}

static int do_put(PodtunCLI& cli, const CommandArgs& args) {
    return run_transfer(cli, args, TransferDirection::Upload);
}

void register_transfer_commands(PodtunCLI& cli) {
    ArgSpec spec;
    spec.ssh = true;
    spec.paths = 2;
    cli.add_command("get", do_get, spec,
                    "[-c cfg] [-n ns] [-p pod] [-t secs] [-u user] [-i keyfile] REMOTE_PATH LOCAL_PATH",
                    "Download a file from a pod over SFTP through a tunnel");
    cli.add_command("put", do_put, spec,
                    "[-c cfg] [-n ns] [-p pod] [-t secs] [-u user] [-i keyfile] LOCAL_PATH REMOTE_PATH",
                    "Upload a file to a pod over SFTP through a tunnel");
}
