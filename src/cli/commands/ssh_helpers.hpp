#pragma once

#include "../podtun_cli.hpp"
#include <boost/asio/io_context.hpp>
#include <ssh/ssh_session.hpp>
#include <tunnel/readiness_consumer.hpp>
#include <memory>
#include <string>

// Shared by the commands that reach the pod's SSH server through a tunnel
// (exec.cpp, shell.cpp, transfer.cpp)

struct SshTunnelPlan {
    Config config;
    PodTarget target;
    SshTarget ssh;      // credentials only; host and port come from the tunnel
};

// Loads the config and resolves pod and SSH credentials from flags.
Result<SshTunnelPlan> plan_ssh_tunnel(PodtunCLI& cli, const CommandArgs& args);

// Forwards an ephemeral loopback port to the pod's SSH port, runs `session`
// through it once bound, and serves the group until everything stopped.
TaskOutcome run_over_ssh_tunnel(PodtunCLI& cli, const SshTunnelPlan& plan,
                                boost::asio::io_context& io, std::shared_ptr<TunnelSession> session);

// Process exit code for a finished SSH session. CommandFailed passes the
// remote status through silently; other errors are printed.
int exit_code_for(const std::string& command, const TaskOutcome& outcome, int remote_status);
