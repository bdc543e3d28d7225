#include "ssh_helpers.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <tunnel/forward_spec.hpp>
#include <tunnel/interrupt_watcher.hpp>
#include <tunnel/listener.hpp>
#include <tunnel/readiness.hpp>
#include <tunnel/reaper.hpp>
#include <tunnel/supervisor.hpp>
#include <iostream>
#include <fmt/format.h>

Result<SshTunnelPlan> plan_ssh_tunnel(PodtunCLI& cli, const CommandArgs& args) {
    auto config = cli.load_config(args);
    if (config.is_err()) return Result<SshTunnelPlan>::Err(config.error);

    SshTunnelPlan plan;
    plan.config = config.value;
    plan.target = cli.resolve_target(plan.config, args);
    plan.ssh.user = args.ssh_user.value_or(plan.config.ssh_user());
    plan.ssh.private_key_path = args.identity_file ? args.identity_file : plan.config.ssh_private_key_path();
    plan.ssh.timeout_secs = plan.target.timeout_secs;
    return Result<SshTunnelPlan>::Ok(plan);
}

TaskOutcome run_over_ssh_tunnel(PodtunCLI& cli, const SshTunnelPlan& plan,
                                boost::asio::io_context& io, std::shared_ptr<TunnelSession> session) {
    PortMapping mapping;
    mapping.address = "127.0.0.1";
    mapping.local_port = 0;
    mapping.container_port = static_cast<uint16_t>(plan.config.ssh_port());
    auto spec = ForwardSpec::from_mapping(mapping, plan.target.pod_name, plan.target.pod_namespace);
    if (spec.is_err()) return TaskOutcome::Err(ErrorKind::Config, spec.error);

    const auto& tunnel = plan.config.tunnel();
    Supervisor supervisor(io, std::chrono::seconds(tunnel.drain_deadline_secs));
    auto provider = cli.make_provider(io, plan.config, plan.target.timeout_secs);

    auto channel = Readiness::channel(io);
    TaskHandle forwarder = supervisor.spawn(
        spec.value.task_name(),
        Listener::task(supervisor, spec.value, provider, Readiness::as_callback(channel.second)));
    channel.second.reset();  // the listener task holds the only producer

    supervisor.spawn("interrupt-watcher", InterruptWatcher::task(supervisor));
    supervisor.spawn("reaper", Reaper::task(supervisor, std::chrono::seconds(tunnel.reaper_interval_secs)));
    supervisor.spawn("ssh-session",
                     ReadinessConsumer::task(supervisor, channel.first, forwarder, std::move(session)));

    log_debug(fmt::format("SSH to {}/{} port {} as {} via {}", plan.target.pod_namespace,
                          plan.target.pod_name, mapping.container_port, plan.ssh.user, provider->name()));
    return supervisor.serve();
}

int exit_code_for(const std::string& command, const TaskOutcome& outcome, int remote_status) {
    if (outcome.is_ok()) return 0;
    log_debug(fmt::format("{}: {}", command, outcome.describe()));
    if (outcome.error.kind == ErrorKind::CommandFailed) return remote_status;
    std::cerr << theme::fail(outcome.describe());
    std::cerr << theme::step(fmt::format("Connection log: {}", log_path()));
    return 1;
}
