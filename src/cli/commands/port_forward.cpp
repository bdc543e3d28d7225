#include "../podtun_cli.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <tunnel/forward_spec.hpp>
#include <tunnel/interrupt_watcher.hpp>
#include <tunnel/listener.hpp>
#include <tunnel/reaper.hpp>
#include <tunnel/supervisor.hpp>
#include <iostream>
#include <fmt/format.h>

static Result<std::vector<PortMapping>> collect_mappings(const Config& config, const CommandArgs& args) {
    if (args.forwards.empty()) {
        return Result<std::vector<PortMapping>>::Ok(config.port_mappings());
    }
    std::vector<PortMapping> mappings;
    for (const auto& text : args.forwards) {
        auto mapping = PortMapping::parse(text);
        if (mapping.is_err()) return Result<std::vector<PortMapping>>::Err(mapping.error);
        mappings.push_back(mapping.value);
    }
    return Result<std::vector<PortMapping>>::Ok(mappings);
}

static int do_port_forward(PodtunCLI& cli, const CommandArgs& args) {
    auto config = cli.load_config(args);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }

    auto mappings = collect_mappings(config.value, args);
    if (mappings.is_err()) {
        std::cerr << theme::fail(mappings.error);
        return 1;
    }
    if (mappings.value.empty()) {
        std::cerr << theme::fail("No port mappings to forward.");
        std::cerr << theme::step("Pass -L ADDRESS:LOCAL_PORT:CONTAINER_PORT or set portMappings in the config.");
        return 1;
    }

    PodTarget target = cli.resolve_target(config.value, args);
    const auto& tunnel = config.value.tunnel();

    boost::asio::io_context io;
    Supervisor supervisor(io, std::chrono::seconds(tunnel.drain_deadline_secs));
    auto provider = cli.make_provider(io, config.value, target.timeout_secs);

    // Announce once every listener has bound.
    auto remaining = std::make_shared<size_t>(mappings.value.size());
    ReadyCallback on_ready = [remaining](const boost::asio::ip::tcp::endpoint&) {
        if (--*remaining == 0) std::cout << theme::ok("Forwarders started. Use Ctrl+C to stop.");
    };

    for (const auto& mapping : mappings.value) {
        auto spec = ForwardSpec::from_mapping(mapping, target.pod_name, target.pod_namespace);
        if (spec.is_err()) {
            std::cerr << theme::fail(spec.error);
            return 1;
        }
        supervisor.spawn(spec.value.task_name(),
                         Listener::task(supervisor, spec.value, provider, on_ready));
    }
    supervisor.spawn("interrupt-watcher", InterruptWatcher::task(supervisor));
    supervisor.spawn("reaper", Reaper::task(supervisor, std::chrono::seconds(tunnel.reaper_interval_secs)));

    log_debug(fmt::format("port-forward: {} mapping(s) to {}/{} via {}", mappings.value.size(),
                          target.pod_namespace, target.pod_name, provider->name()));

    TaskOutcome outcome = supervisor.serve();
    if (outcome.is_err()) {
        log_debug(fmt::format("port-forward: {}", outcome.describe()));
        std::cerr << theme::fail(outcome.describe());
        std::cerr << theme::step(fmt::format("Connection log: {}", log_path()));
        return 1;
    }
    log_info("Port forwarding stopped");
    return 0;
}

void register_port_forward_commands(PodtunCLI& cli) {
    ArgSpec spec;
    spec.forwards = true;
    cli.add_command("port-forward", do_port_forward, spec,
                    "[-c cfg] [-n ns] [-p pod] [-t secs] [-L ADDR:LOCAL:REMOTE]...",
                    "Forward local ports to a pod until Ctrl+C");
}
