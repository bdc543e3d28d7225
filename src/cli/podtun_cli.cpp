#include "podtun_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <tunnel/direct_provider.hpp>
#include <ssh/gateway_provider.hpp>
#include <iostream>
#include <fmt/format.h>

PodtunCLI::PodtunCLI() {
    register_port_forward_commands(*this);
    register_exec_commands(*this);
    register_shell_commands(*this);
    register_transfer_commands(*this);
    register_setup_commands(*this);
}

void PodtunCLI::add_command(const std::string& name, CommandHandler handler, ArgSpec spec,
                            const std::string& usage, const std::string& help) {
    commands_[name] = {std::move(handler), spec, usage, help};
}

void PodtunCLI::print_version() const {
    std::cout << theme::color::TEAL << theme::color::BOLD << PROJECT_NAME
              << theme::color::RESET << theme::color::DIM
              << " version " << PODTUN_VERSION << theme::color::RESET << "\n";
}

void PodtunCLI::print_help() const {
    std::cout << "\n" << theme::title();
    std::cout << theme::section("Usage");
    for (const auto& [name, command] : commands_) {
        std::cout << theme::usage_row(fmt::format("{} {}", PROJECT_NAME, name), command.help);
        std::cout << theme::dim(fmt::format("      {} {} {}", PROJECT_NAME, name, command.usage)) << "\n";
    }
    std::cout << "\n";
    std::cout << theme::usage_row(fmt::format("{} --version", PROJECT_NAME), "Show version");
    std::cout << theme::usage_row(fmt::format("{} --help", PROJECT_NAME), "Show this help");
    std::cout << theme::section("Common options");
    std::cout << theme::usage_row("-c, --config PATH", "Config file (default ~/.podtun/config.yaml)");
    std::cout << theme::usage_row("-n, --namespace NS", "Pod namespace");
    std::cout << theme::usage_row("-p, --pod NAME", "Pod name");
    std::cout << theme::usage_row("-t, --timeout SECS", "Bound on opening remote streams");
    std::cout << "\n";
}

int PodtunCLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_help();
        return 1;
    }

    std::string name = argv[1];
    if (name == "--version" || name == "-V") {
        print_version();
        return 0;
    }
    if (name == "--help" || name == "-h" || name == "help") {
        print_help();
        return 0;
    }

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + name);
        std::cerr << theme::step(fmt::format("Run '{} --help' for available commands.", PROJECT_NAME));
        return 1;
    }

    const Command& command = it->second;
    std::vector<std::string> rest(argv + 2, argv + argc);
    auto args = parse_command_args(rest, command.spec);
    if (args.is_err()) {
        std::cerr << theme::fail(fmt::format("{}: {}", name, args.error));
        std::cerr << theme::step(fmt::format("usage: {} {} {}", PROJECT_NAME, name, command.usage));
        return 1;
    }
    if (args.value.help) {
        std::cout << theme::usage_row(fmt::format("{} {}", PROJECT_NAME, name), command.help);
        std::cout << theme::dim(fmt::format("      {} {} {}", PROJECT_NAME, name, command.usage)) << "\n";
        return 0;
    }

    try {
        return command.handler(*this, args.value);
    } catch (const std::exception& e) {
        log_error(fmt::format("{}: {}", name, e.what()));
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}

Result<Config> PodtunCLI::load_config(const CommandArgs& args) const {
    auto config = args.config_path ? Config::load_file(*args.config_path) : Config::load();
    if (config.is_ok()) {
        log_init(config.value.log());
        log_debug(fmt::format("Config: {}", config.value.source_path().empty()
                                                ? std::string("built-in defaults")
                                                : config.value.source_path().string()));
    }
    return config;
}

PodTarget PodtunCLI::resolve_target(const Config& config, const CommandArgs& args) const {
    PodTarget target;
    target.pod_name = args.pod_name.value_or(config.default_pod_name());
    target.pod_namespace = args.pod_namespace.value_or(config.default_namespace());
    target.timeout_secs = args.timeout_secs.value_or(config.timeout_secs());
    return target;
}

std::shared_ptr<RemoteStreamProvider> PodtunCLI::make_provider(boost::asio::io_context& io,
                                                               const Config& config,
                                                               int timeout_secs) const {
    const auto& provider = config.provider();
    std::chrono::seconds timeout(timeout_secs);
    if (provider.kind == ProviderKind::SshGateway) {
        auto gateway = provider.gateway;
        if (!gateway.private_key_path && !gateway.password)
            gateway.private_key_path = config.ssh_private_key_path();
        return std::make_shared<SshGatewayStreamProvider>(io, gateway, provider.host_template, timeout);
    }
    return std::make_shared<DirectStreamProvider>(io, provider.host_template, timeout);
}
