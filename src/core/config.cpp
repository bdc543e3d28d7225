#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

Config::Config()
    : default_pod_name_(DEFAULT_POD_NAME),
      default_namespace_(DEFAULT_NAMESPACE),
      timeout_secs_(DEFAULT_TIMEOUT_SECS),
      ssh_port_(DEFAULT_SSH_PORT),
      ssh_user_(DEFAULT_SSH_USER) {
    tunnel_.drain_deadline_secs = DRAIN_DEADLINE_SECS;
    tunnel_.reaper_interval_secs = REAPER_INTERVAL_SECS;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".podtun";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CLI_CONFIG_NAME;
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    if (config_path.has_parent_path()) fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                  ": " + ec.message());
    }

    const char* default_config = R"(# podtun configuration

defaultPodName: "podtun"
defaultNamespace: "default"
timeoutSeconds: 15

# SSH server inside the pod (used by `podtun exec`)
sshPort: 22
sshUser: "root"
# sshPrivateKeyFilePath: "~/.ssh/id_ed25519"

# Forwarded by `podtun port-forward` when no -L flag is given.
# Format: ADDRESS:LOCAL_PORT:CONTAINER_PORT
portMappings: []

tunnel:
  drainDeadlineSeconds: 5
  reaperIntervalSeconds: 5

# How remote streams to a pod are opened:
#   direct       dial hostTemplate:port over TCP
#   ssh-gateway  direct-tcpip channel through an SSH bastion
provider:
  kind: "direct"
  hostTemplate: "{pod}.{namespace}"
  # gateway:
  #   host: "bastion.example.com"
  #   port: 22
  #   user: "ops"
  #   privateKeyFilePath: "~/.ssh/id_ed25519"

log:
  level: "info"
  console: true
  # filePath: "/tmp/podtun.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Section parsers ───────────────────────────────────────────

static Result<void> parse_tunnel_config(const YAML::Node& node, TunnelConfig& tunnel) {
    tunnel.drain_deadline_secs = node["drainDeadlineSeconds"].as<int>(DRAIN_DEADLINE_SECS);
    tunnel.reaper_interval_secs = node["reaperIntervalSeconds"].as<int>(REAPER_INTERVAL_SECS);

    if (tunnel.drain_deadline_secs < 0)
        return Result<void>::Err("tunnel.drainDeadlineSeconds must not be negative");
    if (tunnel.reaper_interval_secs <= 0)
        return Result<void>::Err("tunnel.reaperIntervalSeconds must be positive");
    return Result<void>::Ok();
}

static Result<void> parse_provider_config(const YAML::Node& node, ProviderConfig& provider) {
    std::string kind = node["kind"].as<std::string>("direct");
    if (kind == "direct") {
        provider.kind = ProviderKind::Direct;
    } else if (kind == "ssh-gateway") {
        provider.kind = ProviderKind::SshGateway;
    } else {
        return Result<void>::Err(fmt::format(
            "provider.kind: unknown provider '{}' (expected 'direct' or 'ssh-gateway')", kind));
    }

    provider.host_template = node["hostTemplate"].as<std::string>(provider.host_template);
    auto rendered = render_host_template(provider.host_template, "pod", "namespace");
    if (rendered.is_err())
        return Result<void>::Err("provider.hostTemplate: " + rendered.error);

    if (node["gateway"] && node["gateway"].IsMap()) {
        const auto& gw = node["gateway"];
        provider.gateway.host = gw["host"].as<std::string>("");
        provider.gateway.port = gw["port"].as<int>(22);
        provider.gateway.user = gw["user"].as<std::string>("");
        if (gw["privateKeyFilePath"])
            provider.gateway.private_key_path = expand_home(gw["privateKeyFilePath"].as<std::string>());
        if (gw["password"])
            provider.gateway.password = gw["password"].as<std::string>();
    }

    if (provider.kind == ProviderKind::SshGateway) {
        if (provider.gateway.host.empty())
            return Result<void>::Err("provider.gateway.host is required for 'ssh-gateway'");
        if (provider.gateway.user.empty())
            return Result<void>::Err("provider.gateway.user is required for 'ssh-gateway'");
        if (provider.gateway.port <= 0 || provider.gateway.port > 65535)
            return Result<void>::Err("provider.gateway.port is out of range");
    }
    return Result<void>::Ok();
}

static Result<void> parse_log_config(const YAML::Node& node, LogConfig& log) {
    if (node["filePath"])
        log.file_path = expand_home(node["filePath"].as<std::string>());
    if (node["level"]) {
        std::string level = node["level"].as<std::string>();
        if (!parse_log_level(level, log.level))
            return Result<void>::Err(fmt::format("log.level: unknown level '{}'", level));
    }
    log.console = node["console"].as<bool>(true);
    return Result<void>::Ok();
}

// ── Loading ───────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        config.default_pod_name_ = root["defaultPodName"].as<std::string>(DEFAULT_POD_NAME);
        config.default_namespace_ = root["defaultNamespace"].as<std::string>(DEFAULT_NAMESPACE);
        config.timeout_secs_ = root["timeoutSeconds"].as<int>(DEFAULT_TIMEOUT_SECS);
        config.ssh_port_ = root["sshPort"].as<int>(DEFAULT_SSH_PORT);
        config.ssh_user_ = root["sshUser"].as<std::string>(DEFAULT_SSH_USER);
        if (root["sshPrivateKeyFilePath"]) {
            config.ssh_private_key_path_ =
                expand_home(root["sshPrivateKeyFilePath"].as<std::string>());
        }

        if (config.timeout_secs_ <= 0)
            return Result<Config>::Err("timeoutSeconds must be positive");
        if (config.ssh_port_ <= 0 || config.ssh_port_ > 65535)
            return Result<Config>::Err("sshPort is out of range");

        if (root["portMappings"]) {
            if (!root["portMappings"].IsSequence())
                return Result<Config>::Err("portMappings must be a list");
            for (const auto& item : root["portMappings"]) {
                auto mapping = PortMapping::parse(item.as<std::string>());
                if (mapping.is_err())
                    return Result<Config>::Err("portMappings: " + mapping.error);
                config.port_mappings_.push_back(mapping.value);
            }
        }

        if (root["tunnel"] && root["tunnel"].IsMap()) {
            auto r = parse_tunnel_config(root["tunnel"], config.tunnel_);
            if (r.is_err()) return Result<Config>::Err(r.error);
        }

        if (root["provider"] && root["provider"].IsMap()) {
            auto r = parse_provider_config(root["provider"], config.provider_);
            if (r.is_err()) return Result<Config>::Err(r.error);
        }

        if (root["log"] && root["log"].IsMap()) {
            auto r = parse_log_config(root["log"], config.log_);
            if (r.is_err()) return Result<Config>::Err(r.error);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config file " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    result.value.source_path_ = path;
    return result;
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_global_config_path());
}
