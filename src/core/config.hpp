#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "port_mapping.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.podtun/config.yaml; built-in defaults if it does not exist.
    static Result<Config> load();

    // Load an explicit file. A missing file is an error here.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& default_pod_name() const { return default_pod_name_; }
    const std::string& default_namespace() const { return default_namespace_; }
    int timeout_secs() const { return timeout_secs_; }
    int ssh_port() const { return ssh_port_; }
    const std::string& ssh_user() const { return ssh_user_; }
    const std::optional<std::string>& ssh_private_key_path() const { return ssh_private_key_path_; }
    const std::vector<PortMapping>& port_mappings() const { return port_mappings_; }
    const TunnelConfig& tunnel() const { return tunnel_; }
    const ProviderConfig& provider() const { return provider_; }
    const LogConfig& log() const { return log_; }
    const fs::path& source_path() const { return source_path_; }

public:
    Config();

private:
    std::string default_pod_name_;
    std::string default_namespace_;
    int timeout_secs_;
    int ssh_port_;
    std::string ssh_user_;
    std::optional<std::string> ssh_private_key_path_;
    std::vector<PortMapping> port_mappings_;
    TunnelConfig tunnel_;
    ProviderConfig provider_;
    LogConfig log_;
    fs::path source_path_;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write the commented default config to `config_path`. An existing file is left alone.
Result<void> create_default_config(const fs::path& config_path);
