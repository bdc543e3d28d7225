#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Configuration structures ────────────────────────────────

enum class LogLevel { Debug, Info, Warn, Error };

struct LogConfig {
    std::string file_path;                       // empty = <tmp>/podtun.log
    LogLevel level = LogLevel::Info;
    bool console = true;                         // mirror to stderr
};

struct TunnelConfig {
    int drain_deadline_secs = 5;
    int reaper_interval_secs = 5;
};

struct GatewayConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> private_key_path;
    std::optional<std::string> password;
};

enum class ProviderKind { Direct, SshGateway };

struct ProviderConfig {
    ProviderKind kind = ProviderKind::Direct;
    std::string host_template = "{pod}.{namespace}";
    GatewayConfig gateway;
};
