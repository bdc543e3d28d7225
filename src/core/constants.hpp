#pragma once

#include <cstddef>

#define PODTUN_VERSION "0.4.0"

constexpr const char* PROJECT_NAME        = "podtun";
constexpr const char* CLI_CONFIG_NAME     = "config.yaml";

// ── Pod defaults ────────────────────────────────────────────
constexpr const char* DEFAULT_POD_NAME    = "podtun";
constexpr const char* DEFAULT_NAMESPACE   = "default";
constexpr const char* DEFAULT_SSH_USER    = "root";
constexpr int DEFAULT_SSH_PORT            = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_TIMEOUT_SECS        = 15;    // Opening a remote stream / SSH session
constexpr int DRAIN_DEADLINE_SECS         = 5;     // Supervisor wait after cancellation
constexpr int REAPER_INTERVAL_SECS        = 5;     // Completed-bridge sweep interval
constexpr int SSH_KEEPALIVE_SECS          = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t BRIDGE_BUF_SIZE     = 16384; // Per direction, per connection
constexpr std::size_t SSH_READ_BUF_SIZE   = 4096;
constexpr std::size_t SFTP_CHUNK_SIZE     = 32768; // Per SFTP read or write request

// ── Listener ────────────────────────────────────────────────
constexpr int LISTEN_BACKLOG              = 128;
