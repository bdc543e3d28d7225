#pragma once

#include <string>
#include <functional>

enum class ErrorKind {
    BindFailed,                 // listener could not bind its local address
    AcceptFailed,               // accept loop I/O failure
    RemoteStreamUnavailable,    // provider could not open the pod stream
    StreamIo,                   // mid-transfer I/O error (not a peer reset)
    ReadinessLost,              // readiness channel closed without an address
    SshFailed,
    CommandFailed,
    TransferFailed,             // SFTP upload or download
    Config,
    Internal,                   // a task body threw
};

const char* error_kind_name(ErrorKind kind);

struct TunnelError {
    ErrorKind kind = ErrorKind::StreamIo;
    std::string message;
};

// Completion value of one supervised task: Success or Error(TunnelError).
struct TaskOutcome {
    bool success;
    TunnelError error;

    static TaskOutcome Ok() {
        return {true, {}};
    }

    static TaskOutcome Err(ErrorKind kind, const std::string& message) {
        return {false, {kind, message}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    std::string describe() const;
};

// Called exactly once by a task when it finishes.
using OutcomeHandler = std::function<void(TaskOutcome)>;
