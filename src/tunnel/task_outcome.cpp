#include "task_outcome.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BindFailed:              return "bind failed";
        case ErrorKind::AcceptFailed:            return "accept failed";
        case ErrorKind::RemoteStreamUnavailable: return "remote stream unavailable";
        case ErrorKind::StreamIo:                return "stream I/O error";
        case ErrorKind::ReadinessLost:           return "readiness lost";
        case ErrorKind::SshFailed:               return "ssh failed";
        case ErrorKind::CommandFailed:           return "command failed";
        case ErrorKind::TransferFailed:          return "transfer failed";
        case ErrorKind::Config:                  return "configuration error";
        case ErrorKind::Internal:                return "internal error";
    }
    return "error";
}

std::string TaskOutcome::describe() const {
    if (success) return "success";
    return fmt::format("{}: {}", error_kind_name(error.kind), error.message);
}
