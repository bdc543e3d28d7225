#pragma once

#include <string>

namespace platform {

// Terminal dimensions of stdout, 80x24 when it is not a terminal.
int term_width();
int term_height();

// $TERM, or "xterm" when unset.
std::string term_name();

bool stdin_is_terminal();

// RAII guard for raw terminal mode on stdin.
// Constructor saves the current mode and enters raw mode when stdin is a
// terminal; destructor restores the saved mode.
class RawModeGuard {
public:
    RawModeGuard();
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return impl_ != nullptr; }

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
