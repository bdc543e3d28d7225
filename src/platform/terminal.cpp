#include "terminal.hpp"
#include <cstdlib>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

std::string term_name() {
    const char* term = std::getenv("TERM");
    if (!term || !*term) return "xterm";
    return term;
}

bool stdin_is_terminal() {
    return isatty(STDIN_FILENO) == 1;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard() {
    if (!stdin_is_terminal()) return;
    struct termios old_term;
    if (tcgetattr(STDIN_FILENO, &old_term) != 0) return;

    struct termios raw = old_term;
    cfmakeraw(&raw);
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) return;
    impl_ = new Impl{old_term};
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

} // namespace platform
