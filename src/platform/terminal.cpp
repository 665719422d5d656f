#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <poll.h>

namespace platform {

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

RawModeGuard::RawModeGuard(Mode mode) : impl_(new Impl) {
    // Not a tty (piped input): nothing to switch
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    if (mode == kFullRaw) {
        cfmakeraw(&raw);
    } else {
        // kNoEcho: disable canonical mode, echo, and signals
        raw.c_lflag &= ~(ICANON | ECHO | ISIG);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
    }
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_->saved) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
    }
    delete impl_;
}

// ── stdin / stdout ───────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

int read_stdin(char* buf, int len) {
    return static_cast<int>(::read(STDIN_FILENO, buf, static_cast<size_t>(len)));
}

void write_stdout(const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(STDOUT_FILENO, data.data() + off, data.size() - off);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

void flush_stdin() {
    tcflush(STDIN_FILENO, TCIFLUSH);
}

} // namespace platform
