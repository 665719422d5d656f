#pragma once

#include <string>

namespace platform {

// RAII guard for raw terminal mode.
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
struct RawModeGuard {
    enum Mode {
        kFullRaw,   // cfmakeraw equivalent (for shell passthrough)
        kNoEcho,    // Canonical off, echo off (for password input)
    };

    explicit RawModeGuard(Mode mode = kFullRaw);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Read up to len bytes from stdin. Returns bytes read, 0 on EOF, -1 on error.
int read_stdin(char* buf, int len);

// Write raw bytes to stdout, bypassing iostream buffering.
void write_stdout(const std::string& data);

// Flush any pending input from stdin.
void flush_stdin();

} // namespace platform
