#pragma once

#include <string>

// Line-start escapes for the raw shell passthrough, following ssh:
//   ~.  leave the shell
//   ~~  send one literal ~
// Any other character after ~ sends both. State carries across reads.
class ShellEscape {
public:
    // Returns the bytes to forward. Sets leave() and stops at "~.".
    std::string filter(const char* buf, int n) {
        std::string out;
        for (int i = 0; i < n && !leave_; i++) {
            char c = buf[i];
            if (tilde_pending_) {
                tilde_pending_ = false;
                if (c == '.') {
                    leave_ = true;
                    break;
                }
                if (c != '~') out += '~';
            } else if (line_start_ && c == '~') {
                tilde_pending_ = true;
                line_start_ = false;
                continue;
            }
            out += c;
            line_start_ = (c == '\r' || c == '\n');
        }
        return out;
    }

    bool leave() const { return leave_; }

private:
    bool line_start_ = true;
    bool tilde_pending_ = false;
    bool leave_ = false;
};
