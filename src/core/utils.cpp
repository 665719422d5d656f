#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdio>
#include <cerrno>
#include <cstdlib>
#include <climits>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

std::optional<int> parse_int(const std::string& s) {
    std::string t = trimmed(s);
    if (t.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size()) return std::nullopt;
    if (v < INT_MIN || v > INT_MAX) return std::nullopt;
    return static_cast<int>(v);
}

std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> args;
    std::string cur;
    bool in_quotes = false;
    bool have_token = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (have_token) {
                args.push_back(cur);
                cur.clear();
                have_token = false;
            }
        } else {
            cur += c;
            have_token = true;
        }
    }
    if (have_token) args.push_back(cur);
    return args;
}

// ── Error kind names ────────────────────────────────────────

const char* to_string(ValidationErrorKind kind) {
    switch (kind) {
    case ValidationErrorKind::MissingField:      return "MissingField";
    case ValidationErrorKind::InvalidPort:       return "InvalidPort";
    case ValidationErrorKind::InvalidTimeout:    return "InvalidTimeout";
    case ValidationErrorKind::MissingCredential: return "MissingCredential";
    case ValidationErrorKind::KeyFormat:         return "KeyFormat";
    }
    return "?";
}

const char* to_string(ConnectErrorKind kind) {
    switch (kind) {
    case ConnectErrorKind::AuthFailed:       return "AuthFailed";
    case ConnectErrorKind::Timeout:          return "Timeout";
    case ConnectErrorKind::HostUnreachable:  return "HostUnreachable";
    case ConnectErrorKind::KeyError:         return "KeyError";
    case ConnectErrorKind::ShellUnavailable: return "ShellUnavailable";
    case ConnectErrorKind::AlreadyActive:    return "AlreadyActive";
    case ConnectErrorKind::Cancelled:        return "Cancelled";
    }
    return "?";
}

const char* to_string(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::IOError:          return "IOError";
    case TransferErrorKind::RemoteNotFound:   return "RemoteNotFound";
    case TransferErrorKind::PermissionDenied: return "PermissionDenied";
    case TransferErrorKind::TransportLost:    return "TransportLost";
    }
    return "?";
}
