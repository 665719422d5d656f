#include "session_store.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

SessionStore::SessionStore(fs::path path) : path_(std::move(path)) {}

// ── Persistence ─────────────────────────────────────────────

SessionStore::SessionMap SessionStore::load_locked() const {
    SessionMap sessions;

    if (!fs::exists(path_)) {
        return sessions;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());

        if (root["sessions"] && root["sessions"].IsSequence()) {
            for (const auto& n : root["sessions"]) {
                SavedSession s;
                s.name = n["name"].as<std::string>("");
                if (s.name.empty()) continue;
                s.host = n["host"].as<std::string>("");
                s.port = n["port"].as<int>(DEFAULT_SSH_PORT);
                s.username = n["username"].as<std::string>("");
                s.key_file = n["key_file"].as<std::string>("");
                s.timeout = n["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
                s.keepalive = n["keepalive"].as<bool>(DEFAULT_KEEPALIVE);
                std::string last = n["last_connected"].as<std::string>("");
                if (!last.empty()) s.last_connected = last;
                sessions[s.name] = s;
            }
        }
    } catch (const YAML::Exception& e) {
        // Corrupted sessions file: start fresh, the next put() rewrites it
        tether_log(fmt::format("sessions: ignoring unreadable {}: {}", path_.string(), e.what()));
        return SessionMap{};
    }

    return sessions;
}

Result<void> SessionStore::save_locked(const SessionMap& sessions) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "sessions" << YAML::Value << YAML::BeginSeq;
    for (const auto& entry : sessions) {
        const SavedSession& s = entry.second;
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << s.name;
        out << YAML::Key << "host" << YAML::Value << s.host;
        out << YAML::Key << "port" << YAML::Value << s.port;
        out << YAML::Key << "username" << YAML::Value << s.username;
        out << YAML::Key << "key_file" << YAML::Value << s.key_file;
        out << YAML::Key << "timeout" << YAML::Value << s.timeout;
        out << YAML::Key << "keepalive" << YAML::Value << s.keepalive;
        if (s.last_connected) {
            out << YAML::Key << "last_connected" << YAML::Value << *s.last_connected;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream ofs(path_);
    if (!ofs) {
        return Result<void>::Err("Cannot write " + path_.string());
    }
    ofs << out.c_str() << "\n";
    if (!ofs) {
        return Result<void>::Err("Write failed on " + path_.string());
    }
    return Result<void>::Ok();
}

// ── Registry contract ───────────────────────────────────────

std::optional<SavedSession> SessionStore::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sessions = load_locked();
    auto it = sessions.find(name);
    if (it == sessions.end()) return std::nullopt;
    return it->second;
}

Result<void> SessionStore::put(const SavedSession& session) {
    if (trimmed(session.name).empty()) {
        return Result<void>::Err("Session name is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto sessions = load_locked();
    sessions[session.name] = session;
    return save_locked(sessions);
}

Result<void> SessionStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sessions = load_locked();
    if (sessions.erase(name) == 0) {
        return Result<void>::Err("No saved session named '" + name + "'");
    }
    return save_locked(sessions);
}

std::vector<SavedSession> SessionStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SavedSession> out;
    for (const auto& entry : load_locked()) {
        out.push_back(entry.second);
    }
    return out;
}
